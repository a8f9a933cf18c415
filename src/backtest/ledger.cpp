// ============================================================================
// Implementation of Ledger
// ============================================================================

#include "backtest/ledger.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace stockbt {
namespace backtest {

// ============================================================================
// Price helpers
// ============================================================================

std::string to_string(PriceSource source) {
    switch (source) {
        case PriceSource::MARKET: return "market";
        case PriceSource::CARRIED_FORWARD: return "carried_forward";
        case PriceSource::COST_BASIS: return "cost_basis";
    }
    return "market";
}

MarkPriceMap market_prices(const std::map<std::string, double>& closes) {
    MarkPriceMap out;
    for (const auto& [symbol, close] : closes) {
        out[symbol] = MarkPrice{close, PriceSource::MARKET};
    }
    return out;
}

// ============================================================================
// Ledger - lifecycle
// ============================================================================

Ledger::Ledger(double initial_capital, const TransactionCostModel& cost_model)
    : initial_capital_(initial_capital), cash_(initial_capital), cost_model_(cost_model) {
    if (!(initial_capital > 0.0) || !std::isfinite(initial_capital)) {
        std::ostringstream ss; ss << initial_capital;
        throw std::invalid_argument("Expected positive value for parameter 'initial_capital', got: " + ss.str());
    }
}

bool Ledger::reject(const std::string& reason) {
    last_rejection_ = reason;
    return false;
}

// ============================================================================
// Ledger - trading
// ============================================================================

bool Ledger::buy(const std::string& date, const std::string& symbol,
                 double price, long long volume, const std::string& reason) {
    std::ostringstream msg;
    if (volume <= 0) {
        msg << "BUY " << symbol << " rejected: volume must be positive, got " << volume;
        return reject(msg.str());
    }
    if (!(price > 0.0) || !std::isfinite(price)) {
        msg << "BUY " << symbol << " rejected: price must be positive, got " << price;
        return reject(msg.str());
    }

    const double amount = price * static_cast<double>(volume);
    const TradeCost fees = cost_model_.buy_cost(amount);
    const double total_cost = amount + fees.total();

    if (cash_ < total_cost) {
        msg << std::fixed << std::setprecision(2)
            << "BUY " << symbol << " rejected: insufficient cash (need " << total_cost
            << ", have " << cash_ << ")";
        return reject(msg.str());
    }

    cash_ -= total_cost;

    auto it = positions_.find(symbol);
    if (it == positions_.end()) {
        Position pos;
        pos.symbol = symbol;
        pos.volume = volume;
        pos.average_cost = price;
        positions_.emplace(symbol, pos);
    } else {
        Position& pos = it->second;
        const long long new_volume = pos.volume + volume;
        pos.average_cost = (static_cast<double>(pos.volume) * pos.average_cost + amount)
                           / static_cast<double>(new_volume);
        pos.volume = new_volume;
    }

    TradeRecord record;
    record.date = date;
    record.action = TradeAction::BUY;
    record.symbol = symbol;
    record.price = price;
    record.volume = volume;
    record.fee = fees.total();
    record.amount = amount;
    record.reason = reason;
    trade_log_.log_trade(record);

    last_rejection_.clear();
    return true;
}

bool Ledger::sell(const std::string& date, const std::string& symbol,
                  double price, long long volume, const std::string& reason) {
    std::ostringstream msg;
    auto it = positions_.find(symbol);
    if (it == positions_.end()) {
        msg << "SELL " << symbol << " rejected: no open position";
        return reject(msg.str());
    }
    if (!(price > 0.0) || !std::isfinite(price)) {
        msg << "SELL " << symbol << " rejected: price must be positive, got " << price;
        return reject(msg.str());
    }

    Position& pos = it->second;
    if (volume <= 0 || volume > pos.volume) {
        volume = pos.volume;
    }

    const double amount = price * static_cast<double>(volume);
    const TradeCost fees = cost_model_.sell_cost(amount);
    const double net_income = amount - fees.total();

    // Only reachable when the minimum commission exceeds a tiny sale
    if (cash_ + net_income < 0.0) {
        msg << std::fixed << std::setprecision(2)
            << "SELL " << symbol << " rejected: fees " << fees.total()
            << " exceed proceeds plus cash";
        return reject(msg.str());
    }

    const double realized_pnl = (price - pos.average_cost) * static_cast<double>(volume);

    cash_ += net_income;
    pos.volume -= volume;
    if (pos.volume == 0) {
        positions_.erase(it);
    }

    TradeRecord record;
    record.date = date;
    record.action = TradeAction::SELL;
    record.symbol = symbol;
    record.price = price;
    record.volume = volume;
    record.fee = fees.total();
    record.amount = amount;
    record.realized_pnl = realized_pnl;
    record.reason = reason;
    trade_log_.log_trade(record);

    last_rejection_.clear();
    return true;
}

// ============================================================================
// Ledger - valuation
// ============================================================================

std::vector<PositionValuation> Ledger::value_holdings(const MarkPriceMap& mark_prices) const {
    std::vector<PositionValuation> out;
    out.reserve(positions_.size());
    for (const auto& [symbol, pos] : positions_) {
        PositionValuation v;
        v.symbol = symbol;
        v.volume = pos.volume;
        auto mp = mark_prices.find(symbol);
        if (mp != mark_prices.end()) {
            v.price = mp->second.price;
            v.source = mp->second.source;
        } else {
            v.price = pos.average_cost;
            v.source = PriceSource::COST_BASIS;
        }
        out.push_back(v);
    }
    return out;
}

double Ledger::get_total_value(const MarkPriceMap& mark_prices) const {
    double holdings = 0.0;
    for (const auto& v : value_holdings(mark_prices)) {
        holdings += v.market_value();
    }
    return cash_ + holdings;
}

const EquitySnapshot& Ledger::update_daily_stats(const std::string& date,
                                                 const MarkPriceMap& mark_prices) {
    EquitySnapshot s;
    s.date = date;
    s.cash = cash_;
    s.valuations = value_holdings(mark_prices);
    for (const auto& v : s.valuations) {
        s.holdings_value += v.market_value();
    }
    s.total_value = s.cash + s.holdings_value;
    history_.push_back(s);
    return history_.back();
}

// ============================================================================
// Ledger - queries
// ============================================================================

bool Ledger::has_position(const std::string& symbol) const {
    return positions_.find(symbol) != positions_.end();
}

const Position& Ledger::get_position(const std::string& symbol) const {
    auto it = positions_.find(symbol);
    if (it == positions_.end()) throw std::invalid_argument("no open position for symbol: " + symbol);
    return it->second;
}

void Ledger::print_summary() const {
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Cash: " << cash_ << " Positions: " << positions_.size();
    if (!history_.empty()) {
        std::cout << " Last value (" << history_.back().date << "): " << history_.back().total_value;
    }
    std::cout << "\n";
    for (const auto& [symbol, pos] : positions_) {
        std::cout << "  " << symbol << " " << pos.volume << " @ " << pos.average_cost << "\n";
    }
}

} // namespace backtest
} // namespace stockbt
