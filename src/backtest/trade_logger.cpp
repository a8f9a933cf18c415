/**
 * @file trade_logger.cpp
 * @brief Implementation of TradeLogger
 */

#include "backtest/trade_logger.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>

namespace stockbt {
namespace backtest {

std::string to_string(TradeAction action)
{
    return action == TradeAction::BUY ? "BUY" : "SELL";
}

const TradeRecord &TradeLogger::log_trade(const TradeRecord &record)
{
    TradeRecord r = record;
    r.trade_id = next_trade_id_++;
    trades_.push_back(r);
    return trades_.back();
}

std::vector<TradeRecord> TradeLogger::trades_for_date(const std::string &date) const
{
    std::vector<TradeRecord> out;
    for (const auto &t : trades_)
    {
        if (t.date == date)
            out.push_back(t);
    }
    return out;
}

std::vector<TradeRecord> TradeLogger::trades_for_symbol(const std::string &symbol) const
{
    std::vector<TradeRecord> out;
    for (const auto &t : trades_)
    {
        if (t.symbol == symbol)
            out.push_back(t);
    }
    return out;
}

std::vector<TradeRecord> TradeLogger::sell_trades() const
{
    std::vector<TradeRecord> out;
    std::copy_if(trades_.begin(), trades_.end(), std::back_inserter(out),
                 [](const TradeRecord &t)
                 { return t.action == TradeAction::SELL; });
    return out;
}

TradeSummary TradeLogger::get_summary() const
{
    TradeSummary s;
    s.total_trades = static_cast<int>(trades_.size());

    for (const auto &t : trades_)
    {
        if (t.action == TradeAction::BUY)
            ++s.buy_trades;
        else
            ++s.sell_trades;

        s.total_amount += t.amount;
        s.total_fees += t.fee;
        if (t.realized_pnl)
            s.realized_pnl += *t.realized_pnl;
    }

    if (s.total_trades > 0)
        s.avg_fee_per_trade = s.total_fees / s.total_trades;

    return s;
}

void TradeLogger::export_to_csv(const std::string &filepath) const
{
    write_csv(trades_, filepath);
}

void TradeLogger::write_csv(const std::vector<TradeRecord> &trades, const std::string &filepath)
{
    std::filesystem::path path(filepath);
    if (path.has_parent_path())
    {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream file(filepath);
    if (!file.is_open())
    {
        throw std::runtime_error("Could not open file for writing: " + filepath);
    }

    file << "trade_id,date,action,symbol,price,volume,fee,amount,realized_pnl,reason\n";
    file << std::fixed << std::setprecision(4);

    for (const auto &t : trades)
    {
        file << t.trade_id << ","
             << t.date << ","
             << to_string(t.action) << ","
             << t.symbol << ","
             << t.price << ","
             << t.volume << ","
             << t.fee << ","
             << t.amount << ",";
        if (t.realized_pnl)
            file << *t.realized_pnl;
        file << "," << t.reason << "\n";
    }

    file.close();
}

void TradeLogger::print_summary() const
{
    auto s = get_summary();
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "\n=== Trade Log Summary ===\n";
    std::cout << "Total trades: " << s.total_trades << "\n";
    std::cout << "Buys: " << s.buy_trades << "  Sells: " << s.sell_trades << "\n";
    std::cout << "Total amount: " << s.total_amount << "\n";
    std::cout << "Total fees: " << s.total_fees << "\n";
    std::cout << "Average fee/trade: " << s.avg_fee_per_trade << "\n";
    std::cout << "Realized P&L: " << s.realized_pnl << "\n";
    std::cout << "==========================\n";
}

} // namespace backtest
} // namespace stockbt
