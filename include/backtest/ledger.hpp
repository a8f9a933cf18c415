// SPDX-License-Identifier: MIT
#ifndef STOCKBT_BACKTEST_LEDGER_HPP
#define STOCKBT_BACKTEST_LEDGER_HPP

#include <string>
#include <vector>
#include <map>
#include <stdexcept>
#include "backtest/trade_logger.hpp"
#include "backtest/transaction_cost_model.hpp"

namespace stockbt {
namespace backtest {

/**
 * @enum PriceSource
 * @brief Where the price used to value a holding came from.
 */
enum class PriceSource {
    MARKET,          ///< Close of the valuation day
    CARRIED_FORWARD, ///< Last known close, symbol had no row that day
    COST_BASIS       ///< No price supplied, average cost used
};

std::string to_string(PriceSource source);

/**
 * @struct MarkPrice
 * @brief Price supplied for one symbol at valuation time.
 */
struct MarkPrice {
    double price = 0.0;
    PriceSource source = PriceSource::MARKET;
};

using MarkPriceMap = std::map<std::string, MarkPrice>;

/// Wrap plain closes as MARKET mark prices.
MarkPriceMap market_prices(const std::map<std::string, double>& closes);

/**
 * @struct Position
 * @brief An open holding of one symbol
 */
struct Position {
    std::string symbol;          ///< Asset identifier
    long long volume = 0;        ///< Shares held, always > 0 while the position exists
    double average_cost = 0.0;   ///< Volume-weighted purchase price per share

    double cost_value() const { return static_cast<double>(volume) * average_cost; }
};

/**
 * @struct PositionValuation
 * @brief Mark-to-market result for one position
 */
struct PositionValuation {
    std::string symbol;
    long long volume = 0;
    double price = 0.0;
    PriceSource source = PriceSource::MARKET;

    double market_value() const { return static_cast<double>(volume) * price; }
};

/**
 * @struct EquitySnapshot
 * @brief End-of-day account state
 */
struct EquitySnapshot {
    std::string date;                            ///< Snapshot date (YYYY-MM-DD)
    double total_value = 0.0;                    ///< cash + holdings_value
    double cash = 0.0;                           ///< Cash balance
    double holdings_value = 0.0;                 ///< Sum of position market values
    std::vector<PositionValuation> valuations;   ///< Per-symbol prices used, in symbol order
};

/**
 * @class Ledger
 * @brief Virtual brokerage account: cash, positions, trade log and equity history
 *
 * Every mutating operation is all-or-nothing: a rejected buy or sell leaves
 * cash, positions, trades and history untouched, and only updates
 * last_rejection().
 */
class Ledger {
public:
    explicit Ledger(double initial_capital,
                    const TransactionCostModel& cost_model = TransactionCostModel());

    ~Ledger() = default;

    // -- Trading

    /**
     * @brief Buy @p volume shares of @p symbol at @p price.
     * @return false (no state change) if volume <= 0, price <= 0 or cash does
     *         not cover price * volume + commission.
     */
    bool buy(const std::string& date, const std::string& symbol,
             double price, long long volume, const std::string& reason = "");

    /**
     * @brief Sell shares of a held symbol.
     *
     * A volume <= 0 or above the held volume sells the whole position.
     * @return false (no state change) if the symbol is not held, the price is
     *         not positive, or the proceeds cannot cover the fees.
     */
    bool sell(const std::string& date, const std::string& symbol,
              double price, long long volume = 0, const std::string& reason = "");

    // -- Valuation

    /**
     * @brief Value every held position.
     *
     * Symbols present in @p mark_prices use that price and its source; others
     * fall back to average cost with PriceSource::COST_BASIS.
     */
    std::vector<PositionValuation> value_holdings(const MarkPriceMap& mark_prices) const;

    double get_total_value(const MarkPriceMap& mark_prices) const;

    /**
     * @brief Mark to market and append one EquitySnapshot.
     * @return The snapshot just recorded
     */
    const EquitySnapshot& update_daily_stats(const std::string& date,
                                             const MarkPriceMap& mark_prices);

    // -- State queries
    double cash() const { return cash_; }
    double initial_capital() const { return initial_capital_; }
    const std::map<std::string, Position>& positions() const { return positions_; }
    bool has_position(const std::string& symbol) const;
    const Position& get_position(const std::string& symbol) const;
    size_t num_positions() const { return positions_.size(); }

    const std::vector<TradeRecord>& trades() const { return trade_log_.trades(); }
    const TradeLogger& trade_log() const { return trade_log_; }
    const std::vector<EquitySnapshot>& history() const { return history_; }
    const TransactionCostModel& cost_model() const { return cost_model_; }

    /// Reason the most recent buy/sell was rejected; empty after a success.
    const std::string& last_rejection() const { return last_rejection_; }

    void print_summary() const;

private:
    double initial_capital_;
    double cash_;
    TransactionCostModel cost_model_;
    std::map<std::string, Position> positions_;
    TradeLogger trade_log_;
    std::vector<EquitySnapshot> history_;
    std::string last_rejection_;

    bool reject(const std::string& reason);
};

} // namespace backtest
} // namespace stockbt

#endif // STOCKBT_BACKTEST_LEDGER_HPP
