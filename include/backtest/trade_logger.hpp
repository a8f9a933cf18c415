#pragma once

#include <optional>
#include <string>
#include <vector>

namespace stockbt {
namespace backtest {

enum class TradeAction { BUY, SELL };

std::string to_string(TradeAction action);

struct TradeRecord {
    int trade_id = 0;
    std::string date;
    TradeAction action = TradeAction::BUY;
    std::string symbol;
    double price = 0.0;
    long long volume = 0;
    double fee = 0.0;                      // commission, plus stamp duty on sells
    double amount = 0.0;                   // price * volume, before fees
    std::optional<double> realized_pnl;    // SELL only: (price - average_cost) * volume
    std::string reason;
};

struct TradeSummary {
    int total_trades = 0;
    int buy_trades = 0;
    int sell_trades = 0;
    double total_amount = 0.0;
    double total_fees = 0.0;
    double avg_fee_per_trade = 0.0;
    double realized_pnl = 0.0;
};

class TradeLogger {
public:
    TradeLogger() = default;
    ~TradeLogger() = default;

    // Appends a copy of @p record with the next trade id; returns the stored record.
    const TradeRecord& log_trade(const TradeRecord& record);

    const std::vector<TradeRecord>& trades() const { return trades_; }
    std::vector<TradeRecord> trades_for_date(const std::string& date) const;
    std::vector<TradeRecord> trades_for_symbol(const std::string& symbol) const;
    std::vector<TradeRecord> sell_trades() const;
    TradeSummary get_summary() const;
    int num_trades() const { return static_cast<int>(trades_.size()); }

    void export_to_csv(const std::string& filepath) const;
    static void write_csv(const std::vector<TradeRecord>& trades, const std::string& filepath);
    void print_summary() const;

    void clear() { trades_.clear(); next_trade_id_ = 0; }

private:
    std::vector<TradeRecord> trades_;
    int next_trade_id_ = 0;
};

} // namespace backtest
} // namespace stockbt
