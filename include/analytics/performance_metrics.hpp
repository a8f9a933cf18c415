/**
 * @file performance_metrics.hpp
 * @brief Summary statistics for a backtest equity curve and trade log.
 *
 * Pure post-processing: the equity history and trades are copied in at
 * construction and never mutated. Percentages are expressed in percent
 * (e.g. -25.0 for a 25% drawdown), matching the report layout.
 */

#ifndef STOCKBT_ANALYTICS_PERFORMANCE_METRICS_HPP
#define STOCKBT_ANALYTICS_PERFORMANCE_METRICS_HPP

#include "backtest/ledger.hpp"
#include "backtest/trade_logger.hpp"

#include <string>
#include <vector>

namespace stockbt
{

    // Forward declaration to avoid circular dependency
    namespace backtest
    {
        struct BacktestResult;
    }

    namespace analytics
    {

        /**
         * @struct DrawdownInfo
         * @brief Summary of the maximum drawdown event.
         *
         * Indices refer to positions in the equity history. recovery_index is
         * -1 if the prior peak is never regained by the end of the series.
         */
        struct DrawdownInfo
        {
            double depth_pct = 0.0;    ///< Maximum drawdown in percent, <= 0
            int peak_index = 0;        ///< Index of the peak before the drawdown
            int trough_index = 0;      ///< Index of the trough
            int recovery_index = -1;   ///< Index of recovery (-1 if unrecovered)
            std::string peak_date;
            std::string trough_date;
            std::string recovery_date; ///< Empty if unrecovered
        };

        /**
         * @struct TradeStatistics
         * @brief Win/loss statistics over SELL trades.
         *
         * A SELL with realized_pnl > 0 is a win, anything else a loss.
         */
        struct TradeStatistics
        {
            int round_trips = 0;              ///< Number of SELL trades
            int wins = 0;
            int losses = 0;
            double win_rate_pct = 0.0;
            double avg_win = 0.0;             ///< Mean pnl of wins
            double avg_loss = 0.0;            ///< Mean |pnl| of losses
            double profit_loss_ratio = 0.0;   ///< avg_win / avg_loss, infinity if avg_loss == 0
        };

        /**
         * @class PerformanceMetrics
         * @brief Return, drawdown and trade statistics for one backtest run.
         *
         * Usage:
         * @code
         *   analytics::PerformanceMetrics metrics(result);
         *   double dd = metrics.max_drawdown_pct();
         *   metrics.print_report();
         * @endcode
         *
         * Thread safety: Instances are immutable after construction.
         */
        class PerformanceMetrics
        {
        public:
            // ---------------------------------------------------------------
            // Constructors
            // ---------------------------------------------------------------

            /**
             * @brief Construct from a BacktestResult.
             * @throws std::invalid_argument If the result has no equity history.
             */
            explicit PerformanceMetrics(const backtest::BacktestResult &result);

            /**
             * @brief Construct from raw history.
             * @param equity_history Daily snapshots, ascending by date (non-empty).
             * @param initial_capital Starting capital (> 0).
             * @param trades Trade log; only SELL trades contribute to trade statistics.
             * @throws std::invalid_argument If the history is empty or capital is not positive.
             */
            PerformanceMetrics(const std::vector<backtest::EquitySnapshot> &equity_history,
                               double initial_capital,
                               const std::vector<backtest::TradeRecord> &trades = {});

            ~PerformanceMetrics() = default;

            // ---------------------------------------------------------------
            // Return Metrics
            // ---------------------------------------------------------------

            double initial_capital() const { return initial_capital_; }
            double final_value() const;

            /** @brief (final - initial) / initial * 100 */
            double total_return_pct() const;

            /** @brief Calendar days between first and last snapshot. */
            long long elapsed_days() const;

            /**
             * @brief Compound annual growth rate in percent.
             * @return ((final/initial)^(365/elapsed_days) - 1) * 100, or 0 if elapsed_days <= 0.
             */
            double cagr_pct() const;

            // ---------------------------------------------------------------
            // Drawdown
            // ---------------------------------------------------------------

            /** @brief Most negative (value - running_peak) / running_peak * 100. */
            double max_drawdown_pct() const;

            /** @brief Drawdown in percent at each snapshot (0 at a new peak). */
            const std::vector<double> &drawdown_series() const { return drawdown_series_; }

            const DrawdownInfo &max_drawdown_info() const { return drawdown_info_; }

            // ---------------------------------------------------------------
            // Trades
            // ---------------------------------------------------------------

            const TradeStatistics &trade_statistics() const { return trade_stats_; }
            int total_trades() const { return static_cast<int>(trades_.size()); }

            // ---------------------------------------------------------------
            // Accessors
            // ---------------------------------------------------------------

            const std::vector<backtest::EquitySnapshot> &equity_history() const { return history_; }
            const std::vector<backtest::TradeRecord> &trades() const { return trades_; }

            // ---------------------------------------------------------------
            // Export
            // ---------------------------------------------------------------

            /**
             * @brief Metrics as a JSON string. An infinite profit/loss ratio is written as "inf".
             */
            std::string to_json() const;

            /**
             * @brief Write to_json() to a file.
             * @throws std::runtime_error If the file cannot be opened.
             */
            void save_json(const std::string &filepath) const;

            /** @brief Formatted multi-line report. */
            std::string summary() const;

            /** @brief Print summary() to stdout. */
            void print_report() const;

        private:
            void initialize();
            void compute_drawdowns();
            void compute_trade_statistics();

            std::vector<backtest::EquitySnapshot> history_;
            double initial_capital_;
            std::vector<backtest::TradeRecord> trades_;

            std::vector<double> drawdown_series_;
            DrawdownInfo drawdown_info_;
            TradeStatistics trade_stats_;
        };

    } // namespace analytics
} // namespace stockbt

#endif // STOCKBT_ANALYTICS_PERFORMANCE_METRICS_HPP
