// SPDX-License-Identifier: MIT
#pragma once

#include <optional>
#include <string>
#include <vector>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "data/market_data.hpp"
#include "data/market_data_provider.hpp"
#include "data/data_loader.hpp"
#include "backtest/ledger.hpp"
#include "backtest/trade_logger.hpp"
#include "backtest/transaction_cost_model.hpp"
#include "scoring/indicator_calculator.hpp"
#include "scoring/signal_provider.hpp"
#include "scoring/composite_signal_provider.hpp"
#include "analytics/performance_metrics.hpp"

namespace stockbt
{
    namespace backtest
    {

        /**
         * @struct BacktestResult
         * @brief Container for backtest output data.
         *
         * Holds the equity history, trade records and log lines produced by a
         * run. An unsuccessful result (insufficient data, empty date range)
         * has no history and final_value == initial_capital.
         */
        struct BacktestResult
        {
            bool success = false;
            std::string message;

            std::string mode;                    ///< "single" or "portfolio"
            std::vector<std::string> symbols;    ///< Symbols that took part in the run
            std::string start_date;
            std::string end_date;

            double initial_capital = 0.0;
            double final_value = 0.0;
            int trade_count = 0;

            std::vector<EquitySnapshot> equity_history;
            std::vector<TradeRecord> trades;
            TradeSummary trade_summary;
            std::vector<std::string> logs;

            // -------------------------------------------------------------------
            // Inline metrics (lightweight, no analytics dependency)
            // -------------------------------------------------------------------

            double total_return_pct() const;

            // -------------------------------------------------------------------
            // Analytics integration
            // -------------------------------------------------------------------

            /**
             * @brief Construct a PerformanceMetrics object from this result.
             * @throws std::invalid_argument If the result has no equity history.
             */
            analytics::PerformanceMetrics compute_analytics() const;

            // -------------------------------------------------------------------
            // Export
            // -------------------------------------------------------------------

            /**
             * @brief Print a short summary to stdout, followed by the full
             *        analytics report when there is any history.
             */
            void print_summary() const;

            /**
             * @brief Export the equity history to CSV.
             *
             * Columns: date, total_value, cash, holdings_value, carried_forward,
             * cost_basis (the last two count positions not valued at that day's close).
             * @throws std::runtime_error If the file cannot be opened.
             */
            void export_equity_to_csv(const std::string &filepath) const;

            /**
             * @brief Export the trade log to CSV (same layout as TradeLogger).
             */
            void export_trades_to_csv(const std::string &filepath) const;
        };

        /**
         * @struct StrategyRules
         * @brief Entry, exit and sizing thresholds of the decision policy.
         */
        struct StrategyRules
        {
            double entry_score = 75.0;            ///< Single mode: buy at score >= this
            double portfolio_entry_score = 80.0;  ///< Portfolio mode: candidate at score >= this
            double exit_score = 45.0;             ///< Sell when score < this
            double stop_loss_factor = 0.95;       ///< Sell when close < MA20 * factor
            double position_fraction = 0.95;      ///< Share of cash invested on a single-mode entry
            double min_entry_notional = 2000.0;   ///< Single mode: skip entries below this notional
            double min_slot_amount = 5000.0;      ///< Portfolio mode: skip slots with amount <= this
            long long lot_size = 100;             ///< Shares per lot

            static StrategyRules from_json(const nlohmann::json &j);
            void validate() const;
        };

        struct BacktestParams
        {
            double initial_capital = 100000.0;
            int lookback_days = 150;   ///< Calendar days of warm-up history before start_date
            int min_history = 60;      ///< Bars required for a symbol to be tested
            int max_positions = 3;     ///< Portfolio mode slot cap
            TransactionCostConfig transaction_costs;
            StrategyRules strategy;
            scoring::IndicatorConfig indicators;
            bool verbose = false;

            static BacktestParams from_config(const AppConfig &config);
            void validate() const;
        };

        /**
         * @class BacktestEngine
         * @brief Replays daily bars through the decision policy
         *
         * Histories are fetched and enriched with indicators before the loop
         * starts; the loop itself does no I/O. Each run() / run_portfolio()
         * call owns a fresh Ledger, so one engine can run many backtests.
         *
         * The data provider and signal provider are held by reference and must
         * outlive the engine.
         */
        class BacktestEngine
        {
        public:
            BacktestEngine(const BacktestParams &params,
                           const MarketDataProvider &data_provider,
                           const scoring::SignalProvider &signal_provider);

            /// Uses the built-in CompositeSignalProvider.
            BacktestEngine(const BacktestParams &params,
                           const MarketDataProvider &data_provider);

            ~BacktestEngine() = default;

            BacktestEngine(const BacktestEngine &) = delete;
            BacktestEngine &operator=(const BacktestEngine &) = delete;

            /**
             * @brief Single-symbol backtest over [start_date, end_date].
             * @param end_date Last simulated date; empty means through the last bar
             * @throws std::invalid_argument If a date is malformed
             */
            BacktestResult run(const std::string &symbol,
                               const std::string &start_date,
                               const std::string &end_date);

            /**
             * @brief Multi-symbol backtest with at most @p max_positions holdings.
             * @throws std::invalid_argument If max_positions < 1 or a date is malformed
             */
            BacktestResult run_portfolio(const std::vector<std::string> &symbols,
                                         const std::string &start_date,
                                         const std::string &end_date,
                                         int max_positions);

            /// Uses params().max_positions.
            BacktestResult run_portfolio(const std::vector<std::string> &symbols,
                                         const std::string &start_date,
                                         const std::string &end_date);

            const BacktestParams &params() const { return params_; }
            const scoring::SignalProvider &signal_provider() const { return *signals_; }

        private:
            struct PreparedSymbol
            {
                SymbolHistory history;
                scoring::IndicatorSeries indicators;
            };

            BacktestParams params_;
            const MarketDataProvider &data_;
            scoring::CompositeSignalProvider default_signals_;
            const scoring::SignalProvider *signals_;
            scoring::IndicatorCalculator calculator_;

            std::optional<PreparedSymbol> prepare(const std::string &symbol,
                                                  const std::string &start_date,
                                                  BacktestResult &result) const;

            /**
             * @brief Exit rule shared by both modes.
             * @param reason Set to "stop loss" or "score drop" when true
             */
            bool should_exit(const scoring::IndicatorSnapshot &snapshot, double score,
                             std::string &reason) const;

            long long lots_for(double amount, double price) const;

            void log(BacktestResult &result, const std::string &message) const;
            void finish(BacktestResult &result, const Ledger &ledger) const;
        };

    } // namespace backtest
} // namespace stockbt
