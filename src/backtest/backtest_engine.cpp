// SPDX-License-Identifier: MIT

#include "backtest/backtest_engine.hpp"
#include "data/date_utils.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <map>
#include <set>
#include <sstream>

namespace stockbt
{
    namespace backtest
    {

        namespace
        {
            std::string format_price(double value)
            {
                std::ostringstream ss;
                ss << std::fixed << std::setprecision(2) << value;
                return ss.str();
            }

            std::string format_score(double value)
            {
                std::ostringstream ss;
                ss << std::fixed << std::setprecision(1) << value;
                return ss.str();
            }

            // NaN volume ratios rank below every real value
            double rank_key(double volume_ratio)
            {
                return std::isnan(volume_ratio) ? -std::numeric_limits<double>::infinity() : volume_ratio;
            }

            std::string normalize_end(const std::string &end_date)
            {
                return end_date.empty() ? std::string() : dates::normalize(end_date);
            }

            bool in_range(const std::string &date, const std::string &start, const std::string &end)
            {
                return date >= start && (end.empty() || date <= end);
            }
        } // namespace

        // ------------------------- StrategyRules --------------------------------
        StrategyRules StrategyRules::from_json(const nlohmann::json &j)
        {
            StrategyRules r;
            if (j.is_object())
            {
                r.entry_score = j.value("entry_score", r.entry_score);
                r.portfolio_entry_score = j.value("portfolio_entry_score", r.portfolio_entry_score);
                r.exit_score = j.value("exit_score", r.exit_score);
                r.stop_loss_factor = j.value("stop_loss_factor", r.stop_loss_factor);
                r.position_fraction = j.value("position_fraction", r.position_fraction);
                r.min_entry_notional = j.value("min_entry_notional", r.min_entry_notional);
                r.min_slot_amount = j.value("min_slot_amount", r.min_slot_amount);
                r.lot_size = j.value("lot_size", r.lot_size);
            }
            return r;
        }

        void StrategyRules::validate() const
        {
            if (lot_size < 1)
            {
                throw std::invalid_argument("Expected positive value for parameter 'lot_size', got: " + std::to_string(lot_size));
            }
            if (!(position_fraction > 0.0 && position_fraction <= 1.0))
            {
                throw std::invalid_argument("Expected value in (0, 1] for parameter 'position_fraction', got: " + std::to_string(position_fraction));
            }
            if (!(stop_loss_factor > 0.0))
            {
                throw std::invalid_argument("Expected positive value for parameter 'stop_loss_factor', got: " + std::to_string(stop_loss_factor));
            }
            if (min_entry_notional < 0.0 || min_slot_amount < 0.0)
            {
                throw std::invalid_argument("Expected non-negative minimum trade amounts");
            }
        }

        // ------------------------- BacktestParams -------------------------------
        BacktestParams BacktestParams::from_config(const AppConfig &config)
        {
            BacktestParams p;
            p.initial_capital = config.backtest.initial_capital;
            p.lookback_days = config.backtest.lookback_days;
            p.min_history = config.backtest.min_history;
            p.max_positions = config.backtest.max_positions;
            p.transaction_costs = TransactionCostConfig::from_json(config.backtest.transaction_costs);
            p.strategy = StrategyRules::from_json(config.backtest.strategy);
            p.indicators = scoring::IndicatorConfig::from_json(config.backtest.indicators);
            return p;
        }

        void BacktestParams::validate() const
        {
            if (!(initial_capital > 0.0))
            {
                throw std::invalid_argument("Expected positive value for parameter 'initial_capital', got: " + std::to_string(initial_capital));
            }
            if (lookback_days < 0)
            {
                throw std::invalid_argument("Expected non-negative value for parameter 'lookback_days', got: " + std::to_string(lookback_days));
            }
            if (min_history < 1)
            {
                throw std::invalid_argument("Expected positive value for parameter 'min_history', got: " + std::to_string(min_history));
            }
            if (max_positions < 1)
            {
                throw std::invalid_argument("Expected positive value for parameter 'max_positions', got: " + std::to_string(max_positions));
            }
            strategy.validate();
        }

        // ------------------------- BacktestResult helpers -----------------------
        double BacktestResult::total_return_pct() const
        {
            if (initial_capital == 0.0)
                return 0.0;
            return (final_value - initial_capital) / initial_capital * 100.0;
        }

        analytics::PerformanceMetrics BacktestResult::compute_analytics() const
        {
            return analytics::PerformanceMetrics(*this);
        }

        void BacktestResult::print_summary() const
        {
            std::cout << "Backtest (" << mode << ") success=" << success << " message='" << message << "'\n";
            std::cout << std::fixed << std::setprecision(2)
                      << "Final value: " << final_value << " Trades: " << trade_count
                      << " Return: " << total_return_pct() << "%\n";
            if (!equity_history.empty())
            {
                compute_analytics().print_report();
            }
        }

        void BacktestResult::export_equity_to_csv(const std::string &filepath) const
        {
            std::filesystem::path path(filepath);
            if (path.has_parent_path())
            {
                std::filesystem::create_directories(path.parent_path());
            }

            std::ofstream out(filepath);
            if (!out)
                throw std::runtime_error("unable to open file for writing: " + filepath);
            out << "date,total_value,cash,holdings_value,carried_forward,cost_basis\n";
            out << std::fixed << std::setprecision(4);
            for (const auto &s : equity_history)
            {
                int carried = 0;
                int cost_basis = 0;
                for (const auto &v : s.valuations)
                {
                    if (v.source == PriceSource::CARRIED_FORWARD)
                        ++carried;
                    else if (v.source == PriceSource::COST_BASIS)
                        ++cost_basis;
                }
                out << s.date << "," << s.total_value << "," << s.cash << "," << s.holdings_value
                    << "," << carried << "," << cost_basis << "\n";
            }
        }

        void BacktestResult::export_trades_to_csv(const std::string &filepath) const
        {
            TradeLogger::write_csv(trades, filepath);
        }

        // ------------------------- BacktestEngine -------------------------------
        BacktestEngine::BacktestEngine(const BacktestParams &params,
                                       const MarketDataProvider &data_provider,
                                       const scoring::SignalProvider &signal_provider)
            : params_(params),
              data_(data_provider),
              default_signals_(),
              signals_(&signal_provider),
              calculator_(params.indicators)
        {
            params_.validate();
        }

        BacktestEngine::BacktestEngine(const BacktestParams &params,
                                       const MarketDataProvider &data_provider)
            : params_(params),
              data_(data_provider),
              default_signals_(),
              signals_(&default_signals_),
              calculator_(params.indicators)
        {
            params_.validate();
        }

        void BacktestEngine::log(BacktestResult &result, const std::string &message) const
        {
            result.logs.push_back(message);
            if (params_.verbose)
                std::cout << "[Backtest] " << message << "\n";
        }

        long long BacktestEngine::lots_for(double amount, double price) const
        {
            if (!(amount > 0.0) || !(price > 0.0))
                return 0;
            const double lots = std::floor(amount / price / static_cast<double>(params_.strategy.lot_size));
            return static_cast<long long>(lots) * params_.strategy.lot_size;
        }

        bool BacktestEngine::should_exit(const scoring::IndicatorSnapshot &snapshot, double score,
                                         std::string &reason) const
        {
            const bool stop_loss = snapshot.close < snapshot.ma20 * params_.strategy.stop_loss_factor;
            if (stop_loss)
            {
                reason = "stop loss";
                return true;
            }
            if (score < params_.strategy.exit_score)
            {
                reason = "score drop";
                return true;
            }
            return false;
        }

        std::optional<BacktestEngine::PreparedSymbol> BacktestEngine::prepare(const std::string &symbol,
                                                                              const std::string &start_date,
                                                                              BacktestResult &result) const
        {
            const std::string fetch_start = dates::add_days(start_date, -params_.lookback_days);
            log(result, "Fetching history for " + symbol + " from " + fetch_start + "...");

            std::optional<SymbolHistory> history;
            try
            {
                history = data_.get_history(symbol, fetch_start);
            }
            catch (const std::exception &e)
            {
                log(result, "Failed to fetch data for " + symbol + ": " + e.what());
                return std::nullopt;
            }

            if (!history)
            {
                log(result, "Failed to fetch data for " + symbol);
                return std::nullopt;
            }
            if (static_cast<int>(history->size()) < params_.min_history)
            {
                log(result, "Insufficient data for " + symbol + " (" + std::to_string(history->size()) +
                                " bars, need " + std::to_string(params_.min_history) + ")");
                return std::nullopt;
            }

            PreparedSymbol prepared;
            prepared.indicators = calculator_.calculate(*history);
            prepared.history = std::move(*history);
            return prepared;
        }

        void BacktestEngine::finish(BacktestResult &result, const Ledger &ledger) const
        {
            result.equity_history = ledger.history();
            result.trades = ledger.trades();
            result.trade_summary = ledger.trade_log().get_summary();
            result.trade_count = static_cast<int>(result.trades.size());
            result.final_value = result.equity_history.empty() ? ledger.initial_capital()
                                                               : result.equity_history.back().total_value;
        }

        // ------------------------- Single-symbol mode ---------------------------
        BacktestResult BacktestEngine::run(const std::string &symbol,
                                           const std::string &start_date,
                                           const std::string &end_date)
        {
            const std::string start = dates::normalize(start_date);
            const std::string end = normalize_end(end_date);
            const StrategyRules &rules = params_.strategy;

            BacktestResult result;
            result.mode = "single";
            result.start_date = start;
            result.end_date = end;
            result.initial_capital = params_.initial_capital;
            result.final_value = params_.initial_capital;

            std::optional<PreparedSymbol> prepared = prepare(symbol, start, result);
            if (!prepared)
            {
                result.message = "Insufficient data for " + symbol + ", aborting.";
                log(result, result.message);
                return result;
            }
            result.symbols.push_back(symbol);

            log(result, "Starting simulation for " + symbol + "...");
            Ledger ledger(params_.initial_capital, TransactionCostModel(params_.transaction_costs));

            int simulated_days = 0;
            for (const auto &snap : prepared->indicators.rows())
            {
                if (!in_range(snap.date, start, end))
                    continue;
                ++simulated_days;

                const scoring::ScoreResult signal = signals_->score(snap);
                const double close = snap.close;

                if (!ledger.has_position(symbol))
                {
                    if (signal.score >= rules.entry_score && close > snap.ma20)
                    {
                        const long long volume = lots_for(ledger.cash() * rules.position_fraction, close);
                        const double notional = static_cast<double>(volume) * close;
                        if (volume > 0 && notional >= rules.min_entry_notional)
                        {
                            if (ledger.buy(snap.date, symbol, close, volume, "score " + format_score(signal.score)))
                                log(result, "[" + snap.date + "] BUY " + std::to_string(volume) + " @ " +
                                                format_price(close) + " (Score: " + format_score(signal.score) + ")");
                            else
                                log(result, "[" + snap.date + "] " + ledger.last_rejection());
                        }
                    }
                }
                else
                {
                    std::string reason;
                    if (should_exit(snap, signal.score, reason))
                    {
                        if (ledger.sell(snap.date, symbol, close, 0, reason))
                            log(result, "[" + snap.date + "] SELL ALL @ " + format_price(close) + " - " + reason);
                        else
                            log(result, "[" + snap.date + "] " + ledger.last_rejection());
                    }
                }

                ledger.update_daily_stats(snap.date, market_prices({{symbol, close}}));
            }

            if (simulated_days == 0)
            {
                result.message = "No trading dates in specified range.";
                log(result, result.message);
                return result;
            }

            finish(result, ledger);
            result.success = true;
            result.message = "completed";
            log(result, "Backtest complete.");
            return result;
        }

        // ------------------------- Portfolio mode -------------------------------
        BacktestResult BacktestEngine::run_portfolio(const std::vector<std::string> &symbols,
                                                     const std::string &start_date,
                                                     const std::string &end_date)
        {
            return run_portfolio(symbols, start_date, end_date, params_.max_positions);
        }

        BacktestResult BacktestEngine::run_portfolio(const std::vector<std::string> &symbols,
                                                     const std::string &start_date,
                                                     const std::string &end_date,
                                                     int max_positions)
        {
            if (max_positions < 1)
            {
                throw std::invalid_argument("Expected positive value for parameter 'max_positions', got: " + std::to_string(max_positions));
            }

            const std::string start = dates::normalize(start_date);
            const std::string end = normalize_end(end_date);
            const StrategyRules &rules = params_.strategy;

            BacktestResult result;
            result.mode = "portfolio";
            result.start_date = start;
            result.end_date = end;
            result.initial_capital = params_.initial_capital;
            result.final_value = params_.initial_capital;

            if (symbols.empty())
            {
                result.message = "No symbols provided for portfolio backtest.";
                log(result, result.message);
                return result;
            }

            // Load and enrich everything before the loop
            std::map<std::string, PreparedSymbol> pool;
            std::vector<std::string> active;
            std::set<std::string> all_dates;

            log(result, "Pre-calculating indicators for all stocks in pool...");
            for (const auto &symbol : symbols)
            {
                if (pool.count(symbol))
                    continue;
                std::optional<PreparedSymbol> prepared = prepare(symbol, start, result);
                if (!prepared)
                {
                    log(result, "Excluding " + symbol + " from the pool");
                    continue;
                }
                for (const auto &row : prepared->indicators.rows())
                {
                    if (in_range(row.date, start, end))
                        all_dates.insert(row.date);
                }
                pool.emplace(symbol, std::move(*prepared));
                active.push_back(symbol);
            }
            result.symbols = active;

            if (all_dates.empty())
            {
                result.message = "No trading dates in specified range.";
                log(result, result.message);
                return result;
            }
            log(result, "Simulation range: " + std::to_string(all_dates.size()) + " trading days.");

            Ledger ledger(params_.initial_capital, TransactionCostModel(params_.transaction_costs));
            std::map<std::string, double> last_close;

            struct Candidate
            {
                std::string symbol;
                double score;
                double price;
                double volume_ratio;
            };

            for (const auto &date : all_dates)
            {
                // --- 1. Sell phase
                std::vector<std::string> held;
                for (const auto &entry : ledger.positions())
                    held.push_back(entry.first);

                for (const auto &symbol : held)
                {
                    const scoring::IndicatorSnapshot *snap = pool.at(symbol).indicators.find(date);
                    if (!snap)
                        continue;

                    const scoring::ScoreResult signal = signals_->score(*snap);
                    std::string reason;
                    if (should_exit(*snap, signal.score, reason))
                    {
                        if (ledger.sell(date, symbol, snap->close, 0, reason))
                            log(result, "[" + date + "] SELL " + symbol + " @ " + format_price(snap->close) + " - " + reason);
                        else
                            log(result, "[" + date + "] " + ledger.last_rejection());
                    }
                }

                // --- 2. Buy phase
                int free_slots = max_positions - static_cast<int>(ledger.num_positions());
                if (free_slots > 0)
                {
                    std::vector<Candidate> candidates;
                    for (const auto &symbol : active)
                    {
                        if (ledger.has_position(symbol))
                            continue;
                        const scoring::IndicatorSnapshot *snap = pool.at(symbol).indicators.find(date);
                        if (!snap)
                            continue;

                        const scoring::ScoreResult signal = signals_->score(*snap);
                        if (signal.score >= rules.portfolio_entry_score && snap->close > snap->ma20)
                        {
                            candidates.push_back({symbol, signal.score, snap->close, snap->volume_ratio});
                        }
                    }

                    // Score desc, then volume ratio desc; full ties keep pool order
                    std::stable_sort(candidates.begin(), candidates.end(),
                                     [](const Candidate &a, const Candidate &b)
                                     {
                                         if (a.score != b.score)
                                             return a.score > b.score;
                                         return rank_key(a.volume_ratio) > rank_key(b.volume_ratio);
                                     });

                    const size_t take = std::min(candidates.size(), static_cast<size_t>(free_slots));
                    for (size_t k = 0; k < take; ++k)
                    {
                        const Candidate &cand = candidates[k];
                        const double amount = ledger.cash() / static_cast<double>(free_slots);
                        if (amount <= rules.min_slot_amount)
                            continue;
                        const long long volume = lots_for(amount, cand.price);
                        if (volume <= 0)
                            continue;

                        if (ledger.buy(date, cand.symbol, cand.price, volume, "score " + format_score(cand.score)))
                        {
                            log(result, "[" + date + "] BUY " + cand.symbol + " " + std::to_string(volume) + " @ " +
                                            format_price(cand.price) + " (Score: " + format_score(cand.score) + ")");
                            --free_slots;
                        }
                        else
                        {
                            log(result, "[" + date + "] " + ledger.last_rejection());
                        }
                    }
                }

                // --- 3. Snapshot phase
                for (const auto &symbol : active)
                {
                    const scoring::IndicatorSnapshot *snap = pool.at(symbol).indicators.find(date);
                    if (snap)
                        last_close[symbol] = snap->close;
                }

                MarkPriceMap marks;
                for (const auto &entry : ledger.positions())
                {
                    const std::string &symbol = entry.first;
                    if (pool.at(symbol).indicators.find(date))
                    {
                        marks[symbol] = MarkPrice{last_close.at(symbol), PriceSource::MARKET};
                    }
                    else
                    {
                        auto it = last_close.find(symbol);
                        if (it != last_close.end())
                            marks[symbol] = MarkPrice{it->second, PriceSource::CARRIED_FORWARD};
                    }
                }
                ledger.update_daily_stats(date, marks);
            }

            finish(result, ledger);
            result.success = true;
            result.message = "completed";
            log(result, "Backtest complete.");
            return result;
        }

    } // namespace backtest
} // namespace stockbt
