/**
 * @file performance_metrics.cpp
 * @brief Implementation of the PerformanceMetrics class.
 *
 * Drawdowns and trade statistics are computed once at construction; the
 * accessors only read cached values.
 */

#include "analytics/performance_metrics.hpp"
#include "backtest/backtest_result.hpp"
#include "data/date_utils.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace stockbt
{
    namespace analytics
    {

        // ===================================================================
        // Constructors
        // ===================================================================

        PerformanceMetrics::PerformanceMetrics(const backtest::BacktestResult &result)
            : history_(result.equity_history),
              initial_capital_(result.initial_capital),
              trades_(result.trades)
        {
            initialize();
        }

        PerformanceMetrics::PerformanceMetrics(const std::vector<backtest::EquitySnapshot> &equity_history,
                                               double initial_capital,
                                               const std::vector<backtest::TradeRecord> &trades)
            : history_(equity_history),
              initial_capital_(initial_capital),
              trades_(trades)
        {
            initialize();
        }

        // ===================================================================
        // Return Metrics
        // ===================================================================

        double PerformanceMetrics::final_value() const
        {
            return history_.back().total_value;
        }

        double PerformanceMetrics::total_return_pct() const
        {
            return (final_value() - initial_capital_) / initial_capital_ * 100.0;
        }

        long long PerformanceMetrics::elapsed_days() const
        {
            return dates::days_between(history_.front().date, history_.back().date);
        }

        double PerformanceMetrics::cagr_pct() const
        {
            const long long days = elapsed_days();
            if (days <= 0)
            {
                return 0.0;
            }
            const double growth = final_value() / initial_capital_;
            return (std::pow(growth, 365.0 / static_cast<double>(days)) - 1.0) * 100.0;
        }

        double PerformanceMetrics::max_drawdown_pct() const
        {
            return drawdown_info_.depth_pct;
        }

        // ===================================================================
        // Export
        // ===================================================================

        std::string PerformanceMetrics::to_json() const
        {
            nlohmann::json j;

            j["initial_capital"] = initial_capital_;
            j["final_value"] = final_value();
            j["total_return_pct"] = total_return_pct();
            j["cagr_pct"] = cagr_pct();
            j["max_drawdown_pct"] = max_drawdown_pct();
            j["elapsed_days"] = elapsed_days();
            j["start_date"] = history_.front().date;
            j["end_date"] = history_.back().date;

            const DrawdownInfo &dd = drawdown_info_;
            j["max_drawdown_detail"]["peak_date"] = dd.peak_date;
            j["max_drawdown_detail"]["trough_date"] = dd.trough_date;
            j["max_drawdown_detail"]["recovery_date"] = dd.recovery_date;
            j["max_drawdown_detail"]["peak_index"] = dd.peak_index;
            j["max_drawdown_detail"]["trough_index"] = dd.trough_index;
            j["max_drawdown_detail"]["recovery_index"] = dd.recovery_index;

            const TradeStatistics &ts = trade_stats_;
            j["trades"]["total_trades"] = total_trades();
            j["trades"]["round_trips"] = ts.round_trips;
            j["trades"]["wins"] = ts.wins;
            j["trades"]["losses"] = ts.losses;
            j["trades"]["win_rate_pct"] = ts.win_rate_pct;
            j["trades"]["avg_win"] = ts.avg_win;
            j["trades"]["avg_loss"] = ts.avg_loss;
            if (std::isinf(ts.profit_loss_ratio))
            {
                j["trades"]["profit_loss_ratio"] = "inf";
            }
            else
            {
                j["trades"]["profit_loss_ratio"] = ts.profit_loss_ratio;
            }

            return j.dump(2);
        }

        void PerformanceMetrics::save_json(const std::string &filepath) const
        {
            std::ofstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Cannot open file for writing: " + filepath);
            }
            file << to_json() << "\n";
        }

        std::string PerformanceMetrics::summary() const
        {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(2);

            oss << "========================================\n";
            oss << "BACKTEST PERFORMANCE REPORT\n";
            oss << "========================================\n";
            oss << "Period:             " << history_.front().date << " to " << history_.back().date
                << " (" << history_.size() << " days)\n";
            oss << "Initial Capital:    " << initial_capital_ << "\n";
            oss << "Final Value:        " << final_value() << "\n";
            oss << "Total Return:       " << total_return_pct() << "%\n";
            oss << "CAGR (Annualized):  " << cagr_pct() << "%\n";
            oss << "Max Drawdown:       " << max_drawdown_pct() << "%\n";
            if (drawdown_info_.depth_pct < 0.0)
            {
                oss << "  Peak -> Trough:   " << drawdown_info_.peak_date << " -> " << drawdown_info_.trough_date << "\n";
                oss << "  Recovered:        "
                    << (drawdown_info_.recovery_index >= 0 ? drawdown_info_.recovery_date : "Unrecovered") << "\n";
            }
            oss << "----------------------------------------\n";

            const TradeStatistics &ts = trade_stats_;
            if (ts.round_trips > 0)
            {
                oss << "Total Trades:       " << ts.round_trips << " (Round trips)\n";
                oss << std::setprecision(1);
                oss << "Win Rate:           " << ts.win_rate_pct << "%\n";
                oss << std::setprecision(2);
                oss << "Profit/Loss Ratio:  ";
                if (std::isinf(ts.profit_loss_ratio))
                    oss << "inf\n";
                else
                    oss << ts.profit_loss_ratio << "\n";
            }
            else
            {
                oss << "No completed trades.\n";
            }
            oss << "========================================\n";

            return oss.str();
        }

        void PerformanceMetrics::print_report() const
        {
            std::cout << summary();
        }

        // ===================================================================
        // Private Helpers
        // ===================================================================

        void PerformanceMetrics::initialize()
        {
            if (history_.empty())
            {
                throw std::invalid_argument("Equity history cannot be empty");
            }
            if (!(initial_capital_ > 0.0))
            {
                std::ostringstream ss;
                ss << initial_capital_;
                throw std::invalid_argument("Expected positive value for parameter 'initial_capital', got: " + ss.str());
            }

            compute_drawdowns();
            compute_trade_statistics();
        }

        void PerformanceMetrics::compute_drawdowns()
        {
            const int n = static_cast<int>(history_.size());
            drawdown_series_.assign(static_cast<size_t>(n), 0.0);

            double peak = history_[0].total_value;
            double max_dd = 0.0;
            int peak_idx = 0;
            int best_peak_idx = 0;
            int best_trough_idx = 0;

            for (int i = 0; i < n; ++i)
            {
                const double value = history_[static_cast<size_t>(i)].total_value;
                if (value > peak)
                {
                    peak = value;
                    peak_idx = i;
                }
                const double dd = peak > 0.0 ? (value - peak) / peak * 100.0 : 0.0; // Non-positive
                drawdown_series_[static_cast<size_t>(i)] = dd;

                if (dd < max_dd)
                {
                    max_dd = dd;
                    best_peak_idx = peak_idx;
                    best_trough_idx = i;
                }
            }

            // Find recovery point after the worst trough
            int recovery_idx = -1;
            if (max_dd < 0.0)
            {
                const double peak_value = history_[static_cast<size_t>(best_peak_idx)].total_value;
                for (int i = best_trough_idx + 1; i < n; ++i)
                {
                    if (history_[static_cast<size_t>(i)].total_value >= peak_value)
                    {
                        recovery_idx = i;
                        break;
                    }
                }
            }

            drawdown_info_.depth_pct = max_dd;
            drawdown_info_.peak_index = best_peak_idx;
            drawdown_info_.trough_index = best_trough_idx;
            drawdown_info_.recovery_index = recovery_idx;
            drawdown_info_.peak_date = history_[static_cast<size_t>(best_peak_idx)].date;
            drawdown_info_.trough_date = history_[static_cast<size_t>(best_trough_idx)].date;
            drawdown_info_.recovery_date = recovery_idx >= 0 ? history_[static_cast<size_t>(recovery_idx)].date : "";
        }

        void PerformanceMetrics::compute_trade_statistics()
        {
            TradeStatistics ts;
            double total_profit = 0.0;
            double total_loss = 0.0;

            for (const auto &t : trades_)
            {
                if (t.action != backtest::TradeAction::SELL)
                    continue;
                const double pnl = t.realized_pnl.value_or(0.0);
                ++ts.round_trips;
                if (pnl > 0.0)
                {
                    ++ts.wins;
                    total_profit += pnl;
                }
                else
                {
                    ++ts.losses;
                    total_loss += pnl;
                }
            }

            if (ts.round_trips > 0)
            {
                ts.win_rate_pct = static_cast<double>(ts.wins) / ts.round_trips * 100.0;
            }
            ts.avg_win = ts.wins > 0 ? total_profit / ts.wins : 0.0;
            ts.avg_loss = ts.losses > 0 ? std::abs(total_loss / ts.losses) : 0.0;
            ts.profit_loss_ratio = ts.avg_loss > 0.0 ? ts.avg_win / ts.avg_loss
                                                     : std::numeric_limits<double>::infinity();

            trade_stats_ = ts;
        }

    } // namespace analytics
} // namespace stockbt
