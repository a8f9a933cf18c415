/**
 * @file test_performance_metrics.cpp
 * @brief Unit tests for PerformanceMetrics
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "analytics/performance_metrics.hpp"
#include "backtest/backtest_result.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>

using namespace stockbt;
using namespace stockbt::analytics;
using Catch::Matchers::WithinAbs;

namespace {

std::vector<backtest::EquitySnapshot> make_history(const std::vector<std::string>& dates,
                                                   const std::vector<double>& values) {
    std::vector<backtest::EquitySnapshot> out;
    for (size_t i = 0; i < values.size(); ++i) {
        backtest::EquitySnapshot s;
        s.date = dates[i];
        s.total_value = values[i];
        s.cash = values[i];
        out.push_back(s);
    }
    return out;
}

backtest::TradeRecord make_sell(double pnl) {
    backtest::TradeRecord t;
    t.action = backtest::TradeAction::SELL;
    t.realized_pnl = pnl;
    return t;
}

} // namespace

TEST_CASE("Return metrics", "[PerformanceMetrics]") {
    auto history = make_history({"2024-01-01", "2024-07-01", "2025-01-01"},
                                {100000.0, 105000.0, 121000.0});
    PerformanceMetrics m(history, 100000.0);

    REQUIRE_THAT(m.final_value(), WithinAbs(121000.0, 1e-9));
    REQUIRE_THAT(m.total_return_pct(), WithinAbs(21.0, 1e-9));
    REQUIRE(m.elapsed_days() == 366);
    REQUIRE_THAT(m.cagr_pct(), WithinAbs((std::pow(1.21, 365.0 / 366.0) - 1.0) * 100.0, 1e-9));

    SECTION("CAGR is zero without elapsed time") {
        PerformanceMetrics single(make_history({"2024-01-01"}, {110000.0}), 100000.0);
        REQUIRE(single.elapsed_days() == 0);
        REQUIRE(single.cagr_pct() == 0.0);
        REQUIRE_THAT(single.total_return_pct(), WithinAbs(10.0, 1e-9));
    }
}

TEST_CASE("Maximum drawdown", "[PerformanceMetrics]") {
    auto history = make_history(
        {"2024-01-01", "2024-01-02", "2024-01-03", "2024-01-04", "2024-01-05", "2024-01-08"},
        {100.0, 120.0, 90.0, 100.0, 130.0, 125.0});
    PerformanceMetrics m(history, 100.0);

    // peak 120 -> trough 90
    REQUIRE_THAT(m.max_drawdown_pct(), WithinAbs(-25.0, 1e-9));

    const DrawdownInfo& dd = m.max_drawdown_info();
    REQUIRE(dd.peak_index == 1);
    REQUIRE(dd.trough_index == 2);
    REQUIRE(dd.recovery_index == 4);
    REQUIRE(dd.peak_date == "2024-01-02");
    REQUIRE(dd.trough_date == "2024-01-03");
    REQUIRE(dd.recovery_date == "2024-01-05");

    const auto& series = m.drawdown_series();
    REQUIRE(series.size() == 6);
    REQUIRE_THAT(series[0], WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(series[3], WithinAbs((100.0 - 120.0) / 120.0 * 100.0, 1e-9));
    for (double d : series) REQUIRE(d <= 0.0);

    SECTION("Monotone curve has no drawdown") {
        PerformanceMetrics up(make_history({"2024-01-01", "2024-01-02"}, {100.0, 101.0}), 100.0);
        REQUIRE(up.max_drawdown_pct() == 0.0);
        REQUIRE(up.max_drawdown_info().recovery_index == -1);
    }

    SECTION("Unrecovered drawdown") {
        PerformanceMetrics down(make_history({"2024-01-01", "2024-01-02"}, {100.0, 80.0}), 100.0);
        REQUIRE_THAT(down.max_drawdown_pct(), WithinAbs(-20.0, 1e-9));
        REQUIRE(down.max_drawdown_info().recovery_index == -1);
        REQUIRE(down.max_drawdown_info().recovery_date.empty());
        REQUIRE(down.summary().find("Unrecovered") != std::string::npos);
    }
}

TEST_CASE("Trade statistics", "[PerformanceMetrics]") {
    auto history = make_history({"2024-01-01", "2024-01-02"}, {100000.0, 101000.0});

    SECTION("Wins and losses") {
        backtest::TradeRecord buy;
        buy.action = backtest::TradeAction::BUY;
        std::vector<backtest::TradeRecord> trades = {buy, make_sell(300.0), make_sell(100.0),
                                                     make_sell(-100.0), make_sell(0.0)};
        PerformanceMetrics m(history, 100000.0, trades);
        const TradeStatistics& ts = m.trade_statistics();

        REQUIRE(m.total_trades() == 5);
        REQUIRE(ts.round_trips == 4);
        REQUIRE(ts.wins == 2);
        // a break-even sell counts as a loss
        REQUIRE(ts.losses == 2);
        REQUIRE_THAT(ts.win_rate_pct, WithinAbs(50.0, 1e-9));
        REQUIRE_THAT(ts.avg_win, WithinAbs(200.0, 1e-9));
        REQUIRE_THAT(ts.avg_loss, WithinAbs(50.0, 1e-9));
        REQUIRE_THAT(ts.profit_loss_ratio, WithinAbs(4.0, 1e-9));
    }

    SECTION("No losses gives an infinite ratio") {
        PerformanceMetrics m(history, 100000.0, {make_sell(500.0)});
        REQUIRE(std::isinf(m.trade_statistics().profit_loss_ratio));

        auto j = nlohmann::json::parse(m.to_json());
        REQUIRE(j["trades"]["profit_loss_ratio"] == "inf");
        REQUIRE(j["trades"]["wins"] == 1);
        REQUIRE(m.summary().find("Profit/Loss Ratio:  inf") != std::string::npos);
    }

    SECTION("No trades") {
        PerformanceMetrics m(history, 100000.0);
        REQUIRE(m.trade_statistics().round_trips == 0);
        REQUIRE(m.summary().find("No completed trades.") != std::string::npos);
    }
}

TEST_CASE("PerformanceMetrics export and errors", "[PerformanceMetrics]") {
    SECTION("JSON file") {
        auto history = make_history({"2024-01-01", "2024-01-02"}, {100000.0, 90000.0});
        PerformanceMetrics m(history, 100000.0, {make_sell(-10000.0)});

        const auto path = (std::filesystem::temp_directory_path() / "stockbt_metrics.json").string();
        m.save_json(path);
        std::ifstream in(path);
        nlohmann::json j;
        in >> j;
        REQUIRE_THAT(j["final_value"].get<double>(), WithinAbs(90000.0, 1e-9));
        REQUIRE_THAT(j["max_drawdown_pct"].get<double>(), WithinAbs(-10.0, 1e-9));
        REQUIRE_THAT(j["trades"]["profit_loss_ratio"].get<double>(), WithinAbs(0.0, 1e-12));
        in.close();
        std::filesystem::remove(path);
    }

    SECTION("From a backtest result") {
        backtest::BacktestResult result;
        result.initial_capital = 100000.0;
        result.equity_history = make_history({"2024-01-01"}, {100500.0});
        PerformanceMetrics m = result.compute_analytics();
        REQUIRE_THAT(m.total_return_pct(), WithinAbs(0.5, 1e-9));
    }

    SECTION("Error: empty history") {
        REQUIRE_THROWS_AS(PerformanceMetrics({}, 100000.0), std::invalid_argument);
        backtest::BacktestResult empty;
        empty.initial_capital = 100000.0;
        REQUIRE_THROWS_AS(empty.compute_analytics(), std::invalid_argument);
    }

    SECTION("Error: non-positive capital") {
        REQUIRE_THROWS_AS(PerformanceMetrics(make_history({"2024-01-01"}, {1.0}), 0.0),
                          std::invalid_argument);
    }
}
