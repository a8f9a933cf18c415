/**
 * @file test_indicator_calculator.cpp
 * @brief Unit tests for IndicatorCalculator
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "scoring/indicator_calculator.hpp"
#include "data/date_utils.hpp"

#include <cmath>
#include <limits>

using namespace stockbt;
using namespace stockbt::scoring;
using Catch::Matchers::WithinAbs;

namespace {

SymbolHistory make_history(const std::vector<double>& closes, const std::vector<double>& volumes) {
    std::vector<PriceBar> bars;
    std::string date = "2024-01-01";
    for (size_t i = 0; i < closes.size(); ++i) {
        PriceBar b;
        b.date = date;
        b.open = closes[i];
        b.high = closes[i];
        b.low = closes[i];
        b.close = closes[i];
        b.volume = volumes[i];
        bars.push_back(b);
        date = dates::add_days(date, 1);
    }
    return SymbolHistory("TEST", bars);
}

} // namespace

TEST_CASE("Rolling primitives", "[IndicatorCalculator]") {
    Eigen::VectorXd x(5);
    x << 1.0, 2.0, 3.0, 4.0, 5.0;

    SECTION("Rolling mean needs a full window") {
        Eigen::VectorXd m = IndicatorCalculator::rolling_mean(x, 3);
        REQUIRE(std::isnan(m[0]));
        REQUIRE(std::isnan(m[1]));
        REQUIRE_THAT(m[2], WithinAbs(2.0, 1e-12));
        REQUIRE_THAT(m[4], WithinAbs(4.0, 1e-12));

        Eigen::VectorXd too_long = IndicatorCalculator::rolling_mean(x, 10);
        REQUIRE(std::isnan(too_long[4]));
    }

    SECTION("Rolling std is the sample deviation") {
        Eigen::VectorXd s = IndicatorCalculator::rolling_std(x, 3);
        REQUIRE(std::isnan(s[1]));
        REQUIRE_THAT(s[2], WithinAbs(1.0, 1e-12));
    }

    SECTION("Rolling max/min honour min_periods") {
        Eigen::VectorXd hi = IndicatorCalculator::rolling_max(x, 3, 1);
        REQUIRE_THAT(hi[0], WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(hi[4], WithinAbs(5.0, 1e-12));

        Eigen::VectorXd lo = IndicatorCalculator::rolling_min(x, 3, 3);
        REQUIRE(std::isnan(lo[1]));
        REQUIRE_THAT(lo[2], WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(lo[4], WithinAbs(3.0, 1e-12));
    }

    SECTION("Exponential average decays across NaN gaps") {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        Eigen::VectorXd y(4);
        y << 1.0, 2.0, nan, 4.0;
        Eigen::VectorXd e = IndicatorCalculator::ewm(y, 0.5);
        REQUIRE_THAT(e[0], WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(e[1], WithinAbs(1.5, 1e-12));
        REQUIRE_THAT(e[2], WithinAbs(1.5, 1e-12));
        // prev weighted 0.25 after one missing value: (0.25 * 1.5 + 0.5 * 4) / 0.75
        REQUIRE_THAT(e[3], WithinAbs(19.0 / 6.0, 1e-12));

        Eigen::VectorXd z(6);
        z << nan, 2.0, nan, nan, 4.0, 6.0;
        Eigen::VectorXd f = IndicatorCalculator::ewm(z, 0.5);
        REQUIRE(std::isnan(f[0]));
        REQUIRE_THAT(f[3], WithinAbs(2.0, 1e-12));
        // 0.125 * 2 + 0.5 * 4 over 0.625
        REQUIRE_THAT(f[4], WithinAbs(3.6, 1e-12));
        REQUIRE_THAT(f[5], WithinAbs(4.8, 1e-12));
    }
}

TEST_CASE("Indicators on a flat series", "[IndicatorCalculator]") {
    IndicatorCalculator calc;
    auto series = calc.calculate(make_history(std::vector<double>(30, 10.0),
                                              std::vector<double>(30, 1000.0)));

    REQUIRE(series.size() == 30);
    const IndicatorSnapshot& first = series.rows().front();
    REQUIRE(first.history_length == 1);
    REQUIRE(std::isnan(first.ma5));
    REQUIRE(std::isnan(first.price_change_pct));

    const IndicatorSnapshot& last = series.rows().back();
    REQUIRE(last.history_length == 30);
    REQUIRE_THAT(last.ma5, WithinAbs(10.0, 1e-12));
    REQUIRE_THAT(last.ma20, WithinAbs(10.0, 1e-12));
    REQUIRE(std::isnan(last.ma60));
    REQUIRE_THAT(last.distance_from_ma20, WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(last.macd_dif, WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(last.macd_hist, WithinAbs(0.0, 1e-12));

    // no gains and no losses: RSI undefined
    REQUIRE(std::isnan(last.rsi));
    // zero-width band and zero range: undefined
    REQUIRE(std::isnan(last.boll_position));
    REQUIRE(std::isnan(last.kdj_k));

    REQUIRE_THAT(last.volume_ratio, WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(last.volume_ratio_5d, WithinAbs(1.0, 1e-12));
    REQUIRE(last.volume_pattern == VolumePattern::FLAT);
    REQUIRE(last.ma_arrangement == MaArrangement::MIXED);
}

TEST_CASE("Indicators on a rising series", "[IndicatorCalculator]") {
    std::vector<double> closes;
    for (int i = 0; i < 70; ++i) closes.push_back(10.0 + 0.1 * i);
    std::vector<double> volumes(70, 1000.0);
    volumes[69] = 3000.0;

    IndicatorCalculator calc;
    auto series = calc.calculate(make_history(closes, volumes));
    const IndicatorSnapshot& last = series.rows().back();

    REQUIRE_THAT(last.rsi, WithinAbs(100.0, 1e-9));
    REQUIRE(last.ma_arrangement == MaArrangement::BULLISH);
    REQUIRE(last.macd_dif > 0.0);
    REQUIRE(last.distance_from_ma20 > 0.0);

    // volume tripled against both the 20-day and the previous 5-day mean
    REQUIRE_THAT(last.volume_ratio_5d, WithinAbs(3.0, 1e-12));
    REQUIRE(last.volume_ratio > 1.2);
    REQUIRE(last.volume_pattern == VolumePattern::HEAVY_UP);
    REQUIRE(to_string(last.volume_pattern) == "heavy_volume_up");

    // rising before the 20-day volume average exists
    const IndicatorSnapshot& early = series.rows()[5];
    REQUIRE(early.price_change_pct > 0.0);
    REQUIRE(std::isnan(early.volume_ratio));
    REQUIRE(early.volume_pattern == VolumePattern::FLAT);

    REQUIRE(series.find(last.date) == &series.rows().back());
    REQUIRE(series.find("1999-01-01") == nullptr);
}

TEST_CASE("IndicatorCalculator config", "[IndicatorCalculator]") {
    SECTION("From JSON") {
        auto cfg = IndicatorConfig::from_json({{"rsi_period", 6}, {"boll_std_dev", 2.5}});
        REQUIRE(cfg.rsi_period == 6);
        REQUIRE(cfg.boll_std_dev == 2.5);
        REQUIRE(cfg.ma_short == 20);
    }

    SECTION("Error: non-positive window") {
        IndicatorConfig cfg;
        cfg.ma_short = 0;
        REQUIRE_THROWS_AS(IndicatorCalculator(cfg), std::invalid_argument);
    }

    SECTION("Empty history") {
        IndicatorCalculator calc;
        REQUIRE(calc.calculate(SymbolHistory()).empty());
    }
}
