/**
 * @file test_signal_scoring.cpp
 * @brief Unit tests for TechnicalScorer, TrendScorer and CompositeSignalProvider
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "scoring/composite_signal_provider.hpp"
#include "data/date_utils.hpp"

#include <cmath>

using namespace stockbt;
using namespace stockbt::scoring;

namespace {

// Every technical rule satisfied
IndicatorSnapshot bullish_snapshot() {
    IndicatorSnapshot s;
    s.history_length = 80;
    s.close = 10.15;
    s.ma5 = 10.1;
    s.ma10 = 10.0;
    s.ma20 = 9.9;
    s.ma60 = 9.5;
    s.ma_arrangement = MaArrangement::BULLISH;
    s.distance_from_ma20 = (10.15 - 9.9) / 9.9 * 100.0;
    s.macd_dif = 0.2;
    s.macd_dea = 0.1;
    s.macd_hist = 0.2;
    s.rsi = 55.0;
    s.kdj_k = 60.0;
    s.boll_position = 60.0;
    s.volume_pattern = VolumePattern::HEAVY_UP;
    s.distance_to_support = 8.0;
    s.distance_to_resistance = 6.0;
    s.volume_ratio_5d = 0.5;
    s.price_change_pct = -0.5;
    return s;
}

double component(const ScoreResult& r, const std::string& name) {
    for (const auto& c : r.breakdown) {
        if (c.name == name) return c.score;
    }
    return -1.0;
}

} // namespace

TEST_CASE("Score fusion", "[CompositeSignalProvider]") {
    REQUIRE(fuse_scores(80.0, 60.0) == Catch::Approx(70.0));
    REQUIRE(fuse_scores(0.0, 0.0) == Catch::Approx(0.0));
    REQUIRE(fuse_scores(100.0, 90.0) == Catch::Approx(95.0));
}

TEST_CASE("TechnicalScorer", "[TechnicalScorer]") {
    TechnicalScorer scorer;

    SECTION("All rules satisfied") {
        ScoreResult r = scorer.score(bullish_snapshot());
        REQUIRE(r.score == Catch::Approx(100.0));
        REQUIRE(r.trend_label == "strong bullish");
        REQUIRE(r.breakdown.size() == 5);
        REQUIRE(component(r, "trend") == Catch::Approx(30.0));
        REQUIRE(component(r, "momentum") == Catch::Approx(25.0));
        REQUIRE(component(r, "overbought_oversold") == Catch::Approx(20.0));
        REQUIRE(component(r, "volume") == Catch::Approx(15.0));
        REQUIRE(component(r, "risk") == Catch::Approx(10.0));
        REQUIRE(r.details.front() == "Price above MA20 (+15)");
    }

    SECTION("No rule satisfied") {
        IndicatorSnapshot s = bullish_snapshot();
        s.close = 8.0;
        s.ma_arrangement = MaArrangement::BEARISH;
        s.distance_from_ma20 = -19.0;
        s.macd_dif = -0.1;
        s.macd_hist = -0.4;
        s.rsi = 80.0;
        s.kdj_k = 95.0;
        s.boll_position = 90.0;
        s.volume_pattern = VolumePattern::HEAVY_DOWN;
        s.distance_to_resistance = 1.0;
        ScoreResult r = scorer.score(s);
        REQUIRE(r.score == Catch::Approx(0.0));
        REQUIRE(r.trend_label == "strong bearish");
    }

    SECTION("Undefined inputs fall to the last band") {
        // default snapshot: every indicator NaN, mixed arrangement, flat price
        ScoreResult r = scorer.score(IndicatorSnapshot());
        REQUIRE(component(r, "trend") == Catch::Approx(7.0));
        REQUIRE(component(r, "momentum") == Catch::Approx(0.0));
        // NaN RSI counts as oversold (4), NaN Bollinger position as lower band (3)
        REQUIRE(component(r, "overbought_oversold") == Catch::Approx(7.0));
        REQUIRE(component(r, "volume") == Catch::Approx(7.0));
        REQUIRE(component(r, "risk") == Catch::Approx(0.0));
        REQUIRE(r.score == Catch::Approx(21.0));
    }

    SECTION("Oversold partial credit") {
        IndicatorSnapshot s = bullish_snapshot();
        s.rsi = 25.0;
        s.boll_position = 10.0;
        ScoreResult r = scorer.score(s);
        // RSI momentum 0, oversold 4, KDJ 6, lower band 3
        REQUIRE(component(r, "momentum") == Catch::Approx(15.0));
        REQUIRE(component(r, "overbought_oversold") == Catch::Approx(13.0));
    }

    SECTION("Rating thresholds") {
        REQUIRE(TechnicalScorer::rating(80.0) == "strong bullish");
        REQUIRE(TechnicalScorer::rating(65.0) == "bullish");
        REQUIRE(TechnicalScorer::rating(50.0) == "neutral");
        REQUIRE(TechnicalScorer::rating(35.0) == "bearish");
        REQUIRE(TechnicalScorer::rating(34.9) == "strong bearish");
    }
}

TEST_CASE("TechnicalScorer on a halted stretch", "[TechnicalScorer]") {
    std::vector<PriceBar> bars;
    std::string date = "2024-01-01";
    for (int i = 0; i < 80; ++i) {
        PriceBar b;
        b.date = date;
        b.open = b.high = b.low = b.close = 10.0;
        b.volume = 1000.0;
        bars.push_back(b);
        date = dates::add_days(date, 1);
    }
    IndicatorCalculator calc;
    IndicatorSeries series = calc.calculate(SymbolHistory("FLAT", bars));
    const IndicatorSnapshot& last = series.rows().back();
    REQUIRE(std::isnan(last.rsi));
    REQUIRE(std::isnan(last.boll_position));

    ScoreResult r = TechnicalScorer().score(last);
    REQUIRE(component(r, "trend") == Catch::Approx(7.0));
    REQUIRE(component(r, "momentum") == Catch::Approx(0.0));
    REQUIRE(component(r, "overbought_oversold") == Catch::Approx(7.0));
    REQUIRE(component(r, "volume") == Catch::Approx(7.0));
    // on MA20 (5), at the 20-day support (3)
    REQUIRE(component(r, "risk") == Catch::Approx(8.0));
    REQUIRE(r.score == Catch::Approx(29.0));
}

TEST_CASE("TrendScorer", "[TrendScorer]") {
    TrendScorer scorer;

    SECTION("Bull trend near MA5 on a quiet pullback") {
        TrendAnalysis a = scorer.analyze(bullish_snapshot());
        REQUIRE(a.trend_status == TrendStatus::BULL);
        REQUIRE(a.volume_status == VolumeStatus::SHRINK_DOWN);
        REQUIRE(a.signal_score == 90);
        REQUIRE(a.buy_signal == BuySignal::STRONG_BUY);

        ScoreResult r = scorer.score(bullish_snapshot());
        REQUIRE(r.score == Catch::Approx(90.0));
        REQUIRE(r.trend_label == "strong buy");
        REQUIRE(component(r, "trend_alignment") == Catch::Approx(40.0));
        REQUIRE(component(r, "bias_ma5") == Catch::Approx(30.0));
        REQUIRE(component(r, "volume_status") == Catch::Approx(20.0));
    }

    SECTION("Extended price gets no bias points") {
        IndicatorSnapshot s = bullish_snapshot();
        s.close = 11.0;
        s.volume_ratio_5d = 2.0;
        s.price_change_pct = 3.0;
        TrendAnalysis a = scorer.analyze(s);
        REQUIRE(a.volume_status == VolumeStatus::HEAVY_UP);
        REQUIRE(a.signal_score == 55);
        REQUIRE(a.buy_signal == BuySignal::HOLD);
    }

    SECTION("Bear trend") {
        IndicatorSnapshot s = bullish_snapshot();
        s.ma5 = 9.0;
        s.ma10 = 9.5;
        s.ma20 = 10.0;
        s.close = 9.0;
        s.volume_ratio_5d = 1.0;
        TrendAnalysis a = scorer.analyze(s);
        REQUIRE(a.trend_status == TrendStatus::BEAR);
        REQUIRE(a.volume_status == VolumeStatus::NORMAL);
        REQUIRE(a.signal_score == 30);
        REQUIRE(a.buy_signal == BuySignal::WAIT);
    }

    SECTION("Short history scores zero") {
        IndicatorSnapshot s = bullish_snapshot();
        s.history_length = TrendScorer::MIN_HISTORY - 1;
        ScoreResult r = scorer.score(s);
        REQUIRE(r.score == Catch::Approx(0.0));
        REQUIRE(r.trend_label == "wait");
        REQUIRE(r.breakdown.empty());
    }
}

TEST_CASE("CompositeSignalProvider", "[CompositeSignalProvider]") {
    CompositeSignalProvider provider;
    ScoreResult r = provider.score(bullish_snapshot());

    REQUIRE(r.score == Catch::Approx(95.0));
    REQUIRE(r.trend_label == "strong buy");
    REQUIRE(r.breakdown.size() == 8);
    REQUIRE(r.details.front() == "Technical: strong bullish");
    REQUIRE(provider.get_name() == "CompositeSignalProvider");

    // usable through the abstract interface
    const SignalProvider& base = provider;
    REQUIRE(base.score(bullish_snapshot()).score == Catch::Approx(95.0));
}
