/**
 * @file trend_scorer.cpp
 * @brief Implementation of TrendScorer
 */

#include "scoring/trend_scorer.hpp"

#include <iomanip>
#include <sstream>

namespace stockbt
{
    namespace scoring
    {

        std::string to_string(TrendStatus status)
        {
            switch (status)
            {
            case TrendStatus::BULL:
                return "bull";
            case TrendStatus::WEAK_BULL:
                return "weak bull";
            case TrendStatus::CONSOLIDATION:
                return "consolidation";
            case TrendStatus::BEAR:
                return "bear";
            }
            return "consolidation";
        }

        std::string to_string(VolumeStatus status)
        {
            switch (status)
            {
            case VolumeStatus::HEAVY_UP:
                return "heavy volume up";
            case VolumeStatus::HEAVY_DOWN:
                return "heavy volume down";
            case VolumeStatus::SHRINK_UP:
                return "shrinking volume up";
            case VolumeStatus::SHRINK_DOWN:
                return "shrinking volume pullback";
            case VolumeStatus::NORMAL:
                return "normal volume";
            }
            return "normal volume";
        }

        std::string to_string(BuySignal signal)
        {
            switch (signal)
            {
            case BuySignal::STRONG_BUY:
                return "strong buy";
            case BuySignal::BUY:
                return "buy";
            case BuySignal::HOLD:
                return "hold";
            case BuySignal::WAIT:
                return "wait";
            }
            return "wait";
        }

        TrendAnalysis TrendScorer::analyze(const IndicatorSnapshot &s) const
        {
            TrendAnalysis a;
            if (s.history_length < MIN_HISTORY)
            {
                return a;
            }

            // MA alignment
            if (s.ma5 > s.ma10 && s.ma10 > s.ma20)
            {
                a.trend_status = TrendStatus::BULL;
                a.trend_strength = 80;
            }
            else if (s.ma5 > s.ma10)
            {
                a.trend_status = TrendStatus::WEAK_BULL;
                a.trend_strength = 60;
            }
            else if (s.ma5 < s.ma10 && s.ma10 < s.ma20)
            {
                a.trend_status = TrendStatus::BEAR;
                a.trend_strength = 20;
            }
            else
            {
                a.trend_status = TrendStatus::CONSOLIDATION;
                a.trend_strength = 50;
            }

            // Bias vs MA5
            if (s.ma5 > 0)
            {
                a.bias_ma5 = (s.close - s.ma5) / s.ma5 * 100.0;
            }

            // Volume vs previous five sessions
            if (s.history_length >= 6)
            {
                const bool up = s.price_change_pct > 0;
                if (s.volume_ratio_5d >= VOLUME_HEAVY_RATIO)
                    a.volume_status = up ? VolumeStatus::HEAVY_UP : VolumeStatus::HEAVY_DOWN;
                else if (s.volume_ratio_5d <= VOLUME_SHRINK_RATIO)
                    a.volume_status = up ? VolumeStatus::SHRINK_UP : VolumeStatus::SHRINK_DOWN;
            }

            int score = 0;
            if (a.trend_status == TrendStatus::BULL)
                score += 40;
            else if (a.trend_status == TrendStatus::WEAK_BULL)
                score += 20;

            const double bias = a.bias_ma5;
            if (bias > -SWEET_SPOT_BIAS && bias < SWEET_SPOT_BIAS)
                score += 30;
            else if (bias > -BIAS_THRESHOLD && bias < BIAS_THRESHOLD)
                score += 20;

            if (a.volume_status == VolumeStatus::SHRINK_DOWN)
                score += 20;
            else if (a.volume_status == VolumeStatus::HEAVY_UP)
                score += 15;
            else if (a.volume_status == VolumeStatus::SHRINK_UP)
                score += 10;

            a.signal_score = score;
            if (score >= 80)
                a.buy_signal = BuySignal::STRONG_BUY;
            else if (score >= 60)
                a.buy_signal = BuySignal::BUY;
            else if (score >= 40)
                a.buy_signal = BuySignal::HOLD;
            else
                a.buy_signal = BuySignal::WAIT;

            return a;
        }

        ScoreResult TrendScorer::score(const IndicatorSnapshot &s) const
        {
            const TrendAnalysis a = analyze(s);

            ScoreResult result;
            result.score = static_cast<double>(a.signal_score);
            result.trend_label = to_string(a.buy_signal);

            if (s.history_length < MIN_HISTORY)
            {
                result.details.push_back("Trend: insufficient history");
                return result;
            }

            double trend_points = a.trend_status == TrendStatus::BULL ? 40.0
                                  : a.trend_status == TrendStatus::WEAK_BULL ? 20.0 : 0.0;
            double bias_points = 0.0;
            if (a.bias_ma5 > -SWEET_SPOT_BIAS && a.bias_ma5 < SWEET_SPOT_BIAS)
                bias_points = 30.0;
            else if (a.bias_ma5 > -BIAS_THRESHOLD && a.bias_ma5 < BIAS_THRESHOLD)
                bias_points = 20.0;
            double volume_points = a.signal_score - trend_points - bias_points;

            result.breakdown.push_back({"trend_alignment", trend_points, 40.0});
            result.breakdown.push_back({"bias_ma5", bias_points, 30.0});
            result.breakdown.push_back({"volume_status", volume_points, 20.0});

            std::ostringstream bias;
            bias << std::fixed << std::setprecision(2) << a.bias_ma5;
            result.details.push_back("Trend: " + to_string(a.trend_status));
            result.details.push_back("Bias vs MA5: " + bias.str() + "%");
            result.details.push_back("Volume: " + to_string(a.volume_status));
            return result;
        }

    } // namespace scoring
} // namespace stockbt
