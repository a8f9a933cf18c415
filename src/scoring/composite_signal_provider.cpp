/**
 * @file composite_signal_provider.cpp
 * @brief Implementation of CompositeSignalProvider
 */

#include "scoring/composite_signal_provider.hpp"

namespace stockbt
{
    namespace scoring
    {

        double fuse_scores(double technical, double trend)
        {
            return (technical + trend) / 2.0;
        }

        ScoreResult CompositeSignalProvider::score(const IndicatorSnapshot &snapshot) const
        {
            ScoreResult tech = technical_.score(snapshot);
            ScoreResult trend = trend_.score(snapshot);

            ScoreResult result;
            result.score = fuse_scores(tech.score, trend.score);
            result.trend_label = trend.trend_label;

            result.breakdown = tech.breakdown;
            result.breakdown.insert(result.breakdown.end(), trend.breakdown.begin(), trend.breakdown.end());

            result.details.push_back("Technical: " + tech.trend_label);
            result.details.insert(result.details.end(), tech.details.begin(), tech.details.end());
            result.details.insert(result.details.end(), trend.details.begin(), trend.details.end());
            return result;
        }

    } // namespace scoring
} // namespace stockbt
