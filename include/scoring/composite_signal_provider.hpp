/**
 * @file composite_signal_provider.hpp
 * @brief Default SignalProvider: equal-weight fusion of two sub-scores
 */

#pragma once

#include "scoring/signal_provider.hpp"
#include "scoring/technical_scorer.hpp"
#include "scoring/trend_scorer.hpp"

namespace stockbt
{
    namespace scoring
    {

        /**
         * @brief Fuse the technical and trend sub-scores.
         * @return (technical + trend) / 2
         */
        double fuse_scores(double technical, double trend);

        /**
         * @class CompositeSignalProvider
         * @brief Scores a snapshot with TechnicalScorer and TrendScorer and fuses them
         *
         * The trend label is the trend scorer's buy signal. Breakdown and
         * details concatenate both sub-models.
         */
        class CompositeSignalProvider : public SignalProvider
        {
        public:
            CompositeSignalProvider() = default;

            ScoreResult score(const IndicatorSnapshot &snapshot) const override;

            std::string get_name() const override { return "CompositeSignalProvider"; }

            const TechnicalScorer &technical() const { return technical_; }
            const TrendScorer &trend() const { return trend_; }

        private:
            TechnicalScorer technical_;
            TrendScorer trend_;
        };

    } // namespace scoring
} // namespace stockbt
