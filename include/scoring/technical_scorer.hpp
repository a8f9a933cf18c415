/**
 * @file technical_scorer.hpp
 * @brief Rule-based composite score from technical indicators
 *
 * Five dimensions, 100 points in total:
 * - Trend (30): close vs MA20, MA arrangement
 * - Momentum (25): MACD cross and histogram, RSI distance from neutral
 * - Overbought/oversold (20): RSI, KDJ K, Bollinger position
 * - Volume confirmation (15): volume pattern
 * - Risk (10): distance from MA20, distance to support/resistance
 *
 * Rules whose inputs are NaN award no points.
 */

#pragma once

#include "scoring/signal_provider.hpp"

namespace stockbt
{
    namespace scoring
    {

        /**
         * @class TechnicalScorer
         * @brief Indicator-based composite score with a rating label
         */
        class TechnicalScorer : public SignalProvider
        {
        public:
            TechnicalScorer() = default;

            /**
             * @brief Score one snapshot.
             * @return score in [0, 100]; trend_label holds the rating
             */
            ScoreResult score(const IndicatorSnapshot &snapshot) const override;

            std::string get_name() const override { return "TechnicalScorer"; }

            /// Rating label for a total score.
            static std::string rating(double total_score);
        };

    } // namespace scoring
} // namespace stockbt
