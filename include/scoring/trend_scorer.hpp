/**
 * @file trend_scorer.hpp
 * @brief Trend-following entry score
 *
 * Strict entry rules: MA5 > MA10 > MA20, close within a few percent of MA5,
 * shrinking volume on pullbacks preferred. Scores trend (40), bias (30)
 * and volume status (20). Histories shorter than 20 bars score 0.
 */

#pragma once

#include "scoring/signal_provider.hpp"

namespace stockbt
{
    namespace scoring
    {

        enum class TrendStatus
        {
            BULL,         ///< MA5 > MA10 > MA20
            WEAK_BULL,    ///< MA5 > MA10 only
            CONSOLIDATION,
            BEAR          ///< MA5 < MA10 < MA20
        };

        enum class VolumeStatus
        {
            HEAVY_UP,
            HEAVY_DOWN,
            SHRINK_UP,
            SHRINK_DOWN,
            NORMAL
        };

        enum class BuySignal
        {
            STRONG_BUY,
            BUY,
            HOLD,
            WAIT
        };

        std::string to_string(TrendStatus status);
        std::string to_string(VolumeStatus status);
        std::string to_string(BuySignal signal);

        /**
         * @struct TrendAnalysis
         * @brief Intermediate values behind a trend score
         */
        struct TrendAnalysis
        {
            TrendStatus trend_status = TrendStatus::CONSOLIDATION;
            double trend_strength = 0.0;
            double bias_ma5 = 0.0;           ///< (close - MA5) / MA5 * 100
            VolumeStatus volume_status = VolumeStatus::NORMAL;
            BuySignal buy_signal = BuySignal::WAIT;
            int signal_score = 0;
        };

        /**
         * @class TrendScorer
         * @brief MA alignment / bias / volume trend score
         */
        class TrendScorer : public SignalProvider
        {
        public:
            static constexpr int MIN_HISTORY = 20;
            static constexpr double BIAS_THRESHOLD = 5.0;
            static constexpr double SWEET_SPOT_BIAS = 2.0;
            static constexpr double VOLUME_SHRINK_RATIO = 0.7;
            static constexpr double VOLUME_HEAVY_RATIO = 1.5;

            TrendScorer() = default;

            TrendAnalysis analyze(const IndicatorSnapshot &snapshot) const;

            /**
             * @brief Score one snapshot.
             * @return score in [0, 90]; trend_label holds the buy signal
             */
            ScoreResult score(const IndicatorSnapshot &snapshot) const override;

            std::string get_name() const override { return "TrendScorer"; }
        };

    } // namespace scoring
} // namespace stockbt
