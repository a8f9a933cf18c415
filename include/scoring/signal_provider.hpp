/**
 * @file signal_provider.hpp
 * @brief Abstract interface for daily scoring of one symbol
 *
 * A SignalProvider turns one day's indicator snapshot into a 0-100 score
 * plus labels explaining it. The replay engine only depends on this
 * interface, so scoring models can be swapped or stubbed in tests.
 *
 * Thread Safety: Implementations are expected to be thread-safe for
 * read-only operations.
 */

#pragma once

#include "scoring/indicator_calculator.hpp"
#include <string>
#include <vector>

namespace stockbt
{
    namespace scoring
    {

        /**
         * @struct ScoreComponent
         * @brief Points awarded by one scoring dimension.
         */
        struct ScoreComponent
        {
            std::string name;
            double score = 0.0;
            double max_score = 0.0;
        };

        /**
         * @struct ScoreResult
         * @brief Output of SignalProvider::score().
         */
        struct ScoreResult
        {
            double score = 0.0;                       ///< Composite score, 0-100
            std::string trend_label;                  ///< Human readable signal/rating
            std::vector<ScoreComponent> breakdown;    ///< Per-dimension points
            std::vector<std::string> details;         ///< One line per rule evaluated
        };

        /**
         * @class SignalProvider
         * @brief Abstract base class for daily scoring models
         *
         * Usage Example:
         * @code
         * CompositeSignalProvider provider;
         * ScoreResult r = provider.score(*series.find("2024-03-01"));
         * if (r.score >= 75) { ... }
         * @endcode
         */
        class SignalProvider
        {
        public:
            virtual ~SignalProvider() = default;

            /**
             * @brief Score one symbol on one day
             * @param snapshot Indicator values for that day
             * @return Score in [0, 100] with supporting labels
             */
            virtual ScoreResult score(const IndicatorSnapshot &snapshot) const = 0;

            /**
             * @brief Get the name of the scoring model
             */
            virtual std::string get_name() const = 0;
        };

    } // namespace scoring
} // namespace stockbt
