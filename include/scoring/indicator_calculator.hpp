/**
 * @file indicator_calculator.hpp
 * @brief Technical indicator enrichment of daily bar histories
 *
 * Computes moving averages, MACD, RSI, KDJ, ATR, Bollinger bands,
 * support/resistance and volume confirmation columns for a full history in
 * one pass, so the replay loop only performs lookups.
 *
 * Rolling windows follow the usual "full window required" convention:
 * values are NaN until the window is filled. Exponential averages are seeded
 * with the first observation (no bias adjustment).
 */

#ifndef STOCKBT_SCORING_INDICATOR_CALCULATOR_HPP
#define STOCKBT_SCORING_INDICATOR_CALCULATOR_HPP

#include "data/market_data.hpp"
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace stockbt
{
    namespace scoring
    {

        /**
         * @enum VolumePattern
         * @brief Price direction combined with relative volume.
         */
        enum class VolumePattern
        {
            HEAVY_UP,   ///< Price up on volume_ratio > 1.2
            LIGHT_UP,   ///< Price up on volume_ratio <= 1.2
            HEAVY_DOWN, ///< Price down on volume_ratio > 1.2
            LIGHT_DOWN, ///< Price down on volume_ratio <= 1.2
            FLAT        ///< Unchanged price or undefined inputs
        };

        /**
         * @enum MaArrangement
         * @brief Ordering of the MA5/MA10/MA20/MA60 stack.
         */
        enum class MaArrangement
        {
            BULLISH, ///< MA5 > MA10 > MA20 > MA60
            BEARISH, ///< MA5 < MA10 < MA20 < MA60
            MIXED
        };

        std::string to_string(VolumePattern pattern);
        std::string to_string(MaArrangement arrangement);

        /**
         * @struct IndicatorSnapshot
         * @brief All indicator values of one symbol on one day.
         *
         * Undefined values (window not yet filled, zero denominators) are NaN.
         */
        struct IndicatorSnapshot
        {
            std::string symbol;
            std::string date;
            int history_length = 0; ///< Bars available up to and including this day

            double open = 0.0;
            double high = 0.0;
            double low = 0.0;
            double close = 0.0;
            double volume = 0.0;

            double ma5;
            double ma10;
            double ma20;
            double ma60;
            double distance_from_ma20; ///< (close - MA20) / MA20 * 100

            double macd_dif;
            double macd_dea;
            double macd_hist;

            double rsi;

            double kdj_k;
            double kdj_d;
            double kdj_j;

            double boll_upper;
            double boll_mid;
            double boll_lower;
            double boll_position; ///< 0-100 position inside the band
            double boll_width;

            double atr;
            double atr_pct;

            double resistance;
            double support;
            double distance_to_resistance;
            double distance_to_support;

            double volume_ma;
            double volume_ratio;    ///< volume / 20-day average volume
            double volume_ratio_5d; ///< volume / mean of previous 5 volumes (0 if undefined)
            double price_change_pct;
            double volume_change_pct;

            VolumePattern volume_pattern = VolumePattern::FLAT;
            MaArrangement ma_arrangement = MaArrangement::MIXED;

            IndicatorSnapshot();
        };

        /**
         * @class IndicatorSeries
         * @brief Date-indexed snapshots for one symbol.
         */
        class IndicatorSeries
        {
        public:
            IndicatorSeries() = default;
            IndicatorSeries(const std::string &symbol, const std::vector<IndicatorSnapshot> &rows);

            const std::string &symbol() const { return symbol_; }
            const std::vector<IndicatorSnapshot> &rows() const { return rows_; }
            size_t size() const { return rows_.size(); }
            bool empty() const { return rows_.empty(); }

            /**
             * @return Index of the row for @p date, or -1 if absent.
             */
            int find_date_index(const std::string &date) const;

            /**
             * @return Pointer to the row for @p date, or nullptr if absent.
             */
            const IndicatorSnapshot *find(const std::string &date) const;

        private:
            std::string symbol_;
            std::vector<IndicatorSnapshot> rows_;
            std::map<std::string, size_t> date_index_;
        };

        /**
         * @struct IndicatorConfig
         * @brief Window lengths for every indicator.
         */
        struct IndicatorConfig
        {
            int ma_short = 20;
            int ma_long = 60;
            int macd_fast = 12;
            int macd_slow = 26;
            int macd_signal = 9;
            int rsi_period = 14;
            int kdj_n = 9;
            int kdj_m1 = 3;
            int kdj_m2 = 3;
            int atr_period = 14;
            int boll_period = 20;
            double boll_std_dev = 2.0;
            int sr_lookback = 20;
            int volume_ma_period = 20;

            static IndicatorConfig from_json(const nlohmann::json &j);
        };

        /**
         * @class IndicatorCalculator
         * @brief Enriches a SymbolHistory with indicator columns.
         *
         * Usage Example:
         * @code
         * IndicatorCalculator calc;
         * IndicatorSeries series = calc.calculate(history);
         * const IndicatorSnapshot *today = series.find("2024-03-01");
         * @endcode
         */
        class IndicatorCalculator
        {
        public:
            explicit IndicatorCalculator(const IndicatorConfig &config);
            IndicatorCalculator();
            ~IndicatorCalculator() = default;

            /**
             * @brief Compute every indicator for every bar.
             * @param history Ascending bar history
             * @return One snapshot per bar, same order as the history
             */
            IndicatorSeries calculate(const SymbolHistory &history) const;

            const IndicatorConfig &config() const { return config_; }

            // -- Series primitives (exposed for testing)

            /// Trailing mean over @p window values; NaN until the window is full.
            static Eigen::VectorXd rolling_mean(const Eigen::VectorXd &x, int window);

            /// Trailing sample standard deviation (n - 1); NaN until the window is full.
            static Eigen::VectorXd rolling_std(const Eigen::VectorXd &x, int window);

            /// Trailing max/min; @p min_periods values are required.
            static Eigen::VectorXd rolling_max(const Eigen::VectorXd &x, int window, int min_periods);
            static Eigen::VectorXd rolling_min(const Eigen::VectorXd &x, int window, int min_periods);

            /// Exponential average with smoothing factor @p alpha, seeded with the first value.
            /// A NaN input repeats the previous value; the previous value keeps losing weight
            /// for each missing input.
            static Eigen::VectorXd ewm(const Eigen::VectorXd &x, double alpha);

        private:
            IndicatorConfig config_;
            void validate_config() const;
        };

    } // namespace scoring
} // namespace stockbt

#endif // STOCKBT_SCORING_INDICATOR_CALCULATOR_HPP
