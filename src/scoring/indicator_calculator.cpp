/**
 * @file indicator_calculator.cpp
 * @brief Implementation of IndicatorCalculator
 *
 * Every indicator is computed as a full Eigen column over the history, then
 * scattered into per-day snapshots.
 */

#include "scoring/indicator_calculator.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace stockbt
{
    namespace scoring
    {

        namespace
        {
            const double NaN = std::numeric_limits<double>::quiet_NaN();

            /// Element-wise a / b with NaN for a zero or undefined denominator.
            Eigen::VectorXd safe_divide(const Eigen::VectorXd &a, const Eigen::VectorXd &b)
            {
                Eigen::VectorXd out(a.size());
                for (Eigen::Index i = 0; i < a.size(); ++i)
                {
                    out[i] = (b[i] == 0.0 || std::isnan(b[i]) || std::isnan(a[i])) ? NaN : a[i] / b[i];
                }
                return out;
            }

            /// Percentage change from the previous element; NaN for the first.
            Eigen::VectorXd pct_change(const Eigen::VectorXd &x)
            {
                Eigen::VectorXd out = Eigen::VectorXd::Constant(x.size(), NaN);
                for (Eigen::Index i = 1; i < x.size(); ++i)
                {
                    out[i] = (x[i - 1] == 0.0) ? NaN : x[i] / x[i - 1] - 1.0;
                }
                return out;
            }

            void require_positive(int value, const char *name)
            {
                if (value < 1)
                {
                    std::ostringstream ss;
                    ss << value;
                    throw std::invalid_argument(std::string("Expected positive value for parameter '") + name + "', got: " + ss.str());
                }
            }
        } // anonymous namespace

        // ===================================================================
        // Enum names
        // ===================================================================

        std::string to_string(VolumePattern pattern)
        {
            switch (pattern)
            {
            case VolumePattern::HEAVY_UP:
                return "heavy_volume_up";
            case VolumePattern::LIGHT_UP:
                return "light_volume_up";
            case VolumePattern::HEAVY_DOWN:
                return "heavy_volume_down";
            case VolumePattern::LIGHT_DOWN:
                return "light_volume_down";
            case VolumePattern::FLAT:
                return "flat";
            }
            return "flat";
        }

        std::string to_string(MaArrangement arrangement)
        {
            switch (arrangement)
            {
            case MaArrangement::BULLISH:
                return "bullish";
            case MaArrangement::BEARISH:
                return "bearish";
            case MaArrangement::MIXED:
                return "mixed";
            }
            return "mixed";
        }

        // ===================================================================
        // IndicatorSnapshot / IndicatorSeries
        // ===================================================================

        IndicatorSnapshot::IndicatorSnapshot()
            : ma5(NaN), ma10(NaN), ma20(NaN), ma60(NaN), distance_from_ma20(NaN),
              macd_dif(NaN), macd_dea(NaN), macd_hist(NaN), rsi(NaN),
              kdj_k(NaN), kdj_d(NaN), kdj_j(NaN),
              boll_upper(NaN), boll_mid(NaN), boll_lower(NaN), boll_position(NaN), boll_width(NaN),
              atr(NaN), atr_pct(NaN),
              resistance(NaN), support(NaN), distance_to_resistance(NaN), distance_to_support(NaN),
              volume_ma(NaN), volume_ratio(NaN), volume_ratio_5d(0.0),
              price_change_pct(NaN), volume_change_pct(NaN)
        {
        }

        IndicatorSeries::IndicatorSeries(const std::string &symbol, const std::vector<IndicatorSnapshot> &rows)
            : symbol_(symbol), rows_(rows)
        {
            for (size_t i = 0; i < rows_.size(); ++i)
            {
                date_index_[rows_[i].date] = i;
            }
        }

        int IndicatorSeries::find_date_index(const std::string &date) const
        {
            auto it = date_index_.find(date);
            if (it == date_index_.end())
                return -1;
            return static_cast<int>(it->second);
        }

        const IndicatorSnapshot *IndicatorSeries::find(const std::string &date) const
        {
            int idx = find_date_index(date);
            if (idx < 0)
                return nullptr;
            return &rows_[static_cast<size_t>(idx)];
        }

        // ===================================================================
        // IndicatorConfig
        // ===================================================================

        IndicatorConfig IndicatorConfig::from_json(const nlohmann::json &j)
        {
            IndicatorConfig cfg;
            if (j.is_object())
            {
                cfg.ma_short = j.value("ma_short", cfg.ma_short);
                cfg.ma_long = j.value("ma_long", cfg.ma_long);
                cfg.macd_fast = j.value("macd_fast", cfg.macd_fast);
                cfg.macd_slow = j.value("macd_slow", cfg.macd_slow);
                cfg.macd_signal = j.value("macd_signal", cfg.macd_signal);
                cfg.rsi_period = j.value("rsi_period", cfg.rsi_period);
                cfg.kdj_n = j.value("kdj_n", cfg.kdj_n);
                cfg.kdj_m1 = j.value("kdj_m1", cfg.kdj_m1);
                cfg.kdj_m2 = j.value("kdj_m2", cfg.kdj_m2);
                cfg.atr_period = j.value("atr_period", cfg.atr_period);
                cfg.boll_period = j.value("boll_period", cfg.boll_period);
                cfg.boll_std_dev = j.value("boll_std_dev", cfg.boll_std_dev);
                cfg.sr_lookback = j.value("sr_lookback", cfg.sr_lookback);
                cfg.volume_ma_period = j.value("volume_ma_period", cfg.volume_ma_period);
            }
            return cfg;
        }

        // ===================================================================
        // IndicatorCalculator
        // ===================================================================

        IndicatorCalculator::IndicatorCalculator(const IndicatorConfig &config) : config_(config)
        {
            validate_config();
        }

        IndicatorCalculator::IndicatorCalculator() : config_() {}

        void IndicatorCalculator::validate_config() const
        {
            require_positive(config_.ma_short, "ma_short");
            require_positive(config_.ma_long, "ma_long");
            require_positive(config_.macd_fast, "macd_fast");
            require_positive(config_.macd_slow, "macd_slow");
            require_positive(config_.macd_signal, "macd_signal");
            require_positive(config_.rsi_period, "rsi_period");
            require_positive(config_.kdj_n, "kdj_n");
            require_positive(config_.kdj_m1, "kdj_m1");
            require_positive(config_.kdj_m2, "kdj_m2");
            require_positive(config_.atr_period, "atr_period");
            require_positive(config_.boll_period, "boll_period");
            require_positive(config_.sr_lookback, "sr_lookback");
            require_positive(config_.volume_ma_period, "volume_ma_period");
            if (config_.boll_std_dev <= 0.0)
            {
                throw std::invalid_argument("Expected positive value for parameter 'boll_std_dev'");
            }
        }

        Eigen::VectorXd IndicatorCalculator::rolling_mean(const Eigen::VectorXd &x, int window)
        {
            Eigen::VectorXd out = Eigen::VectorXd::Constant(x.size(), NaN);
            for (Eigen::Index i = window - 1; i < x.size(); ++i)
            {
                // NaN anywhere in the window propagates, as with a plain sum
                out[i] = x.segment(i - window + 1, window).mean();
            }
            return out;
        }

        Eigen::VectorXd IndicatorCalculator::rolling_std(const Eigen::VectorXd &x, int window)
        {
            Eigen::VectorXd out = Eigen::VectorXd::Constant(x.size(), NaN);
            if (window < 2)
                return out;
            for (Eigen::Index i = window - 1; i < x.size(); ++i)
            {
                Eigen::VectorXd seg = x.segment(i - window + 1, window);
                double mean = seg.mean();
                double ss = (seg.array() - mean).square().sum();
                out[i] = std::sqrt(ss / static_cast<double>(window - 1));
            }
            return out;
        }

        Eigen::VectorXd IndicatorCalculator::rolling_max(const Eigen::VectorXd &x, int window, int min_periods)
        {
            Eigen::VectorXd out = Eigen::VectorXd::Constant(x.size(), NaN);
            for (Eigen::Index i = 0; i < x.size(); ++i)
            {
                Eigen::Index start = std::max<Eigen::Index>(0, i - window + 1);
                Eigen::Index len = i - start + 1;
                if (len < min_periods)
                    continue;
                out[i] = x.segment(start, len).maxCoeff();
            }
            return out;
        }

        Eigen::VectorXd IndicatorCalculator::rolling_min(const Eigen::VectorXd &x, int window, int min_periods)
        {
            Eigen::VectorXd out = Eigen::VectorXd::Constant(x.size(), NaN);
            for (Eigen::Index i = 0; i < x.size(); ++i)
            {
                Eigen::Index start = std::max<Eigen::Index>(0, i - window + 1);
                Eigen::Index len = i - start + 1;
                if (len < min_periods)
                    continue;
                out[i] = x.segment(start, len).minCoeff();
            }
            return out;
        }

        Eigen::VectorXd IndicatorCalculator::ewm(const Eigen::VectorXd &x, double alpha)
        {
            Eigen::VectorXd out = Eigen::VectorXd::Constant(x.size(), NaN);
            double prev = NaN;
            // weight of prev; keeps decaying across NaN gaps
            double prev_weight = 1.0;
            for (Eigen::Index i = 0; i < x.size(); ++i)
            {
                if (std::isnan(prev))
                {
                    prev = x[i];
                    prev_weight = 1.0;
                }
                else
                {
                    prev_weight *= 1.0 - alpha;
                    if (!std::isnan(x[i]))
                    {
                        prev = (prev_weight * prev + alpha * x[i]) / (prev_weight + alpha);
                        prev_weight = 1.0;
                    }
                }
                out[i] = prev;
            }
            return out;
        }

        IndicatorSeries IndicatorCalculator::calculate(const SymbolHistory &history) const
        {
            const Eigen::Index n = static_cast<Eigen::Index>(history.size());
            if (n == 0)
            {
                return IndicatorSeries(history.symbol(), {});
            }

            const Eigen::VectorXd close = history.closes();
            const Eigen::VectorXd high = history.highs();
            const Eigen::VectorXd low = history.lows();
            const Eigen::VectorXd volume = history.volumes();

            // Moving averages
            const Eigen::VectorXd ma5 = rolling_mean(close, 5);
            const Eigen::VectorXd ma10 = rolling_mean(close, 10);
            const Eigen::VectorXd ma20 = rolling_mean(close, config_.ma_short);
            const Eigen::VectorXd ma60 = rolling_mean(close, config_.ma_long);

            // MACD
            const Eigen::VectorXd ema_fast = ewm(close, 2.0 / (config_.macd_fast + 1.0));
            const Eigen::VectorXd ema_slow = ewm(close, 2.0 / (config_.macd_slow + 1.0));
            const Eigen::VectorXd dif = ema_fast - ema_slow;
            const Eigen::VectorXd dea = ewm(dif, 2.0 / (config_.macd_signal + 1.0));
            const Eigen::VectorXd hist = (dif - dea) * 2.0;

            // RSI (simple rolling means of gains and losses)
            Eigen::VectorXd gain = Eigen::VectorXd::Zero(n);
            Eigen::VectorXd loss = Eigen::VectorXd::Zero(n);
            for (Eigen::Index i = 1; i < n; ++i)
            {
                double delta = close[i] - close[i - 1];
                if (delta > 0.0)
                    gain[i] = delta;
                else if (delta < 0.0)
                    loss[i] = -delta;
            }
            const Eigen::VectorXd avg_gain = rolling_mean(gain, config_.rsi_period);
            const Eigen::VectorXd avg_loss = rolling_mean(loss, config_.rsi_period);
            Eigen::VectorXd rsi = Eigen::VectorXd::Constant(n, NaN);
            for (Eigen::Index i = 0; i < n; ++i)
            {
                if (std::isnan(avg_gain[i]) || std::isnan(avg_loss[i]))
                    continue;
                if (avg_loss[i] == 0.0)
                    rsi[i] = avg_gain[i] == 0.0 ? NaN : 100.0;
                else
                    rsi[i] = 100.0 - 100.0 / (1.0 + avg_gain[i] / avg_loss[i]);
            }

            // KDJ
            const Eigen::VectorXd low_n = rolling_min(low, config_.kdj_n, 1);
            const Eigen::VectorXd high_n = rolling_max(high, config_.kdj_n, 1);
            const Eigen::VectorXd rsv = safe_divide(close - low_n, high_n - low_n) * 100.0;
            const Eigen::VectorXd kdj_k = ewm(rsv, 1.0 / config_.kdj_m1);
            const Eigen::VectorXd kdj_d = ewm(kdj_k, 1.0 / config_.kdj_m2);
            const Eigen::VectorXd kdj_j = kdj_k * 3.0 - kdj_d * 2.0;

            // ATR
            Eigen::VectorXd true_range(n);
            for (Eigen::Index i = 0; i < n; ++i)
            {
                double tr = high[i] - low[i];
                if (i > 0)
                {
                    tr = std::max({tr, std::abs(high[i] - close[i - 1]), std::abs(low[i] - close[i - 1])});
                }
                true_range[i] = tr;
            }
            const Eigen::VectorXd atr = rolling_mean(true_range, config_.atr_period);
            const Eigen::VectorXd atr_pct = safe_divide(atr, close) * 100.0;

            // Bollinger bands
            const Eigen::VectorXd boll_mid = rolling_mean(close, config_.boll_period);
            const Eigen::VectorXd boll_std = rolling_std(close, config_.boll_period);
            const Eigen::VectorXd boll_upper = boll_mid + boll_std * config_.boll_std_dev;
            const Eigen::VectorXd boll_lower = boll_mid - boll_std * config_.boll_std_dev;
            const Eigen::VectorXd boll_width = safe_divide(boll_upper - boll_lower, boll_mid) * 100.0;
            const Eigen::VectorXd boll_position = safe_divide(close - boll_lower, boll_upper - boll_lower) * 100.0;

            // Support / resistance
            const Eigen::VectorXd resistance = rolling_max(high, config_.sr_lookback, config_.sr_lookback);
            const Eigen::VectorXd support = rolling_min(low, config_.sr_lookback, config_.sr_lookback);
            const Eigen::VectorXd dist_res = safe_divide(resistance - close, close) * 100.0;
            const Eigen::VectorXd dist_sup = safe_divide(close - support, close) * 100.0;

            // Volume confirmation
            const Eigen::VectorXd volume_ma = rolling_mean(volume, config_.volume_ma_period);
            const Eigen::VectorXd volume_ratio = safe_divide(volume, volume_ma);
            const Eigen::VectorXd price_change = pct_change(close);
            const Eigen::VectorXd volume_change = pct_change(volume);
            const Eigen::VectorXd dist_ma20 = safe_divide(close - ma20, ma20) * 100.0;

            std::vector<IndicatorSnapshot> rows;
            rows.reserve(static_cast<size_t>(n));

            for (Eigen::Index i = 0; i < n; ++i)
            {
                const PriceBar &bar = history.bar(static_cast<size_t>(i));
                IndicatorSnapshot s;
                s.symbol = history.symbol();
                s.date = bar.date;
                s.history_length = static_cast<int>(i + 1);
                s.open = bar.open;
                s.high = bar.high;
                s.low = bar.low;
                s.close = bar.close;
                s.volume = bar.volume;

                s.ma5 = ma5[i];
                s.ma10 = ma10[i];
                s.ma20 = ma20[i];
                s.ma60 = ma60[i];
                s.distance_from_ma20 = dist_ma20[i];

                s.macd_dif = dif[i];
                s.macd_dea = dea[i];
                s.macd_hist = hist[i];
                s.rsi = rsi[i];
                s.kdj_k = kdj_k[i];
                s.kdj_d = kdj_d[i];
                s.kdj_j = kdj_j[i];

                s.boll_upper = boll_upper[i];
                s.boll_mid = boll_mid[i];
                s.boll_lower = boll_lower[i];
                s.boll_position = boll_position[i];
                s.boll_width = boll_width[i];

                s.atr = atr[i];
                s.atr_pct = atr_pct[i];

                s.resistance = resistance[i];
                s.support = support[i];
                s.distance_to_resistance = dist_res[i];
                s.distance_to_support = dist_sup[i];

                s.volume_ma = volume_ma[i];
                s.volume_ratio = volume_ratio[i];
                s.price_change_pct = price_change[i] * 100.0;
                s.volume_change_pct = volume_change[i] * 100.0;

                if (i >= 5)
                {
                    double prev5 = volume.segment(i - 5, 5).mean();
                    if (prev5 > 0.0)
                        s.volume_ratio_5d = volume[i] / prev5;
                }

                // no volume average yet: flat
                if (std::isnan(volume_ratio[i]))
                    s.volume_pattern = VolumePattern::FLAT;
                else if (price_change[i] > 0.0)
                    s.volume_pattern = volume_ratio[i] > 1.2 ? VolumePattern::HEAVY_UP : VolumePattern::LIGHT_UP;
                else if (price_change[i] < 0.0)
                    s.volume_pattern = volume_ratio[i] > 1.2 ? VolumePattern::HEAVY_DOWN : VolumePattern::LIGHT_DOWN;
                else
                    s.volume_pattern = VolumePattern::FLAT;

                if (s.ma5 > s.ma10 && s.ma10 > s.ma20 && s.ma20 > s.ma60)
                    s.ma_arrangement = MaArrangement::BULLISH;
                else if (s.ma5 < s.ma10 && s.ma10 < s.ma20 && s.ma20 < s.ma60)
                    s.ma_arrangement = MaArrangement::BEARISH;
                else
                    s.ma_arrangement = MaArrangement::MIXED;

                rows.push_back(s);
            }

            return IndicatorSeries(history.symbol(), rows);
        }

    } // namespace scoring
} // namespace stockbt
