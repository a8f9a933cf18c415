/**
 * @file technical_scorer.cpp
 * @brief Implementation of TechnicalScorer
 */

#include "scoring/technical_scorer.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace stockbt
{
    namespace scoring
    {

        namespace
        {
            std::string award(const std::string &text, int points)
            {
                std::ostringstream ss;
                ss << text << " (+" << points << ")";
                return ss.str();
            }

            std::string with_value(const std::string &text, double value, int points)
            {
                std::ostringstream ss;
                ss << text << " (" << std::fixed << std::setprecision(1) << value << ") (+" << points << ")";
                return ss.str();
            }
        } // anonymous namespace

        std::string TechnicalScorer::rating(double total_score)
        {
            if (total_score >= 80)
                return "strong bullish";
            if (total_score >= 65)
                return "bullish";
            if (total_score >= 50)
                return "neutral";
            if (total_score >= 35)
                return "bearish";
            return "strong bearish";
        }

        ScoreResult TechnicalScorer::score(const IndicatorSnapshot &s) const
        {
            ScoreResult result;
            std::vector<std::string> &details = result.details;

            // ===================================================================
            // Trend (30)
            // ===================================================================
            int trend = 0;
            if (s.close > s.ma20)
            {
                trend += 15;
                details.push_back(award("Price above MA20", 15));
            }
            else
            {
                details.push_back(award("Price below MA20", 0));
            }

            if (s.ma_arrangement == MaArrangement::BULLISH)
            {
                trend += 15;
                details.push_back(award("Bullish MA arrangement", 15));
            }
            else if (s.ma_arrangement == MaArrangement::BEARISH)
            {
                details.push_back(award("Bearish MA arrangement", 0));
            }
            else
            {
                trend += 7;
                details.push_back(award("Mixed MA arrangement", 7));
            }
            result.breakdown.push_back({"trend", static_cast<double>(trend), 30.0});

            // ===================================================================
            // Momentum (25)
            // ===================================================================
            int momentum = 0;
            if (s.macd_dif > s.macd_dea)
            {
                momentum += 10;
                details.push_back(award("MACD golden cross", 10));
            }
            else
            {
                details.push_back(award("MACD dead cross", 0));
            }

            if (s.macd_hist > 0)
            {
                momentum += 5;
                details.push_back(award("MACD histogram positive", 5));
            }
            else
            {
                details.push_back(award("MACD histogram negative", 0));
            }

            const double rsi = s.rsi;
            if (rsi >= 40 && rsi <= 60)
            {
                momentum += 10;
                details.push_back(with_value("RSI neutral", rsi, 10));
            }
            else if ((rsi >= 30 && rsi < 40) || (rsi > 60 && rsi <= 70))
            {
                momentum += 5;
                details.push_back(with_value("RSI off neutral", rsi, 5));
            }
            else
            {
                details.push_back(with_value("RSI extreme or undefined", rsi, 0));
            }
            result.breakdown.push_back({"momentum", static_cast<double>(momentum), 25.0});

            // ===================================================================
            // Overbought / oversold (20)
            // ===================================================================
            int overbought = 0;
            if (rsi >= 30 && rsi <= 70)
            {
                overbought += 8;
                details.push_back(award("RSI not overbought or oversold", 8));
            }
            else if (rsi > 70)
            {
                details.push_back(award("RSI overbought", 0));
            }
            else
            {
                // oversold; an undefined RSI lands here too
                overbought += 4;
                details.push_back(award("RSI oversold", 4));
            }

            if (s.kdj_k >= 20 && s.kdj_k <= 80)
            {
                overbought += 6;
                details.push_back(award("KDJ in normal range", 6));
            }
            else
            {
                details.push_back(award("KDJ extreme or undefined", 0));
            }

            const double boll = s.boll_position;
            if (boll >= 20 && boll <= 80)
            {
                overbought += 6;
                details.push_back(award("Near Bollinger middle band", 6));
            }
            else if (boll > 80)
            {
                details.push_back(award("Near Bollinger upper band", 0));
            }
            else
            {
                overbought += 3;
                details.push_back(award("Near Bollinger lower band", 3));
            }
            result.breakdown.push_back({"overbought_oversold", static_cast<double>(overbought), 20.0});

            // ===================================================================
            // Volume confirmation (15)
            // ===================================================================
            int volume = 0;
            switch (s.volume_pattern)
            {
            case VolumePattern::HEAVY_UP:
                volume = 15;
                details.push_back(award("Rising on heavy volume", 15));
                break;
            case VolumePattern::LIGHT_UP:
                volume = 8;
                details.push_back(award("Rising on light volume", 8));
                break;
            case VolumePattern::LIGHT_DOWN:
                volume = 10;
                details.push_back(award("Falling on light volume", 10));
                break;
            case VolumePattern::HEAVY_DOWN:
                details.push_back(award("Falling on heavy volume", 0));
                break;
            case VolumePattern::FLAT:
                volume = 7;
                details.push_back(award("Flat price", 7));
                break;
            }
            result.breakdown.push_back({"volume", static_cast<double>(volume), 15.0});

            // ===================================================================
            // Risk (10)
            // ===================================================================
            int risk = 0;
            const double distance = std::abs(s.distance_from_ma20);
            if (distance <= 5)
            {
                risk += 5;
                details.push_back(award("Close to MA20", 5));
            }
            else if (distance <= 10)
            {
                risk += 3;
                details.push_back(award("Moderate distance from MA20", 3));
            }
            else
            {
                details.push_back(award("Far from MA20 or undefined", 0));
            }

            if (s.distance_to_support > 3 && s.distance_to_resistance > 3)
            {
                risk += 5;
                details.push_back(award("Away from support and resistance", 5));
            }
            else if (s.distance_to_support <= 3)
            {
                risk += 3;
                details.push_back(award("Near support", 3));
            }
            else
            {
                details.push_back(award("Near resistance or undefined", 0));
            }
            result.breakdown.push_back({"risk", static_cast<double>(risk), 10.0});

            const int total = trend + momentum + overbought + volume + risk;
            result.score = static_cast<double>(total);
            result.trend_label = rating(result.score);
            return result;
        }

    } // namespace scoring
} // namespace stockbt
