/**
 * @file market_data.cpp
 * @brief Implementation of SymbolHistory class
 */

#include "data/market_data.hpp"
#include "data/date_utils.hpp"
#include <iostream>
#include <iomanip>
#include <cmath>

namespace stockbt
{

    // ============================================================================
    // Constructors
    // ============================================================================

    SymbolHistory::SymbolHistory(const std::string &symbol, const std::vector<PriceBar> &bars)
        : symbol_(symbol), bars_(bars)
    {
        validate();
        build_index_map();
    }

    void SymbolHistory::validate() const
    {
        for (size_t i = 0; i < bars_.size(); ++i)
        {
            const PriceBar &b = bars_[i];
            if (!dates::is_valid_date(b.date))
            {
                throw std::invalid_argument("Invalid bar date for " + symbol_ + ": '" + b.date + "'");
            }
            if (!(b.close > 0.0) || !std::isfinite(b.close))
            {
                throw std::invalid_argument("Close must be positive for " + symbol_ + " on " + b.date);
            }
            if (i > 0 && !(bars_[i - 1].date < b.date))
            {
                throw std::invalid_argument("Bars must be strictly ascending by date for " + symbol_ +
                                            " (at " + b.date + ")");
            }
        }
    }

    void SymbolHistory::build_index_map()
    {
        date_index_.clear();
        for (size_t i = 0; i < bars_.size(); ++i)
        {
            date_index_[bars_[i].date] = i;
        }
    }

    // ============================================================================
    // Data Access Methods
    // ============================================================================

    std::vector<std::string> SymbolHistory::dates() const
    {
        std::vector<std::string> out;
        out.reserve(bars_.size());
        for (const auto &b : bars_)
            out.push_back(b.date);
        return out;
    }

    Eigen::VectorXd SymbolHistory::opens() const { return column(&PriceBar::open); }
    Eigen::VectorXd SymbolHistory::highs() const { return column(&PriceBar::high); }
    Eigen::VectorXd SymbolHistory::lows() const { return column(&PriceBar::low); }
    Eigen::VectorXd SymbolHistory::closes() const { return column(&PriceBar::close); }
    Eigen::VectorXd SymbolHistory::volumes() const { return column(&PriceBar::volume); }

    int SymbolHistory::find_date_index(const std::string &date) const
    {
        auto it = date_index_.find(date);
        if (it == date_index_.end())
            return -1;
        return static_cast<int>(it->second);
    }

    // ============================================================================
    // Filtering Methods
    // ============================================================================

    SymbolHistory SymbolHistory::filter_by_date(const std::string &start_date,
                                                const std::string &end_date) const
    {
        std::vector<PriceBar> kept;
        for (const auto &b : bars_)
        {
            if (!start_date.empty() && b.date < start_date)
                continue;
            if (!end_date.empty() && b.date > end_date)
                continue;
            kept.push_back(b);
        }
        return SymbolHistory(symbol_, kept);
    }

    void SymbolHistory::print_summary() const
    {
        std::cout << "Symbol: " << symbol_ << "\n";
        std::cout << "Bars: " << bars_.size() << "\n";
        if (!bars_.empty())
        {
            std::cout << "Date range: " << bars_.front().date << " to " << bars_.back().date << "\n";
            Eigen::VectorXd c = closes();
            std::cout << std::fixed << std::setprecision(2)
                      << "Close min/max/last: " << c.minCoeff() << " / " << c.maxCoeff()
                      << " / " << c[c.size() - 1] << "\n";
        }
    }

}
