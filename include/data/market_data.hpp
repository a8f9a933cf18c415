/*
 * @file market_data.hpp
 * @brief Daily OHLCV history storage for a single symbol.
 *
 * Provides ordered storage of daily price bars with date indexing and
 * Eigen column views used by the indicator layer.
 */

#ifndef STOCKBT_DATA_MARKET_DATA_HPP
#define STOCKBT_DATA_MARKET_DATA_HPP

#include <Eigen/Dense>
#include <string>
#include <vector>
#include <map>
#include <stdexcept>

namespace stockbt
{
    /**
     * @struct PriceBar
     * @brief One trading day of OHLCV data.
     */
    struct PriceBar
    {
        std::string date;   ///< Trading date (YYYY-MM-DD)
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        double volume = 0.0;
    };

    /**
     * @class SymbolHistory
     * @brief Ordered daily bar history for one symbol.
     *
     * Bars are kept strictly ascending by date. Construction validates the
     * ordering and that every close is positive.
     *
     * @note Column accessors return copies laid out as (dates x 1) vectors.
     */
    class SymbolHistory
    {
    public:
        SymbolHistory() = default;

        /**
         * @brief Constructor with data.
         * @param symbol Symbol identifier.
         * @param bars Bars in ascending date order.
         * @throws std::invalid_argument if dates are malformed, unordered or
         *         duplicated, or a close is not positive.
         */
        SymbolHistory(const std::string &symbol, const std::vector<PriceBar> &bars);

        ~SymbolHistory() = default;

        /** ===========================================
         *  Data Access Methods
         *  ===========================================
         */

        const std::string &symbol() const { return symbol_; }
        const std::vector<PriceBar> &bars() const { return bars_; }
        const PriceBar &bar(size_t index) const { return bars_.at(index); }
        const PriceBar &front() const { return bars_.front(); }
        const PriceBar &back() const { return bars_.back(); }
        size_t size() const { return bars_.size(); }
        bool empty() const { return bars_.empty(); }

        std::vector<std::string> dates() const;

        Eigen::VectorXd opens() const;
        Eigen::VectorXd highs() const;
        Eigen::VectorXd lows() const;
        Eigen::VectorXd closes() const;
        Eigen::VectorXd volumes() const;

        /**
         * @brief Find the bar index for a date.
         * @return Index, or -1 if the symbol has no bar on that date.
         */
        int find_date_index(const std::string &date) const;

        bool has_date(const std::string &date) const { return find_date_index(date) >= 0; }

        /** ===========================================
         *  Filtering Methods
         *  ===========================================
         */

        /**
         * @brief Keep bars with start_date <= date <= end_date.
         * @param start_date Start date (inclusive), empty for unbounded
         * @param end_date End date (inclusive), empty for unbounded
         */
        SymbolHistory filter_by_date(const std::string &start_date,
                                     const std::string &end_date) const;

        /**
         * @brief Print summary statistics
         */
        void print_summary() const;

    private:
        void validate() const;
        void build_index_map();

        template <typename Field>
        Eigen::VectorXd column(Field field) const
        {
            Eigen::VectorXd out(static_cast<Eigen::Index>(bars_.size()));
            for (size_t i = 0; i < bars_.size(); ++i)
            {
                out[static_cast<Eigen::Index>(i)] = bars_[i].*field;
            }
            return out;
        }

        std::string symbol_;
        std::vector<PriceBar> bars_;
        std::map<std::string, size_t> date_index_; ///< Date to index map
    };

}
#endif // STOCKBT_DATA_MARKET_DATA_HPP
