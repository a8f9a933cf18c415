/**
 * @file market_data_provider.hpp
 * @brief Abstract source of daily bar histories
 *
 * The replay loop never performs I/O: every history it needs is requested
 * once through this interface before the first simulated day.
 */

#pragma once

#include "data/market_data.hpp"
#include <map>
#include <optional>
#include <string>

namespace stockbt
{

    /**
     * @class MarketDataProvider
     * @brief Abstract base class for market data sources
     *
     * Usage Example:
     * @code
     * CsvDataProvider provider("data/market");
     * auto history = provider.get_history("600519", "2023-08-04");
     * if (!history) { ... }
     * @endcode
     */
    class MarketDataProvider
    {
    public:
        virtual ~MarketDataProvider() = default;

        /**
         * @brief Fetch bars for a symbol from start_date (inclusive) onward.
         * @param symbol Symbol identifier
         * @param start_date First date wanted (YYYY-MM-DD)
         * @return Ascending history, or std::nullopt when the source has no
         *         usable data for the symbol
         */
        virtual std::optional<SymbolHistory> get_history(const std::string &symbol,
                                                         const std::string &start_date) const = 0;

        virtual std::string get_name() const = 0;
    };

    /**
     * @class InMemoryDataProvider
     * @brief Serves histories registered up front. Used by tests and the
     *        synthetic data path.
     */
    class InMemoryDataProvider : public MarketDataProvider
    {
    public:
        InMemoryDataProvider() = default;

        void add_history(const SymbolHistory &history);

        std::optional<SymbolHistory> get_history(const std::string &symbol,
                                                 const std::string &start_date) const override;

        std::string get_name() const override { return "InMemoryDataProvider"; }

    private:
        std::map<std::string, SymbolHistory> histories_;
    };

    /**
     * @class CsvDataProvider
     * @brief Reads `<data_dir>/<symbol>.csv` files.
     *
     * Expected format:
     * date,open,high,low,close,volume
     * 2024-01-02,1685.01,1695.00,1671.00,1685.01,32155
     *
     * Unreadable or malformed files are reported on std::cerr and yield
     * std::nullopt rather than an exception, so one bad symbol does not
     * abort a portfolio run.
     */
    class CsvDataProvider : public MarketDataProvider
    {
    public:
        explicit CsvDataProvider(const std::string &data_dir);

        std::optional<SymbolHistory> get_history(const std::string &symbol,
                                                 const std::string &start_date) const override;

        std::string get_name() const override { return "CsvDataProvider"; }

        const std::string &data_dir() const { return data_dir_; }

        std::string path_for(const std::string &symbol) const;

    private:
        std::string data_dir_;
    };

} // namespace stockbt
