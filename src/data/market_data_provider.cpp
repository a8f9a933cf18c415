/**
 * @file market_data_provider.cpp
 * @brief Implementation of the in-memory and CSV market data providers
 */

#include "data/market_data_provider.hpp"
#include "data/data_loader.hpp"

#include <filesystem>
#include <iostream>

namespace stockbt
{

    // ============================================================================
    // InMemoryDataProvider
    // ============================================================================

    void InMemoryDataProvider::add_history(const SymbolHistory &history)
    {
        histories_[history.symbol()] = history;
    }

    std::optional<SymbolHistory> InMemoryDataProvider::get_history(const std::string &symbol,
                                                                   const std::string &start_date) const
    {
        auto it = histories_.find(symbol);
        if (it == histories_.end())
            return std::nullopt;

        SymbolHistory filtered = it->second.filter_by_date(start_date, "");
        if (filtered.empty())
            return std::nullopt;
        return filtered;
    }

    // ============================================================================
    // CsvDataProvider
    // ============================================================================

    CsvDataProvider::CsvDataProvider(const std::string &data_dir) : data_dir_(data_dir)
    {
        if (data_dir_.empty())
        {
            throw std::invalid_argument("data_dir must not be empty");
        }
    }

    std::string CsvDataProvider::path_for(const std::string &symbol) const
    {
        return (std::filesystem::path(data_dir_) / (symbol + ".csv")).string();
    }

    std::optional<SymbolHistory> CsvDataProvider::get_history(const std::string &symbol,
                                                              const std::string &start_date) const
    {
        const std::string path = path_for(symbol);
        if (!std::filesystem::exists(path))
        {
            std::cerr << "Warning: no data file for " << symbol << " at " << path << "\n";
            return std::nullopt;
        }

        try
        {
            SymbolHistory history = DataLoader::load_history_csv(path, symbol);
            SymbolHistory filtered = history.filter_by_date(start_date, "");
            if (filtered.empty())
                return std::nullopt;
            return filtered;
        }
        catch (const std::exception &e)
        {
            std::cerr << "Warning: failed to load " << path << ": " << e.what() << "\n";
            return std::nullopt;
        }
    }

} // namespace stockbt
