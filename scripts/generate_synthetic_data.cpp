/**
 * @file generate_synthetic_data.cpp
 * @brief Generate synthetic daily bars for the stockbt backtester
 *
 * Writes one <symbol>.csv per configured symbol into the configured data
 * directory, in the format CsvDataProvider reads.
 */

#include "data/data_loader.hpp"
#include "data/market_data.hpp"
#include <cstdint>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>

using namespace stockbt;

int main(int argc, char *argv[])
{
    std::cout << "\n=== Synthetic Data Generator ===\n"
              << std::endl;

    std::string config_path = "data/config/backtest_config.json";
    std::string data_dir;
    std::string start_date = "2023-01-02";
    size_t num_days = 520;
    double volatility = 0.02;
    double drift = 0.0005;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if (arg == "--data-dir" && i + 1 < argc)
        {
            data_dir = argv[++i];
        }
        else if (arg == "--days" && i + 1 < argc)
        {
            num_days = static_cast<size_t>(std::stoul(argv[++i]));
        }
        else if (arg == "--volatility" && i + 1 < argc)
        {
            volatility = std::stod(argv[++i]);
        }
        else if (arg == "--drift" && i + 1 < argc)
        {
            drift = std::stod(argv[++i]);
        }
        else if (arg == "--help")
        {
            std::cout << "Usage: " << argv[0] << " [OPTIONS]\n"
                      << "Options:\n"
                      << "  --config PATH      Config listing the symbols (default: data/config/backtest_config.json)\n"
                      << "  --data-dir PATH    Output directory (default: data.data_dir of the config)\n"
                      << "  --days N           Weekdays per symbol (default: 520)\n"
                      << "  --volatility VAL   Daily volatility (default: 0.02)\n"
                      << "  --drift VAL        Daily drift (default: 0.0005)\n"
                      << "  --help             Show this help\n";
            return 0;
        }
    }

    try
    {
        AppConfig config = DataLoader::load_config(config_path);
        if (data_dir.empty())
            data_dir = config.data.data_dir;
        if (data_dir.empty())
            data_dir = "data/market";

        std::cout << "Symbols: " << config.data.symbols.size() << ", " << num_days
                  << " weekdays from " << start_date << std::endl;

        std::uint32_t seed = 42;
        for (const auto &symbol : config.data.symbols)
        {
            SymbolHistory history = DataLoader::generate_synthetic_history(
                symbol, num_days, start_date, seed++, volatility, drift);
            const std::string path = data_dir + "/" + symbol + ".csv";
            DataLoader::save_history_csv(history, path);

            std::cout << std::setw(8) << symbol << "  " << history.front().date << " to "
                      << history.back().date << "  last close " << std::fixed
                      << std::setprecision(2) << history.back().close << "  -> " << path << "\n";
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\nData generation complete. You can now run:\n"
              << "  ./build/stockbt --config " << config_path << " --verbose\n"
              << std::endl;
    return 0;
}
