/**
 * @file data_loader.hpp
 * @brief Data loading and parsing utilities
 *
 * Provides functionality to load daily bar histories from CSV files and
 * configuration from JSON files.
 */

#ifndef STOCKBT_DATA_DATA_LOADER_HPP
#define STOCKBT_DATA_DATA_LOADER_HPP

#include "market_data.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <cstdint>


namespace stockbt {

/**
 * @struct DataConfig
 * @brief Configuration parameters for data loading
 */
struct DataConfig {
    std::string data_dir;                      ///< Directory holding <symbol>.csv files
    std::vector<std::string> symbols;          ///< Symbols to test (pool in portfolio mode)
    std::string start_date;                    ///< First simulated date
    std::string end_date;                      ///< Last simulated date

    /**
     * @brief Load from JSON object
     */
    static DataConfig from_json(const nlohmann::json& j);
};

/**
 * @struct BacktestConfig
 * @brief Configuration for backtesting parameters
 *
 * Nested sections are kept as raw JSON and parsed by the backtest layer
 * (TransactionCostConfig::from_json, StrategyRules::from_json,
 * IndicatorConfig::from_json).
 */
struct BacktestConfig {
    double initial_capital;                    ///< Starting capital
    int max_positions;                         ///< Slot cap in portfolio mode
    int lookback_days;                         ///< Calendar days of warm-up history
    int min_history;                           ///< Minimum bars required per symbol
    nlohmann::json transaction_costs;          ///< Fee model section
    nlohmann::json strategy;                   ///< Decision thresholds section
    nlohmann::json indicators;                 ///< Indicator window lengths

    static BacktestConfig from_json(const nlohmann::json& j);
};

/**
 * @struct AppConfig
 * @brief Complete application configuration
 */
struct AppConfig {
    DataConfig data;
    BacktestConfig backtest;

    AppConfig();

    /**
     * @brief Load complete configuration from JSON file
     */
    static AppConfig load_from_file(const std::string& config_path);
};

/**
 * @class DataLoader
 * @brief Loads and parses bar histories from CSV files
 *
 * Expected format (header required, column order fixed):
 * date,open,high,low,close,volume
 * 2024-01-02,1685.01,1695.00,1671.00,1685.01,32155
 *
 * Dates may be written as YYYY-MM-DD or YYYYMMDD.
 */
class DataLoader {
public:
    DataLoader() = default;
    ~DataLoader() = default;

    // ========================================================================
    // CSV Loading Methods
    // ========================================================================

    /**
     * @brief Load one symbol's history from CSV
     * @param filepath Path to CSV file
     * @param symbol Symbol to attach to the history
     * @return SymbolHistory sorted by date
     * @throws std::runtime_error if file cannot be loaded or a row is malformed
     */
    static SymbolHistory load_history_csv(const std::string& filepath,
                                          const std::string& symbol);

    // ========================================================================
    // Configuration Loading
    // ========================================================================

    /**
     * @brief Load JSON configuration file
     * @param filepath Path to JSON config file
     * @return JSON object
     * @throws std::runtime_error if file cannot be loaded
     */
    static nlohmann::json load_json(const std::string& filepath);

    /**
     * @brief Load complete application configuration
     * @param config_path Path to config JSON file
     * @return AppConfig struct
     */
    static AppConfig load_config(const std::string& config_path);

    // ========================================================================
    // Data Generation (for testing)
    // ========================================================================

    /**
     * @brief Generate a synthetic weekday-only bar history
     * @param symbol Symbol identifier
     * @param num_days Number of trading days
     * @param start_date Starting date (weekends are skipped)
     * @param seed Random seed (fixed seed gives identical output)
     * @param volatility Daily volatility (default 0.02)
     * @param drift Daily drift (default 0.0005)
     * @return SymbolHistory with synthetic OHLCV bars
     */
    static SymbolHistory generate_synthetic_history(
        const std::string& symbol,
        size_t num_days,
        const std::string& start_date = "2020-01-01",
        std::uint32_t seed = 42,
        double volatility = 0.02,
        double drift = 0.0005
    );

    // ========================================================================
    // Export Methods
    // ========================================================================

    /**
     * @brief Save a history to CSV in the format read by load_history_csv
     * @param history SymbolHistory object
     * @param filepath Output file path
     */
    static void save_history_csv(const SymbolHistory& history, const std::string& filepath);

private:
    // ========================
    // Private Helper Methods
    // ========================

    static std::vector<std::string> parse_csv_line(const std::string& line);
    static std::string trim(const std::string& str);

    /**
     * @brief Convert string to double safely
     * @return Double value, or NaN if conversion fails
     */
    static double safe_stod(const std::string& str);
};

} // namespace stockbt

#endif // STOCKBT_DATA_DATA_LOADER_HPP
