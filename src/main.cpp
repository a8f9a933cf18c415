/**
 * @file main.cpp
 * @brief Main entry point for the stockbt backtester
 *
 * Command-line application that loads configuration and daily bars, runs a
 * single-symbol or portfolio backtest, prints the performance report and
 * exports trades, equity curve and metrics.
 */

#include "data/data_loader.hpp"
#include "data/market_data_provider.hpp"
#include "backtest/backtest_engine.hpp"
#include "analytics/performance_metrics.hpp"
#include <iostream>
#include <sstream>
#include <string>
#include <exception>
#include <iomanip>
#include <chrono>
#include <filesystem>

using namespace stockbt;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "stockbt - daily stock strategy backtester v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file\n"
              << "  --symbol CODE         Run a single-symbol backtest on CODE\n"
              << "  --pool A,B,C          Run a portfolio backtest over the listed symbols\n"
              << "  --max-pos N           Maximum concurrent positions in portfolio mode\n"
              << "  --start YYYY-MM-DD    First simulated date\n"
              << "  --end YYYY-MM-DD      Last simulated date\n"
              << "  --capital X           Initial capital\n"
              << "  --data-dir PATH       Directory with <symbol>.csv files\n"
              << "  --output PATH         Path to output directory (default: results/)\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config data/config/backtest_config.json --symbol 600519 --verbose\n"
              << "  " << program_name << " --data-dir data/market --pool 600519,000858,300750 --start 2024-01-01\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       stockbt v1.0.0                                           \n"
              << "       Deterministic daily strategy backtesting                 \n"
              << "================================================================\n"
              << std::endl;
}

std::vector<std::string> split_symbols(const std::string &list)
{
    std::vector<std::string> out;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ','))
    {
        if (!item.empty())
            out.push_back(item);
    }
    return out;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string symbol;
    std::vector<std::string> pool;
    int max_positions = 0;      // 0: take from config
    std::string start_date;
    std::string end_date;
    double capital = 0.0;       // 0: take from config
    std::string data_dir;
    std::string output_dir = "results";
    bool verbose = false;
    bool show_help = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--symbol" && i + 1 < argc)
            {
                args.symbol = argv[++i];
            }
            else if (arg == "--pool" && i + 1 < argc)
            {
                args.pool = split_symbols(argv[++i]);
            }
            else if (arg == "--max-pos" && i + 1 < argc)
            {
                args.max_positions = std::stoi(argv[++i]);
            }
            else if (arg == "--start" && i + 1 < argc)
            {
                args.start_date = argv[++i];
            }
            else if (arg == "--end" && i + 1 < argc)
            {
                args.end_date = argv[++i];
            }
            else if (arg == "--capital" && i + 1 < argc)
            {
                args.capital = std::stod(argv[++i]);
            }
            else if (arg == "--data-dir" && i + 1 < argc)
            {
                args.data_dir = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_dir = argv[++i];
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        return !show_help && (!config_path.empty() || !symbol.empty() || !pool.empty());
    }
};

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/4] Loading configuration..." << std::endl;

        AppConfig config = args.config_path.empty() ? AppConfig() : DataLoader::load_config(args.config_path);

        if (!args.data_dir.empty())
            config.data.data_dir = args.data_dir;
        if (!args.start_date.empty())
            config.data.start_date = args.start_date;
        if (!args.end_date.empty())
            config.data.end_date = args.end_date;
        if (args.capital > 0.0)
            config.backtest.initial_capital = args.capital;
        if (args.max_positions > 0)
            config.backtest.max_positions = args.max_positions;

        const bool portfolio_mode = !args.pool.empty() || (args.symbol.empty() && config.data.symbols.size() > 1);
        std::vector<std::string> symbols;
        if (!args.pool.empty())
            symbols = args.pool;
        else if (!args.symbol.empty())
            symbols = {args.symbol};
        else
            symbols = config.data.symbols;

        if (symbols.empty())
        {
            throw std::invalid_argument("No symbols given (use --symbol, --pool or data.symbols)");
        }
        if (config.data.start_date.empty())
        {
            throw std::invalid_argument("No start date given (use --start or data.start_date)");
        }

        backtest::BacktestParams params = backtest::BacktestParams::from_config(config);
        params.verbose = args.verbose;

        if (args.verbose)
        {
            std::cout << "  - Mode: " << (portfolio_mode ? "portfolio" : "single") << "\n";
            std::cout << "  - Symbols: ";
            for (const auto &s : symbols)
            {
                std::cout << s << " ";
            }
            std::cout << "\n  - Date range: " << config.data.start_date
                      << " to " << (config.data.end_date.empty() ? "last bar" : config.data.end_date) << "\n";
            std::cout << "  - Data dir: " << config.data.data_dir << "\n";
            std::cout << "  - Initial capital: " << std::fixed << std::setprecision(2)
                      << params.initial_capital << "\n";
        }

        // ====================================================================
        // 2. Run Backtest
        // ====================================================================
        std::cout << "[2/4] Running backtest..." << std::endl;

        CsvDataProvider provider(config.data.data_dir);
        backtest::BacktestEngine engine(params, provider);

        backtest::BacktestResult result = portfolio_mode
                                              ? engine.run_portfolio(symbols, config.data.start_date, config.data.end_date)
                                              : engine.run(symbols.front(), config.data.start_date, config.data.end_date);

        if (!result.success)
        {
            std::cerr << "\nBacktest did not run: " << result.message << std::endl;
            return 1;
        }

        // ====================================================================
        // 3. Report
        // ====================================================================
        std::cout << "[3/4] Computing performance metrics..." << std::endl;

        analytics::PerformanceMetrics metrics = result.compute_analytics();
        metrics.print_report();

        // ====================================================================
        // 4. Export
        // ====================================================================
        std::cout << "[4/4] Exporting results..." << std::endl;

        std::filesystem::create_directories(args.output_dir);
        const std::string trades_file = args.output_dir + "/trades.csv";
        const std::string equity_file = args.output_dir + "/equity.csv";
        const std::string metrics_file = args.output_dir + "/performance.json";

        result.export_trades_to_csv(trades_file);
        result.export_equity_to_csv(equity_file);
        metrics.save_json(metrics_file);

        std::cout << "  Trades exported to:  " << trades_file << "\n";
        std::cout << "  Equity exported to:  " << equity_file << "\n";
        std::cout << "  Metrics exported to: " << metrics_file << "\n";

        // ====================================================================
        // Summary
        // ====================================================================
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Backtest completed successfully in "
                  << duration << " ms\n";
        std::cout << "================================================================\n"
                  << std::endl;

        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    // Parse command-line arguments
    CommandLineArgs args;
    try
    {
        args = CommandLineArgs::parse(argc, argv);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: invalid argument value: " << e.what() << std::endl;
        return 1;
    }

    // Show help if requested or invalid args
    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    // Print banner
    print_banner();

    // Run backtest
    return run(args);
}
