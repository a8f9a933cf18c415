/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader class and configuration structures
 */

#include "data/data_loader.hpp"
#include "data/date_utils.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <random>
#include <iomanip>
#include <limits>
#include <cmath>
#include <filesystem>

namespace stockbt
{

    // =============================================
    // Configuration Structures - from_json Methods
    // =============================================

    DataConfig DataConfig::from_json(const nlohmann::json &j)
    {
        DataConfig config;
        config.data_dir = j.value("data_dir", "data/market");
        config.symbols = j.value("symbols", std::vector<std::string>{});
        config.start_date = j.value("start_date", "");
        config.end_date = j.value("end_date", "");
        return config;
    }

    BacktestConfig BacktestConfig::from_json(const nlohmann::json &j)
    {
        BacktestConfig config;
        config.initial_capital = j.value("initial_capital", 100000.0);
        config.max_positions = j.value("max_positions", 3);
        config.lookback_days = j.value("lookback_days", 150);
        config.min_history = j.value("min_history", 60);

        if (j.contains("transaction_costs"))
        {
            config.transaction_costs = j["transaction_costs"];
        }
        else
        {
            config.transaction_costs = nlohmann::json::object();
        }

        if (j.contains("strategy"))
        {
            config.strategy = j["strategy"];
        }
        else
        {
            config.strategy = nlohmann::json::object();
        }

        config.indicators = j.contains("indicators") ? j["indicators"] : nlohmann::json::object();

        return config;
    }

    AppConfig::AppConfig()
        : data(DataConfig::from_json(nlohmann::json::object())),
          backtest(BacktestConfig::from_json(nlohmann::json::object()))
    {
    }

    AppConfig AppConfig::load_from_file(const std::string &config_path)
    {
        return DataLoader::load_config(config_path);
    }

    // ===========================
    // CSV Loading
    // ===========================

    SymbolHistory DataLoader::load_history_csv(const std::string &filepath,
                                               const std::string &symbol)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        auto header = parse_csv_line(line);
        for (auto &h : header)
        {
            h = trim(h);
        }
        const std::vector<std::string> expected = {"date", "open", "high", "low", "close", "volume"};
        if (header.size() < expected.size() ||
            !std::equal(expected.begin(), expected.end(), header.begin()))
        {
            throw std::runtime_error("CSV header must be 'date,open,high,low,close,volume': " + filepath);
        }

        std::vector<PriceBar> bars;
        int line_no = 1;
        while (std::getline(file, line))
        {
            ++line_no;
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            if (fields.size() < expected.size())
            {
                throw std::runtime_error("Malformed row at line " + std::to_string(line_no) + " of " + filepath);
            }

            PriceBar bar;
            bar.date = dates::normalize(trim(fields[0]));
            bar.open = safe_stod(fields[1]);
            bar.high = safe_stod(fields[2]);
            bar.low = safe_stod(fields[3]);
            bar.close = safe_stod(fields[4]);
            bar.volume = safe_stod(fields[5]);

            if (std::isnan(bar.close))
            {
                throw std::runtime_error("Missing close at line " + std::to_string(line_no) + " of " + filepath);
            }
            bars.push_back(bar);
        }

        std::sort(bars.begin(), bars.end(), [](const PriceBar &a, const PriceBar &b)
                  { return a.date < b.date; });

        return SymbolHistory(symbol, bars);
    }

    // ===========================
    // Configuration Loading
    // ===========================

    nlohmann::json DataLoader::load_json(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + filepath);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
        }

        file.close();
        return j;
    }

    AppConfig DataLoader::load_config(const std::string &config_path)
    {
        auto j = load_json(config_path);

        AppConfig config;

        if (j.contains("data"))
        {
            config.data = DataConfig::from_json(j["data"]);
        }

        if (j.contains("backtest"))
        {
            config.backtest = BacktestConfig::from_json(j["backtest"]);
        }

        return config;
    }

    // ===========================
    // Synthetic Data Generation
    // ===========================

    SymbolHistory DataLoader::generate_synthetic_history(
        const std::string &symbol,
        size_t num_days,
        const std::string &start_date,
        std::uint32_t seed,
        double volatility,
        double drift)
    {
        std::mt19937 gen(seed);
        std::normal_distribution<double> dist(drift, volatility);
        std::uniform_real_distribution<double> range(0.0, volatility);
        std::lognormal_distribution<double> vol_dist(std::log(1.0e6), 0.3);

        std::vector<PriceBar> bars;
        bars.reserve(num_days);

        std::string date = start_date;
        double prev_close = 100.0;

        // Generate prices (geometric Brownian motion), weekdays only
        while (bars.size() < num_days)
        {
            if (dates::day_of_week(date) < 5)
            {
                PriceBar bar;
                bar.date = date;
                bar.open = prev_close;
                bar.close = bars.empty() ? prev_close : prev_close * (1.0 + dist(gen));
                bar.high = std::max(bar.open, bar.close) * (1.0 + range(gen));
                bar.low = std::min(bar.open, bar.close) * (1.0 - range(gen));
                bar.volume = std::floor(vol_dist(gen));
                bars.push_back(bar);
                prev_close = bar.close;
            }
            date = dates::add_days(date, 1);
        }

        return SymbolHistory(symbol, bars);
    }

    // ==================
    // Export Methods
    // ==================

    void DataLoader::save_history_csv(const SymbolHistory &history, const std::string &filepath)
    {
        std::filesystem::path path(filepath);
        if (path.has_parent_path())
        {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        file << "date,open,high,low,close,volume\n";
        file << std::fixed << std::setprecision(6);
        for (const auto &b : history.bars())
        {
            file << b.date << "," << b.open << "," << b.high << "," << b.low << ","
                 << b.close << "," << b.volume << "\n";
        }

        file.close();
    }

    // =======================
    // Private Helper Methods
    // =======================

    std::vector<std::string> DataLoader::parse_csv_line(const std::string &line)
    {
        std::vector<std::string> tokens;
        std::string token;
        bool in_quotes = false;

        for (char c : line)
        {
            if (c == '"')
            {
                in_quotes = !in_quotes;
            }
            else if (c == ',' && !in_quotes)
            {
                tokens.push_back(token);
                token.clear();
            }
            else
            {
                token += c;
            }
        }

        tokens.push_back(token);
        return tokens;
    }

    std::string DataLoader::trim(const std::string &str)
    {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";

        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    double DataLoader::safe_stod(const std::string &str)
    {
        std::string trimmed = trim(str);
        if (trimmed.empty() || trimmed == "nan" || trimmed == "NaN")
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
        try
        {
            return std::stod(trimmed);
        }
        catch (const std::logic_error &)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
    }

} // namespace stockbt
