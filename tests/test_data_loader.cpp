/**
 * @file test_data_loader.cpp
 * @brief Unit tests for DataLoader, SymbolHistory and the data providers
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "data/data_loader.hpp"
#include "data/market_data.hpp"
#include "data/market_data_provider.hpp"
#include "data/date_utils.hpp"
#include <filesystem>
#include <fstream>

using namespace stockbt;
using Catch::Matchers::WithinAbs;

namespace {

std::string temp_path(const std::string& name) {
    return (std::filesystem::temp_directory_path() / ("stockbt_" + name)).string();
}

void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

} // namespace

TEST_CASE("SymbolHistory construction", "[SymbolHistory]") {
    std::vector<PriceBar> bars = {
        {"2024-01-02", 10.0, 10.5, 9.8, 10.2, 1000.0},
        {"2024-01-03", 10.2, 10.8, 10.1, 10.6, 1500.0},
        {"2024-01-04", 10.6, 10.7, 10.0, 10.1, 1200.0},
    };

    SECTION("Accessors") {
        SymbolHistory h("AAA", bars);
        REQUIRE(h.symbol() == "AAA");
        REQUIRE(h.size() == 3);
        REQUIRE(h.find_date_index("2024-01-03") == 1);
        REQUIRE(h.find_date_index("2024-01-05") == -1);
        REQUIRE_THAT(h.closes()[2], WithinAbs(10.1, 1e-12));
        REQUIRE_THAT(h.volumes()[1], WithinAbs(1500.0, 1e-12));
    }

    SECTION("Date filtering is inclusive") {
        SymbolHistory h("AAA", bars);
        auto f = h.filter_by_date("2024-01-03", "2024-01-04");
        REQUIRE(f.size() == 2);
        REQUIRE(f.front().date == "2024-01-03");
        REQUIRE(h.filter_by_date("2024-01-03", "").size() == 2);
    }

    SECTION("Error: unordered dates") {
        std::swap(bars[0], bars[1]);
        REQUIRE_THROWS_AS(SymbolHistory("AAA", bars), std::invalid_argument);
    }

    SECTION("Error: non-positive close") {
        bars[1].close = 0.0;
        REQUIRE_THROWS_AS(SymbolHistory("AAA", bars), std::invalid_argument);
    }
}

TEST_CASE("CSV loading", "[DataLoader]") {
    SECTION("Compact dates are normalized and rows sorted") {
        const std::string path = temp_path("compact.csv");
        write_file(path,
                   "date,open,high,low,close,volume\n"
                   "20240103,10.2,10.8,10.1,10.6,1500\n"
                   "20240102,10.0,10.5,9.8,10.2,1000\n");

        SymbolHistory h = DataLoader::load_history_csv(path, "600519");
        REQUIRE(h.size() == 2);
        REQUIRE(h.front().date == "2024-01-02");
        REQUIRE(h.back().date == "2024-01-03");
        REQUIRE_THAT(h.back().close, WithinAbs(10.6, 1e-12));
        std::filesystem::remove(path);
    }

    SECTION("Save and reload") {
        SymbolHistory original = DataLoader::generate_synthetic_history("SYN", 30, "2024-01-01", 7);
        const std::string path = temp_path("roundtrip/SYN.csv");
        DataLoader::save_history_csv(original, path);

        SymbolHistory loaded = DataLoader::load_history_csv(path, "SYN");
        REQUIRE(loaded.size() == original.size());
        REQUIRE(loaded.dates() == original.dates());
        REQUIRE_THAT(loaded.back().close, WithinAbs(original.back().close, 1e-5));
        std::filesystem::remove_all(temp_path("roundtrip"));
    }

    SECTION("Error: wrong header") {
        const std::string path = temp_path("bad_header.csv");
        write_file(path, "day,price\n2024-01-02,10\n");
        REQUIRE_THROWS_AS(DataLoader::load_history_csv(path, "X"), std::runtime_error);
        std::filesystem::remove(path);
    }

    SECTION("Error: missing file") {
        REQUIRE_THROWS_AS(DataLoader::load_history_csv(temp_path("does_not_exist.csv"), "X"),
                          std::runtime_error);
    }
}

TEST_CASE("Synthetic history", "[DataLoader]") {
    auto a = DataLoader::generate_synthetic_history("S", 50, "2024-01-01", 42);
    auto b = DataLoader::generate_synthetic_history("S", 50, "2024-01-01", 42);

    REQUIRE(a.size() == 50);
    REQUIRE(a.dates() == b.dates());
    REQUIRE(a.closes().isApprox(b.closes()));

    for (const auto& bar : a.bars()) {
        REQUIRE(dates::day_of_week(bar.date) < 5);
        REQUIRE(bar.high >= bar.low);
    }
}

TEST_CASE("Configuration loading", "[DataLoader]") {
    const std::string path = temp_path("config.json");
    write_file(path, R"({
        "data": {
            "data_dir": "data/market",
            "symbols": ["600519", "000858"],
            "start_date": "2024-01-01",
            "end_date": "2024-06-30"
        },
        "backtest": {
            "initial_capital": 50000,
            "max_positions": 2,
            "transaction_costs": { "commission_rate": 0.0005 },
            "strategy": { "exit_score": 40 }
        }
    })");

    AppConfig cfg = DataLoader::load_config(path);
    REQUIRE(cfg.data.symbols.size() == 2);
    REQUIRE(cfg.data.start_date == "2024-01-01");
    REQUIRE(cfg.backtest.initial_capital == 50000.0);
    REQUIRE(cfg.backtest.max_positions == 2);
    REQUIRE(cfg.backtest.lookback_days == 150);
    REQUIRE(cfg.backtest.min_history == 60);
    REQUIRE(cfg.backtest.transaction_costs["commission_rate"].get<double>() == 0.0005);
    REQUIRE(cfg.backtest.strategy["exit_score"].get<int>() == 40);
    std::filesystem::remove(path);

    SECTION("Defaults without a file") {
        AppConfig defaults;
        REQUIRE(defaults.data.data_dir == "data/market");
        REQUIRE(defaults.backtest.initial_capital == 100000.0);
        REQUIRE(defaults.backtest.max_positions == 3);
    }

    SECTION("Error: malformed JSON") {
        const std::string bad = temp_path("bad.json");
        write_file(bad, "{ not json");
        REQUIRE_THROWS_AS(DataLoader::load_config(bad), std::runtime_error);
        std::filesystem::remove(bad);
    }
}

TEST_CASE("Market data providers", "[MarketDataProvider]") {
    SECTION("In-memory provider filters by start date") {
        InMemoryDataProvider provider;
        provider.add_history(DataLoader::generate_synthetic_history("AAA", 20, "2024-01-01"));

        auto all = provider.get_history("AAA", "2023-01-01");
        REQUIRE(all.has_value());
        REQUIRE(all->size() == 20);

        auto later = provider.get_history("AAA", "2024-01-15");
        REQUIRE(later.has_value());
        REQUIRE(later->front().date >= "2024-01-15");

        REQUIRE_FALSE(provider.get_history("ZZZ", "2024-01-01").has_value());
        REQUIRE_FALSE(provider.get_history("AAA", "2030-01-01").has_value());
    }

    SECTION("CSV provider reads <dir>/<symbol>.csv") {
        const std::string dir = temp_path("csv_provider");
        SymbolHistory h = DataLoader::generate_synthetic_history("BBB", 10, "2024-01-01");
        DataLoader::save_history_csv(h, dir + "/BBB.csv");

        CsvDataProvider provider(dir);
        auto loaded = provider.get_history("BBB", "2024-01-01");
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->size() == 10);
        REQUIRE(loaded->symbol() == "BBB");

        REQUIRE_FALSE(provider.get_history("MISSING", "2024-01-01").has_value());
        std::filesystem::remove_all(dir);
    }

    SECTION("Error: empty data dir") {
        REQUIRE_THROWS_AS(CsvDataProvider(""), std::invalid_argument);
    }
}
