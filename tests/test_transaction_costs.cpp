// Unit tests for TransactionCostModel

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "backtest/transaction_cost_model.hpp"

using namespace stockbt::backtest;
using Catch::Matchers::WithinAbs;

TEST_CASE("TransactionCostModel construction", "[TransactionCostModel]") {
    SECTION("Default config") {
        TransactionCostModel m;
        REQUIRE(m.get_name() == "TransactionCostModel");
        REQUIRE(m.config().commission_rate == 0.0003);
        REQUIRE(m.config().min_commission == 5.0);
        REQUIRE(m.config().stamp_duty_rate == 0.001);
    }

    SECTION("From JSON keeps defaults for missing keys") {
        auto cfg = TransactionCostConfig::from_json({{"commission_rate", 0.001}});
        REQUIRE(cfg.commission_rate == 0.001);
        REQUIRE(cfg.min_commission == 5.0);
        REQUIRE(cfg.stamp_duty_rate == 0.001);
    }

    SECTION("Error: negative commission rate") {
        TransactionCostConfig cfg = TransactionCostConfig::default_config();
        cfg.commission_rate = -0.1;
        REQUIRE_THROWS_AS(TransactionCostModel(cfg), std::invalid_argument);
    }

    SECTION("Error: negative stamp duty") {
        TransactionCostConfig cfg = TransactionCostConfig::default_config();
        cfg.stamp_duty_rate = -1.0;
        REQUIRE_THROWS_AS(TransactionCostModel(cfg), std::invalid_argument);
    }
}

TEST_CASE("Commission calculation", "[TransactionCostModel]") {
    TransactionCostModel m;

    SECTION("Minimum commission applies to small trades") {
        REQUIRE_THAT(m.commission(1000.0), WithinAbs(5.0, 1e-12));
        REQUIRE_THAT(m.commission(0.0), WithinAbs(5.0, 1e-12));
    }

    SECTION("Proportional above the floor") {
        // 94,600 * 0.0003 = 28.38
        REQUIRE_THAT(m.commission(94600.0), WithinAbs(28.38, 1e-9));
        REQUIRE_THAT(m.commission(-94600.0), WithinAbs(28.38, 1e-9));
    }
}

TEST_CASE("Buy and sell costs", "[TransactionCostModel]") {
    TransactionCostModel m;

    TradeCost buy = m.buy_cost(50000.0);
    REQUIRE_THAT(buy.commission, WithinAbs(15.0, 1e-9));
    REQUIRE_THAT(buy.tax, WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(buy.total(), WithinAbs(15.0, 1e-9));

    TradeCost sell = m.sell_cost(50000.0);
    REQUIRE_THAT(sell.commission, WithinAbs(15.0, 1e-9));
    REQUIRE_THAT(sell.tax, WithinAbs(50.0, 1e-9));
    REQUIRE_THAT(sell.total(), WithinAbs(65.0, 1e-9));

    SECTION("Zero fees") {
        TransactionCostModel free_model(TransactionCostConfig::zero_fees());
        REQUIRE_THAT(free_model.buy_cost(50000.0).total(), WithinAbs(0.0, 1e-12));
        REQUIRE_THAT(free_model.sell_cost(50000.0).total(), WithinAbs(0.0, 1e-12));
    }
}
