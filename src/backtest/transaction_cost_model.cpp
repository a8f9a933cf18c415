#include "backtest/transaction_cost_model.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace stockbt {
namespace backtest {

namespace {

void require_non_negative(double value, const char* name) {
    if (!(value >= 0.0) || !std::isfinite(value)) {
        std::ostringstream ss; ss << value;
        throw std::invalid_argument(std::string("Expected non-negative value for parameter '") + name + "', got: " + ss.str());
    }
}

} // namespace

TransactionCostConfig TransactionCostConfig::default_config() {
    TransactionCostConfig cfg;
    cfg.commission_rate = 0.0003;
    cfg.min_commission = 5.0;
    cfg.stamp_duty_rate = 0.001;
    return cfg;
}

TransactionCostConfig TransactionCostConfig::zero_fees() {
    TransactionCostConfig cfg;
    cfg.commission_rate = 0.0;
    cfg.min_commission = 0.0;
    cfg.stamp_duty_rate = 0.0;
    return cfg;
}

TransactionCostConfig TransactionCostConfig::from_json(const nlohmann::json& j) {
    TransactionCostConfig cfg = default_config();
    if (j.is_object()) {
        cfg.commission_rate = j.value("commission_rate", cfg.commission_rate);
        cfg.min_commission = j.value("min_commission", cfg.min_commission);
        cfg.stamp_duty_rate = j.value("stamp_duty_rate", cfg.stamp_duty_rate);
    }
    return cfg;
}

TransactionCostModel::TransactionCostModel(const TransactionCostConfig& config)
    : config_(config) {
    validate_config();
}

TransactionCostModel::TransactionCostModel()
    : config_(TransactionCostConfig::default_config()) {
}

void TransactionCostModel::validate_config() const {
    require_non_negative(config_.commission_rate, "commission_rate");
    require_non_negative(config_.min_commission, "min_commission");
    require_non_negative(config_.stamp_duty_rate, "stamp_duty_rate");
}

double TransactionCostModel::commission(double amount) const {
    return std::max(std::abs(amount) * config_.commission_rate, config_.min_commission);
}

double TransactionCostModel::tax(double amount) const {
    return std::abs(amount) * config_.stamp_duty_rate;
}

TradeCost TransactionCostModel::buy_cost(double amount) const {
    return TradeCost{commission(amount), 0.0};
}

TradeCost TransactionCostModel::sell_cost(double amount) const {
    return TradeCost{commission(amount), tax(amount)};
}

} // namespace backtest
} // namespace stockbt
