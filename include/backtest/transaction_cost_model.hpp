// transaction_cost_model.hpp
#pragma once

#include <cmath>
#include <string>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace stockbt {
namespace backtest {

// Fees charged on one execution. Tax (stamp duty) is only levied on sells.
struct TradeCost {
    double commission{0.0};
    double tax{0.0};
    double total() const { return commission + tax; }
};

struct TransactionCostConfig {
    double commission_rate{0.0003};
    double min_commission{5.0};
    double stamp_duty_rate{0.001};

    static TransactionCostConfig from_json(const nlohmann::json& j);
    static TransactionCostConfig default_config();
    static TransactionCostConfig zero_fees();
};

class TransactionCostModel {
public:
    explicit TransactionCostModel(const TransactionCostConfig& config);
    TransactionCostModel();
    ~TransactionCostModel() = default;

    // max(amount * commission_rate, min_commission)
    double commission(double amount) const;
    // amount * stamp_duty_rate
    double tax(double amount) const;

    TradeCost buy_cost(double amount) const;
    TradeCost sell_cost(double amount) const;

    const TransactionCostConfig& config() const { return config_; }
    std::string get_name() const { return "TransactionCostModel"; }

private:
    TransactionCostConfig config_;
    void validate_config() const;
};

} // namespace backtest
} // namespace stockbt
