#pragma once

#include "types.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Trades and warnings from one rebalance, with totals derived once from the trades.
class RebalanceResult {
public:
    RebalanceResult() = default;
    RebalanceResult(std::vector<Trade> trades, std::vector<std::string> warnings);

    const std::vector<Trade>& trades() const { return trades_; }
    const std::vector<std::string>& warnings() const { return warnings_; }

    const Decimal& total_buy_value() const { return total_buy_value_; }
    const Decimal& total_sell_value() const { return total_sell_value_; }

    // Positive = cash surplus (more sells), negative = cash consumed (more buys)
    Decimal net_cash_flow() const { return total_sell_value_ - total_buy_value_; }

    bool is_balanced() const { return trades_.empty(); }

    bool operator==(const RebalanceResult& other) const {
        return trades_ == other.trades_ && warnings_ == other.warnings_;
    }
    bool operator!=(const RebalanceResult& other) const { return !(*this == other); }

private:
    std::vector<Trade> trades_;
    std::vector<std::string> warnings_;
    Decimal total_buy_value_;
    Decimal total_sell_value_;
};

void to_json(nlohmann::json& j, const RebalanceResult& result);
