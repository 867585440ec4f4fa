#include "rebalance_result.hpp"

#include <utility>

RebalanceResult::RebalanceResult(std::vector<Trade> trades, std::vector<std::string> warnings)
    : trades_(std::move(trades)), warnings_(std::move(warnings)) {
    for (const auto& trade : trades_) {
        if (trade.action == TradeAction::BUY) {
            total_buy_value_ += trade.value;
        } else {
            total_sell_value_ += trade.value;
        }
    }
}

void to_json(nlohmann::json& j, const RebalanceResult& result) {
    j = nlohmann::json{
        {"trades", result.trades()},
        {"warnings", result.warnings()},
        {"total_buy_value", result.total_buy_value()},
        {"total_sell_value", result.total_sell_value()},
        {"net_cash_flow", result.net_cash_flow()},
        {"is_balanced", result.is_balanced()}
    };
}
