#include "safety_check.hpp"

SafetyCheck::Result SafetyCheck::validate(const std::vector<Trade>& trades) {
    bool seen_buy = false;

    for (const auto& trade : trades) {
        // Check 1: Symbol Validity
        if (trade.ticker.empty()) {
            return {false, "Trade ticker cannot be empty."};
        }

        // Check 2: Shares > 0
        if (!trade.shares.is_positive()) {
            return {false, "Trade shares must be positive. Found: " + trade.shares.to_string() + " for ticker: " + trade.ticker};
        }

        // Check 3: Value is an absolute amount
        if (trade.value.is_negative()) {
            return {false, "Trade value cannot be negative. Found: " + trade.value.to_string() + " for ticker: " + trade.ticker};
        }

        // Check 4: Sells before buys
        if (trade.action == TradeAction::BUY) {
            seen_buy = true;
        } else if (seen_buy) {
            return {false, "Sell of " + trade.ticker + " is ordered after a buy."};
        }
    }

    return {true, ""};
}
