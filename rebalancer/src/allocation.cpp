#include "allocation.hpp"
#include "errors.hpp"
#include "types.hpp"

const Decimal Allocation::kSumTolerance = Decimal::from_string("0.000000001");

Allocation::Allocation(const std::vector<std::pair<std::string, Decimal>>& weights) {
    // 1. Normalize and reject duplicates
    for (const auto& [ticker, weight] : weights) {
        std::string key = normalize_ticker(ticker);
        if (!weights_.emplace(key, weight).second) {
            throw DuplicateTickerError("Duplicate ticker in allocation: " + key);
        }
    }

    // 2. Each weight must be a fraction of the whole
    Decimal total;
    for (const auto& [ticker, weight] : weights_) {
        if (weight.is_negative() || weight > Decimal(1)) {
            throw InvalidWeightError(
                "Allocation for " + ticker + " must be between 0 and 1, got " + weight.to_string());
        }
        total += weight;
    }

    // 3. Weights must cover exactly the whole portfolio
    if ((total - Decimal(1)).abs() > kSumTolerance) {
        throw AllocationSumError("Allocation must sum to 1, got " + total.to_string());
    }
}

bool Allocation::contains(const std::string& ticker) const {
    return weights_.count(ticker) > 0;
}

Decimal Allocation::weight(const std::string& ticker) const {
    auto it = weights_.find(ticker);
    if (it == weights_.end()) {
        return Decimal();
    }
    return it->second;
}
