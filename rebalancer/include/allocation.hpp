#pragma once

#include "decimal.hpp"
#include <map>
#include <string>
#include <utility>
#include <vector>

// Target weight per ticker, validated once on construction: uppercase unique
// tickers, weights in [0, 1] summing to 1 within kSumTolerance.
class Allocation {
public:
    // |sum - 1| allowed for input parsed from decimal text
    static const Decimal kSumTolerance;

    explicit Allocation(const std::vector<std::pair<std::string, Decimal>>& weights);

    const std::map<std::string, Decimal>& weights() const { return weights_; }

    bool contains(const std::string& ticker) const;

    // Weight of a normalized ticker, 0 when it is not allocated
    Decimal weight(const std::string& ticker) const;

    std::size_t size() const { return weights_.size(); }

    bool operator==(const Allocation& other) const { return weights_ == other.weights_; }

private:
    std::map<std::string, Decimal> weights_;
};
