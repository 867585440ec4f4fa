#pragma once

#include "rebalance_result.hpp"
#include "decimal.hpp"
#include <string>

class Portfolio;

struct RebalanceOptions {
    static constexpr unsigned kMaxShareDecimals = 18;

    // Minimum absolute monetary deviation worth trading
    Decimal threshold;
    // Fractional digits kept in share quantities (rounded half-even)
    unsigned share_decimals = 4;
};

class DiffEngine {
public:
    // Calculate the trades that move the portfolio to its target allocation.
    // Sells come first, then buys; ties are broken alphabetically by ticker.
    // Throws InvalidThresholdError or MissingPriceError.
    static RebalanceResult calculate_trades(
        const Portfolio& portfolio,
        const RebalanceOptions& options
    );
};
