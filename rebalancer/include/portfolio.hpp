#pragma once

#include "allocation.hpp"
#include "diff_engine.hpp"
#include "rebalance_result.hpp"
#include "types.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

// Holdings, target allocation and idle cash. Tickers are normalized and
// quantities checked on construction; rebalance() never modifies the portfolio.
class Portfolio {
public:
    Portfolio(std::vector<Holding> holdings, Allocation allocation,
              Decimal cash = Decimal(), MarketData market_data = {});

    const std::vector<Holding>& holdings() const { return holdings_; }
    const Allocation& allocation() const { return allocation_; }
    const Decimal& cash() const { return cash_; }
    const MarketData& market_data() const { return market_data_; }

    // Market value of all holdings plus cash
    Decimal total_value() const;

    // Market value / total value per holding, all zero for an empty portfolio
    std::map<std::string, Decimal> current_weights() const;

    const Holding* find_holding(const std::string& ticker) const;

    // Holding price first, then the market data quote
    std::optional<Decimal> price_of(const std::string& ticker) const;

    RebalanceResult rebalance(const Decimal& threshold = Decimal()) const;
    RebalanceResult rebalance(const RebalanceOptions& options) const;

private:
    std::vector<Holding> holdings_;
    Allocation allocation_;
    Decimal cash_;
    MarketData market_data_;
};
