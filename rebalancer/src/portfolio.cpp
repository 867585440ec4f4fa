#include "portfolio.hpp"
#include "errors.hpp"

#include <set>
#include <utility>

namespace {

// Fractional digits of the reported current weights
constexpr unsigned kWeightDecimals = 10;

} // namespace

Portfolio::Portfolio(std::vector<Holding> holdings, Allocation allocation,
                     Decimal cash, MarketData market_data)
    : holdings_(std::move(holdings)),
      allocation_(std::move(allocation)),
      cash_(std::move(cash)) {
    std::set<std::string> seen;
    for (auto& holding : holdings_) {
        holding.stock.ticker = normalize_ticker(holding.stock.ticker);
        if (!seen.insert(holding.stock.ticker).second) {
            throw DuplicateHoldingError("Duplicate holding for ticker: " + holding.stock.ticker);
        }
    }

    for (const auto& holding : holdings_) {
        const std::string& ticker = holding.stock.ticker;
        if (holding.shares.is_negative()) {
            throw NegativeSharesError(
                "Shares cannot be negative for " + ticker + ", got " + holding.shares.to_string());
        }
        if (holding.stock.price.is_negative()) {
            throw NegativePriceError(
                "Price cannot be negative for " + ticker + ", got " + holding.stock.price.to_string());
        }
    }

    if (cash_.is_negative()) {
        throw NegativeCashError("Cash cannot be negative, got " + cash_.to_string());
    }

    for (const auto& [ticker, price] : market_data.prices) {
        std::string key = normalize_ticker(ticker);
        if (price.is_negative()) {
            throw NegativePriceError(
                "Price cannot be negative for " + key + ", got " + price.to_string());
        }
        if (!market_data_.prices.emplace(key, price).second) {
            throw DuplicateTickerError("Duplicate quote for ticker: " + key);
        }
    }
}

Decimal Portfolio::total_value() const {
    Decimal total = cash_;
    for (const auto& holding : holdings_) {
        total += holding.market_value();
    }
    return total;
}

std::map<std::string, Decimal> Portfolio::current_weights() const {
    std::map<std::string, Decimal> weights;
    Decimal total = total_value();
    for (const auto& holding : holdings_) {
        weights[holding.stock.ticker] =
            total.is_zero() ? Decimal() : holding.market_value().divide(total, kWeightDecimals);
    }
    return weights;
}

const Holding* Portfolio::find_holding(const std::string& ticker) const {
    for (const auto& holding : holdings_) {
        if (holding.stock.ticker == ticker) {
            return &holding;
        }
    }
    return nullptr;
}

std::optional<Decimal> Portfolio::price_of(const std::string& ticker) const {
    if (const Holding* holding = find_holding(ticker)) {
        return holding->stock.price;
    }
    auto it = market_data_.prices.find(ticker);
    if (it != market_data_.prices.end()) {
        return it->second;
    }
    return std::nullopt;
}

RebalanceResult Portfolio::rebalance(const Decimal& threshold) const {
    RebalanceOptions options;
    options.threshold = threshold;
    return rebalance(options);
}

RebalanceResult Portfolio::rebalance(const RebalanceOptions& options) const {
    return DiffEngine::calculate_trades(*this, options);
}
