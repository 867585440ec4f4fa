#include "diff_engine.hpp"
#include "errors.hpp"
#include "portfolio.hpp"

#include <algorithm>
#include <set>
#include <string>

RebalanceResult DiffEngine::calculate_trades(
    const Portfolio& portfolio,
    const RebalanceOptions& options
) {
    if (options.threshold.is_negative()) {
        throw InvalidThresholdError("Threshold cannot be negative, got " + options.threshold.to_string());
    }
    if (options.share_decimals > RebalanceOptions::kMaxShareDecimals) {
        throw InvalidNumberError("share_decimals must be at most " +
                                 std::to_string(RebalanceOptions::kMaxShareDecimals) + ", got " +
                                 std::to_string(options.share_decimals));
    }

    const Allocation& allocation = portfolio.allocation();
    std::vector<std::string> warnings;
    std::vector<Trade> trades;

    // 1. Allocated tickers we don't hold become zero-share placeholders
    for (const auto& [ticker, weight] : allocation.weights()) {
        if (portfolio.find_holding(ticker)) {
            continue;
        }
        std::optional<Decimal> price = portfolio.price_of(ticker);
        if (!price && weight.is_positive()) {
            throw MissingPriceError("No price available for allocated ticker: " + ticker);
        }
        warnings.push_back(
            ticker + " is in allocation (weight " + weight.normalized().to_string() +
            ") but not in holdings; treated as a zero-share holding" +
            (price ? " at price " + price->normalized().to_string() : std::string()));
    }

    Decimal total = portfolio.total_value();
    if (total.is_zero()) {
        // Every target is zero: only positions held at zero price are left to sell
        warnings.push_back("Portfolio has zero total value; only liquidations apply");
    }

    // 2. Universe = holdings + allocation, visited in ticker order
    std::set<std::string> universe;
    for (const auto& holding : portfolio.holdings()) {
        universe.insert(holding.stock.ticker);
    }
    for (const auto& [ticker, weight] : allocation.weights()) {
        universe.insert(ticker);
    }

    for (const auto& ticker : universe) {
        const Holding* holding = portfolio.find_holding(ticker);
        std::optional<Decimal> price = portfolio.price_of(ticker);
        if (!price) {
            // Unpriced and unheld, so its weight is zero: nothing to do
            continue;
        }

        Decimal shares = holding ? holding->shares : Decimal();
        Decimal target_value = allocation.weight(ticker) * total;
        Decimal current_value = shares * *price;
        Decimal delta = target_value - current_value;

        bool liquidation = target_value.is_zero() && shares.is_positive();
        if (delta.is_zero() && !liquidation) {
            continue;
        }

        // 3. Threshold is on money, never on share count
        if (delta.abs() < options.threshold) {
            continue;
        }

        if (liquidation) {
            // Sell the exact position, not a rounded quotient
            trades.push_back({ticker, TradeAction::SELL, shares, current_value});
            continue;
        }

        if (price->is_zero()) {
            warnings.push_back("Cannot buy " + ticker + " at a zero price; skipped");
            continue;
        }

        TradeAction action = delta.is_positive() ? TradeAction::BUY : TradeAction::SELL;

        Decimal trade_shares = delta.abs().divide(*price, options.share_decimals);
        if (action == TradeAction::SELL && trade_shares > shares) {
            // Rounding up must never sell more than is held
            trade_shares = shares;
        }
        if (trade_shares.is_zero()) {
            continue;
        }

        trades.push_back({ticker, action, trade_shares, delta.abs()});
    }

    // 4. Sells free the cash that funds the buys
    std::stable_sort(trades.begin(), trades.end(), [](const Trade& a, const Trade& b) {
        int a_rank = a.action == TradeAction::SELL ? 0 : 1;
        int b_rank = b.action == TradeAction::SELL ? 0 : 1;
        if (a_rank != b_rank) {
            return a_rank < b_rank;
        }
        return a.ticker < b.ticker;
    });

    return RebalanceResult(std::move(trades), std::move(warnings));
}
