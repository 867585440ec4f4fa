#include "types.hpp"

#include <algorithm>
#include <cctype>

std::string to_string(TradeAction action) {
    return action == TradeAction::BUY ? "BUY" : "SELL";
}

bool operator==(TradeAction action, const std::string& name) {
    return to_string(action) == name;
}

bool operator==(const std::string& name, TradeAction action) {
    return action == name;
}

bool operator!=(TradeAction action, const std::string& name) {
    return !(action == name);
}

bool operator!=(const std::string& name, TradeAction action) {
    return !(action == name);
}

std::string normalize_ticker(const std::string& ticker) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    auto begin = std::find_if_not(ticker.begin(), ticker.end(), is_space);
    auto end = std::find_if_not(ticker.rbegin(), ticker.rend(), is_space).base();
    if (begin >= end) {
        throw InvalidTickerError("Ticker cannot be empty");
    }

    std::string normalized(begin, end);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return normalized;
}

void to_json(nlohmann::json& j, const Holding& holding) {
    j = nlohmann::json{
        {"ticker", holding.stock.ticker},
        {"price", holding.stock.price},
        {"shares", holding.shares}
    };
}

void from_json(const nlohmann::json& j, Holding& holding) {
    j.at("ticker").get_to(holding.stock.ticker);
    j.at("price").get_to(holding.stock.price);
    j.at("shares").get_to(holding.shares);
}
