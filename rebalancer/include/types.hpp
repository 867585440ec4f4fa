#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>

#include "decimal.hpp"
#include "errors.hpp"

enum class TradeAction {
    BUY,
    SELL
};

NLOHMANN_JSON_SERIALIZE_ENUM(TradeAction, {
    {TradeAction::BUY, "BUY"},
    {TradeAction::SELL, "SELL"}
})

std::string to_string(TradeAction action);

// TradeAction::BUY == "BUY"
bool operator==(TradeAction action, const std::string& name);
bool operator==(const std::string& name, TradeAction action);
bool operator!=(TradeAction action, const std::string& name);
bool operator!=(const std::string& name, TradeAction action);

// Trims surrounding whitespace and uppercases. Throws InvalidTickerError when nothing is left.
std::string normalize_ticker(const std::string& ticker);

// Decimals travel as strings so no digit is lost; numbers are accepted on input
namespace nlohmann {
    template <>
    struct adl_serializer<Decimal> {
        static void to_json(json& j, const Decimal& value) {
            j = value.to_string();
        }

        static void from_json(const json& j, Decimal& value) {
            if (j.is_string()) {
                value = to_decimal(j.get<std::string>());
            } else if (j.is_number_unsigned()) {
                value = to_decimal(std::to_string(j.get<std::uint64_t>()));
            } else if (j.is_number_integer()) {
                value = to_decimal(j.get<std::int64_t>());
            } else if (j.is_number_float()) {
                value = to_decimal(j.get<double>());
            } else {
                throw InvalidNumberError("Expected a number or numeric string, got " + j.dump());
            }
        }
    };
}

struct Stock {
    std::string ticker;
    Decimal price;

    // Serialization
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Stock, ticker, price)
};

struct Holding {
    Stock stock;
    Decimal shares;

    Decimal market_value() const { return shares * stock.price; }
};

struct Trade {
    std::string ticker;
    TradeAction action;
    Decimal shares;
    Decimal value;

    bool operator==(const Trade& other) const {
        return ticker == other.ticker && action == other.action &&
               shares == other.shares && value == other.value;
    }
    bool operator!=(const Trade& other) const { return !(*this == other); }

    // Serialization
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Trade, ticker, action, shares, value)
};

// Quotes for tickers the portfolio does not hold yet
struct MarketData {
    std::map<std::string, Decimal> prices;

    // Serialization
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(MarketData, prices)
};

// Holdings are flat on the wire: {"ticker", "price", "shares"}
void to_json(nlohmann::json& j, const Holding& holding);
void from_json(const nlohmann::json& j, Holding& holding);
