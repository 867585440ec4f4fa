#include <gtest/gtest.h>
#include "types.hpp"
#include <nlohmann/json.hpp>

TEST(TypesTest, TradeActionComparesToItsName) {
    EXPECT_TRUE(TradeAction::BUY == "BUY");
    EXPECT_TRUE("SELL" == TradeAction::SELL);
    EXPECT_TRUE(TradeAction::BUY != "Buy");
    EXPECT_FALSE(TradeAction::SELL == "BUY");
    EXPECT_EQ(to_string(TradeAction::SELL), "SELL");
}

TEST(TypesTest, TradeSerialization) {
    Trade trade{"NVDA", TradeAction::SELL, to_decimal("46.8511"), to_decimal("6137.5")};
    nlohmann::json j = trade;

    EXPECT_EQ(j["ticker"], "NVDA");
    EXPECT_EQ(j["action"], "SELL");
    EXPECT_EQ(j["shares"], "46.8511");
    EXPECT_EQ(j["value"], "6137.5");
}

TEST(TypesTest, HoldingFromJsonNumbers) {
    nlohmann::json j = {{"ticker", "aapl"}, {"price", 228}, {"shares", 0.5}};
    Holding holding = j.get<Holding>();

    EXPECT_EQ(holding.stock.ticker, "aapl");
    EXPECT_EQ(holding.stock.price, Decimal(228));
    EXPECT_EQ(holding.shares.to_string(), "0.5");
    EXPECT_EQ(holding.market_value(), Decimal(114));
}

TEST(TypesTest, DecimalFromJsonString) {
    nlohmann::json j = "0.1";
    EXPECT_EQ(j.get<Decimal>().to_string(), "0.1");
}

TEST(TypesTest, DecimalFromJsonRejectsNonNumbers) {
    nlohmann::json j = true;
    EXPECT_THROW(j.get<Decimal>(), InvalidNumberError);

    nlohmann::json text = "ten";
    EXPECT_THROW(text.get<Decimal>(), InvalidNumberError);
}

TEST(TypesTest, MarketDataSerialization) {
    nlohmann::json j = {{"prices", {{"GOOG", "170.25"}, {"XOM", 110}}}};
    MarketData data = j.get<MarketData>();

    ASSERT_EQ(data.prices.size(), 2u);
    EXPECT_EQ(data.prices.at("GOOG"), to_decimal("170.25"));
    EXPECT_EQ(data.prices.at("XOM"), Decimal(110));
}

TEST(TypesTest, HoldingMarketValue) {
    Holding holding{{"META", Decimal(500)}, Decimal(10)};
    EXPECT_EQ(holding.market_value(), Decimal(5000));

    Holding fractional{{"AAPL", Decimal(200)}, to_decimal("0.5")};
    EXPECT_EQ(fractional.market_value(), Decimal(100));
}

TEST(TypesTest, NormalizeTicker) {
    EXPECT_EQ(normalize_ticker("aapl"), "AAPL");
    EXPECT_EQ(normalize_ticker("  meta  "), "META");
    EXPECT_THROW(normalize_ticker(""), InvalidTickerError);
    EXPECT_THROW(normalize_ticker("   "), InvalidTickerError);
}
