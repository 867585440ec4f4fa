#include <gtest/gtest.h>
#include "safety_check.hpp"

TEST(SafetyCheckTest, ValidTrades) {
    std::vector<Trade> trades = {
        {"MSFT", TradeAction::SELL, Decimal(5), Decimal(1250)},
        {"AAPL", TradeAction::BUY, to_decimal("0.5"), Decimal(114)}
    };

    auto result = SafetyCheck::validate(trades);
    EXPECT_TRUE(result.valid);
    EXPECT_EQ(result.reason, "");
}

TEST(SafetyCheckTest, ZeroValueLiquidationIsValid) {
    std::vector<Trade> trades = {
        {"DELIST", TradeAction::SELL, Decimal(100), Decimal()}
    };

    EXPECT_TRUE(SafetyCheck::validate(trades).valid);
}

TEST(SafetyCheckTest, InvalidSharesZero) {
    std::vector<Trade> trades = {
        {"AAPL", TradeAction::BUY, Decimal(), Decimal(10)}
    };

    auto result = SafetyCheck::validate(trades);
    EXPECT_FALSE(result.valid);
    EXPECT_NE(result.reason.find("positive"), std::string::npos);
}

TEST(SafetyCheckTest, InvalidSharesNegative) {
    std::vector<Trade> trades = {
        {"AAPL", TradeAction::BUY, Decimal(-5), Decimal(10)}
    };

    auto result = SafetyCheck::validate(trades);
    EXPECT_FALSE(result.valid);
    EXPECT_NE(result.reason.find("positive"), std::string::npos);
}

TEST(SafetyCheckTest, InvalidNegativeValue) {
    std::vector<Trade> trades = {
        {"AAPL", TradeAction::SELL, Decimal(1), Decimal(-10)}
    };

    auto result = SafetyCheck::validate(trades);
    EXPECT_FALSE(result.valid);
    EXPECT_NE(result.reason.find("negative"), std::string::npos);
}

TEST(SafetyCheckTest, InvalidTicker) {
    std::vector<Trade> trades = {
        {"", TradeAction::BUY, Decimal(10), Decimal(10)}
    };

    auto result = SafetyCheck::validate(trades);
    EXPECT_FALSE(result.valid);
    EXPECT_NE(result.reason.find("empty"), std::string::npos);
}

TEST(SafetyCheckTest, SellAfterBuyRejected) {
    std::vector<Trade> trades = {
        {"AAPL", TradeAction::BUY, Decimal(1), Decimal(10)},
        {"MSFT", TradeAction::SELL, Decimal(1), Decimal(10)}
    };

    auto result = SafetyCheck::validate(trades);
    EXPECT_FALSE(result.valid);
    EXPECT_NE(result.reason.find("MSFT"), std::string::npos);
}
