#include <gtest/gtest.h>
#include "allocation.hpp"
#include "errors.hpp"

using Weights = std::vector<std::pair<std::string, Decimal>>;

TEST(AllocationTest, ValidAllocation) {
    Allocation allocation({{"META", to_decimal("0.40")}, {"AAPL", to_decimal("0.60")}});

    EXPECT_EQ(allocation.size(), 2u);
    EXPECT_EQ(allocation.weight("META"), to_decimal("0.4"));
    EXPECT_EQ(allocation.weight("AAPL"), to_decimal("0.6"));
}

TEST(AllocationTest, KeysNormalizedToUppercase) {
    Allocation allocation({{"meta", to_decimal("0.5")}, {" aapl ", to_decimal("0.5")}});

    EXPECT_TRUE(allocation.contains("META"));
    EXPECT_TRUE(allocation.contains("AAPL"));
    EXPECT_FALSE(allocation.contains("meta"));
}

TEST(AllocationTest, UnknownTickerHasZeroWeight) {
    Allocation allocation({{"A", Decimal(1)}});
    EXPECT_EQ(allocation.weight("B"), Decimal());
}

TEST(AllocationTest, DuplicateTickersCaseInsensitive) {
    EXPECT_THROW(
        Allocation({{"META", to_decimal("0.5")}, {"meta", to_decimal("0.5")}}),
        DuplicateTickerError);
}

TEST(AllocationTest, MustSumToOne) {
    EXPECT_THROW(
        Allocation({{"A", to_decimal("0.5")}, {"B", to_decimal("0.49")}}),
        AllocationSumError);
    EXPECT_THROW(
        Allocation({{"A", to_decimal("0.6")}, {"B", to_decimal("0.6")}}),
        AllocationSumError);
}

TEST(AllocationTest, EmptyAllocationRejected) {
    EXPECT_THROW(Allocation(Weights{}), AllocationSumError);
}

TEST(AllocationTest, NegativeWeightRejected) {
    EXPECT_THROW(
        Allocation({{"A", to_decimal("-0.2")}, {"B", to_decimal("1.2")}}),
        InvalidWeightError);
}

TEST(AllocationTest, WeightOverOneRejected) {
    EXPECT_THROW(
        Allocation({{"A", to_decimal("1.5")}, {"B", to_decimal("-0.5")}}),
        InvalidWeightError);
}

TEST(AllocationTest, EmptyTickerRejected) {
    EXPECT_THROW(Allocation({{"  ", Decimal(1)}}), InvalidTickerError);
}

TEST(AllocationTest, ToleratesRoundingWithinEpsilon) {
    Decimal third = to_decimal("0.3333333333");
    EXPECT_NO_THROW(Allocation({{"A", third}, {"B", third}, {"C", third}}));

    Decimal coarse = to_decimal("0.333");
    EXPECT_THROW(Allocation({{"A", coarse}, {"B", coarse}, {"C", coarse}}), AllocationSumError);
}

TEST(AllocationTest, FloatWeightsStoredExactly) {
    Weights weights;
    for (char c = 'A'; c < 'A' + 10; ++c) {
        weights.emplace_back(std::string(1, c), to_decimal(0.1));
    }
    Allocation allocation(weights);

    EXPECT_EQ(allocation.weight("A"), Decimal::from_string("0.1"));
    EXPECT_EQ(allocation.weight("A").to_string(), "0.1");
}

TEST(AllocationTest, ErrorsCarryTheirKind) {
    try {
        Allocation({{"A", to_decimal("0.99")}});
        FAIL() << "expected AllocationSumError";
    } catch (const RebalanceError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ALLOCATION_SUM);
        EXPECT_EQ(error_kind_name(e.kind()), "AllocationSumError");
        EXPECT_NE(std::string(e.what()).find("0.99"), std::string::npos);
    }
}
