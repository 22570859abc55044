/**
 * @file GrandTotalAggregatorTest.cpp
 * @brief Unit tests for GrandTotalAggregator
 */

#include <gtest/gtest.h>
#include "application/GrandTotalAggregator.hpp"

using namespace settlement::application;
using namespace settlement::domain;

class GrandTotalAggregatorTest : public ::testing::Test {
protected:
    GrandTotalAggregator aggregator{DecimalContext()};

    static Decimal d(const std::string& text) { return Decimal::parse(text); }
};

TEST_F(GrandTotalAggregatorTest, Aggregate_SumsComponents) {
    auto total = aggregator.aggregate(d("1000"), d("100.00"), d("90.75"));

    EXPECT_EQ(total.toString(), "1190.75");
}

TEST_F(GrandTotalAggregatorTest, Aggregate_RoundsSubtotalOnce) {
    EXPECT_EQ(aggregator.aggregate(d("100.005"), d("10.00"), d("9.35")).toString(), "119.35");
    EXPECT_EQ(aggregator.aggregate(d("100.015"), d("10.00"), d("9.35")).toString(), "119.37");
}

TEST_F(GrandTotalAggregatorTest, Aggregate_AlwaysTwoPlaces) {
    EXPECT_EQ(aggregator.aggregate(d("200"), d("0"), d("0")).toString(), "200.00");
}
