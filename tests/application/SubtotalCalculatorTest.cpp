/**
 * @file SubtotalCalculatorTest.cpp
 * @brief Unit tests for SubtotalCalculator
 */

#include <gtest/gtest.h>
#include "application/SubtotalCalculator.hpp"
#include <algorithm>

using namespace settlement;
using namespace settlement::application;
using namespace settlement::domain;

class SubtotalCalculatorTest : public ::testing::Test {
protected:
    SubtotalCalculator calculator{DecimalContext()};

    static LineItem item(const std::string& lot, int64_t qty, const std::string& price) {
        return LineItem(lot, "Lot " + lot, qty, Decimal::parse(price));
    }

    CalculationErrorKind errorKindOf(const std::vector<LineItem>& items) {
        try {
            calculator.calculate(items);
        } catch (const CalculationException& e) {
            return e.kind();
        }
        ADD_FAILURE() << "Expected CalculationException";
        return CalculationErrorKind::VERIFICATION_FAILED;
    }
};

// ============================================================================
// SUCCESS CASES
// ============================================================================

TEST_F(SubtotalCalculatorTest, Calculate_SumsQuantityTimesPrice) {
    auto subtotal = calculator.calculate({item("1", 2, "100.00"), item("2", 1, "50.00")});

    EXPECT_EQ(subtotal, Decimal::parse("250.00"));
}

TEST_F(SubtotalCalculatorTest, Calculate_IsExactForCents) {
    auto subtotal = calculator.calculate({item("A", 1, "99.99"), item("B", 2, "0.50")});

    EXPECT_EQ(subtotal.toString(), "100.99");
}

TEST_F(SubtotalCalculatorTest, Calculate_DoesNotRound) {
    // Округление только на выходе
    auto subtotal = calculator.calculate({item("A", 3, "0.333")});

    EXPECT_EQ(subtotal.toString(), "0.999");
}

TEST_F(SubtotalCalculatorTest, Calculate_OrderIndependent) {
    std::vector<LineItem> items = {
        item("1", 2, "250.50"), item("2", 1, "99.99"), item("3", 3, "10.00")
    };
    auto forward = calculator.calculate(items);

    std::reverse(items.begin(), items.end());
    auto backward = calculator.calculate(items);

    EXPECT_EQ(forward, backward);
    EXPECT_EQ(forward, Decimal::parse("630.99"));
}

TEST_F(SubtotalCalculatorTest, Calculate_ZeroPricedItemAmongOthers) {
    auto subtotal = calculator.calculate({item("1", 1, "0"), item("2", 1, "15.00")});

    EXPECT_EQ(subtotal, Decimal(15));
}

TEST_F(SubtotalCalculatorTest, LineTotal) {
    EXPECT_EQ(calculator.lineTotal(item("X", 4, "12.25")), Decimal::parse("49.00"));
}

// ============================================================================
// ERROR CASES
// ============================================================================

TEST_F(SubtotalCalculatorTest, EmptyItems_EmptyInput) {
    EXPECT_EQ(errorKindOf({}), CalculationErrorKind::EMPTY_INPUT);
}

TEST_F(SubtotalCalculatorTest, ZeroQuantity_InvalidItem) {
    EXPECT_EQ(errorKindOf({item("7", 0, "10.00")}), CalculationErrorKind::INVALID_ITEM);
}

TEST_F(SubtotalCalculatorTest, NegativePrice_InvalidItemWithLotId) {
    try {
        calculator.calculate({item("1", 1, "5.00"), item("LOT-42", 1, "-1.00")});
        FAIL() << "Expected CalculationException";
    } catch (const CalculationException& e) {
        EXPECT_EQ(e.kind(), CalculationErrorKind::INVALID_ITEM);
        EXPECT_NE(std::string(e.what()).find("LOT-42"), std::string::npos);
    }
}

TEST_F(SubtotalCalculatorTest, AllZeroPrices_ZeroSubtotal) {
    EXPECT_EQ(errorKindOf({item("1", 1, "0.00"), item("2", 5, "0")}),
              CalculationErrorKind::ZERO_SUBTOTAL);
}
