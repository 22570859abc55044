/**
 * @file TaxCalculatorTest.cpp
 * @brief Unit tests for TaxCalculator
 */

#include <gtest/gtest.h>
#include "application/TaxCalculator.hpp"

using namespace settlement;
using namespace settlement::application;
using namespace settlement::domain;

class TaxCalculatorTest : public ::testing::Test {
protected:
    TaxCalculator calculator{DecimalContext()};

    static Decimal d(const std::string& text) { return Decimal::parse(text); }
};

TEST_F(TaxCalculatorTest, Calculate_TaxesSubtotalPlusPremium) {
    auto tax = calculator.calculate(d("1000"), d("100.00"), d("0.0825"));

    EXPECT_EQ(tax.taxableAmount, d("1100"));
    EXPECT_EQ(tax.amount.toString(), "90.75");
    EXPECT_EQ(tax.rate, d("0.0825"));
}

TEST_F(TaxCalculatorTest, Calculate_DefaultRate) {
    auto tax = calculator.calculate(d("100"), d("10.00"), std::nullopt);

    EXPECT_EQ(tax.rate, d("0.085"));
    EXPECT_EQ(tax.amount.toString(), "9.35");
}

TEST_F(TaxCalculatorTest, Calculate_ZeroRate) {
    auto tax = calculator.calculate(d("200"), d("0.00"), d("0"));

    EXPECT_EQ(tax.amount.toString(), "0.00");
}

TEST_F(TaxCalculatorTest, Calculate_RoundsToCents) {
    EXPECT_EQ(calculator.calculate(d("175"), d("26.25"), d("0.08")).amount.toString(), "16.10");
    EXPECT_EQ(calculator.calculate(d("630.99"), d("94.65"), d("0.075")).amount.toString(), "54.42");
}

TEST_F(TaxCalculatorTest, TaxableAmount_IsNotRounded) {
    auto tax = calculator.calculate(d("0.333"), d("0.03"), d("0.10"));

    EXPECT_EQ(tax.taxableAmount.toString(), "0.363");
    EXPECT_EQ(tax.amount.toString(), "0.04");
}

TEST_F(TaxCalculatorTest, OutOfBoundsRate_InvalidRate) {
    for (const char* rate : {"-0.01", "1.2"}) {
        try {
            calculator.calculate(d("100"), d("10"), d(rate));
            FAIL() << "Expected CalculationException for rate " << rate;
        } catch (const CalculationException& e) {
            EXPECT_EQ(e.kind(), CalculationErrorKind::INVALID_RATE);
        }
    }
}
