/**
 * @file DecimalTest.cpp
 * @brief Unit tests for Decimal
 */

#include <gtest/gtest.h>
#include "domain/Decimal.hpp"
#include "domain/exceptions/DomainExceptions.hpp"
#include <sstream>

using namespace stockbook::domain;

// ============================================================================
// PARSE TESTS
// ============================================================================

TEST(DecimalTest, Parse_SimpleFraction_SplitsUnitsAndNano) {
    Decimal value = Decimal::parse("125.5");

    EXPECT_EQ(value.units(), 125);
    EXPECT_EQ(value.nano(), 500000000);
    EXPECT_EQ(value.toString(), "125.5");
}

TEST(DecimalTest, Parse_NegativeBelowOne_KeepsSignInNano) {
    Decimal value = Decimal::parse("-0.25");

    EXPECT_EQ(value.units(), 0);
    EXPECT_EQ(value.nano(), -250000000);
    EXPECT_TRUE(value.isNegative());
    EXPECT_EQ(value.toString(), "-0.25");
}

TEST(DecimalTest, Parse_SurroundingWhitespace_IsIgnored) {
    EXPECT_EQ(Decimal::parse("  42 "), Decimal(42));
}

TEST(DecimalTest, Parse_MoreThanNineDigits_RoundsHalfUp) {
    EXPECT_EQ(Decimal::parse("0.1234567895").toString(), "0.12345679");
    EXPECT_EQ(Decimal::parse("0.1234567894").toString(), "0.123456789");
}

TEST(DecimalTest, Parse_Garbage_ThrowsValidationError) {
    EXPECT_THROW(Decimal::parse(""), ValidationError);
    EXPECT_THROW(Decimal::parse("abc"), ValidationError);
    EXPECT_THROW(Decimal::parse("1.2.3"), ValidationError);
    EXPECT_THROW(Decimal::parse("-"), ValidationError);
}

TEST(DecimalTest, Parse_HugeInteger_ThrowsOverflow) {
    EXPECT_THROW(Decimal::parse("99999999999999999999"), std::overflow_error);
}

TEST(DecimalTest, Constructor_NanoOutOfRange_Throws) {
    EXPECT_THROW(Decimal(1, 1000000000), ValidationError);
}

TEST(DecimalTest, Constructor_MixedSigns_Normalizes) {
    Decimal value(1, -500000000);

    EXPECT_EQ(value, Decimal::parse("0.5"));
}

// ============================================================================
// ARITHMETIC TESTS
// ============================================================================

TEST(DecimalTest, Add_FractionsWithCarry_IsExact) {
    EXPECT_EQ(Decimal::parse("0.1") + Decimal::parse("0.2"), Decimal::parse("0.3"));
    EXPECT_EQ(Decimal::parse("0.7") + Decimal::parse("0.6"), Decimal::parse("1.3"));
}

TEST(DecimalTest, Subtract_BelowZero_GivesNegative) {
    Decimal result = Decimal::parse("1.25") - Decimal(2);

    EXPECT_EQ(result.toString(), "-0.75");
}

TEST(DecimalTest, Multiply_Fractions_IsExact) {
    EXPECT_EQ(Decimal::parse("1.5") * Decimal::parse("2.5"), Decimal::parse("3.75"));
}

TEST(DecimalTest, Divide_Repeating_RoundsAtNinthDigit) {
    EXPECT_EQ((Decimal(1) / Decimal(3)).toString(), "0.333333333");
    EXPECT_EQ((Decimal(2) / Decimal(3)).toString(), "0.666666667");
}

TEST(DecimalTest, Divide_ByZero_ThrowsDivisionByZeroError) {
    EXPECT_THROW(Decimal(1) / Decimal(0), DivisionByZeroError);
}

// ============================================================================
// ROUNDING TESTS
// ============================================================================

TEST(DecimalTest, Rounded_Half_RoundsAwayFromZero) {
    EXPECT_EQ(Decimal::parse("2.675").rounded(2), Decimal::parse("2.68"));
    EXPECT_EQ(Decimal::parse("-2.675").rounded(2), Decimal::parse("-2.68"));
    EXPECT_EQ(Decimal::parse("2.674").rounded(2), Decimal::parse("2.67"));
}

TEST(DecimalTest, Rounded_InvalidPlaces_Throws) {
    EXPECT_THROW(Decimal(1).rounded(-1), ValidationError);
    EXPECT_THROW(Decimal(1).rounded(10), ValidationError);
}

TEST(DecimalTest, Truncated_DropsDigitsTowardZero) {
    EXPECT_EQ(Decimal::parse("0.006").truncated(2), Decimal::parse("0"));
    EXPECT_EQ(Decimal::parse("3.339").truncated(2), Decimal::parse("3.33"));
    EXPECT_EQ(Decimal::parse("-3.339").truncated(2), Decimal::parse("-3.33"));
    EXPECT_THROW(Decimal(1).truncated(10), ValidationError);
}

TEST(DecimalTest, FloorAndCeil_Negative_MoveTowardInfinity) {
    Decimal value = Decimal::parse("-1.5");

    EXPECT_EQ(value.floor(), Decimal(-2));
    EXPECT_EQ(value.ceil(), Decimal(-1));
    EXPECT_EQ(Decimal::parse("1.1").ceil(), Decimal(2));
}

TEST(DecimalTest, ToString_MinFractionDigits_PadsZeros) {
    EXPECT_EQ(Decimal(5).toString(2), "5.00");
    EXPECT_EQ(Decimal::parse("5.1").toString(2), "5.10");
    EXPECT_EQ(Decimal::parse("5.125").toString(2), "5.125");
}

TEST(DecimalTest, Compare_DifferentScale_ComparesByValue) {
    EXPECT_TRUE(Decimal::parse("1.50") == Decimal::parse("1.5"));
    EXPECT_TRUE(Decimal::parse("-0.1") < Decimal(0));
    EXPECT_TRUE(Decimal::parse("10.01") > Decimal(10));
}

TEST(DecimalTest, StreamOperator_WritesText) {
    std::ostringstream os;
    os << Decimal::parse("3.14");
    EXPECT_EQ(os.str(), "3.14");
}
