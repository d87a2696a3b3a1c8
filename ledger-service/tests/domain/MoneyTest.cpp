#include <gtest/gtest.h>
#include "domain/Money.hpp"
#include "domain/LedgerException.hpp"

#include <cstdint>
#include <limits>

using namespace ledger::domain;

// ================================================================
// ARITHMETIC
// ================================================================

TEST(MoneyTest, DefaultIsZero) {
    Money m;
    EXPECT_TRUE(m.isZero());
    EXPECT_FALSE(m.isPositive());
    EXPECT_FALSE(m.isNegative());
    EXPECT_EQ(m, Money::zero());
}

TEST(MoneyTest, AddAndSubtract) {
    Money a(1500);
    Money b(400);

    EXPECT_EQ((a + b).minor, 1900);
    EXPECT_EQ((a - b).minor, 1100);
    EXPECT_EQ((b - a).minor, -1100);
    EXPECT_EQ((-a).minor, -1500);

    a += b;
    EXPECT_EQ(a.minor, 1900);
    a -= Money(1900);
    EXPECT_TRUE(a.isZero());
}

TEST(MoneyTest, AbsAndComparison) {
    EXPECT_EQ(Money(-250).abs(), Money(250));
    EXPECT_LT(Money(-1), Money(0));
    EXPECT_GT(Money(1000), Money(999));
    EXPECT_NE(Money(600), Money(500));
}

// Сумма из многих мелких строк остаётся точной
TEST(MoneyTest, ManySmallAmountsSumExactly) {
    Money total;
    for (int i = 0; i < 1000; ++i) {
        total += Money(1);
    }
    EXPECT_EQ(total.minor, 1000);
}

TEST(MoneyTest, OverflowThrowsInvalidAmount) {
    const Money max(std::numeric_limits<int64_t>::max());
    const Money min(std::numeric_limits<int64_t>::min());

    try {
        (void)(max + Money(1));
        FAIL() << "Expected INVALID_AMOUNT";
    } catch (const LedgerException& e) {
        EXPECT_EQ(e.code(), LedgerErrorCode::INVALID_AMOUNT);
    }
    EXPECT_THROW((void)(min - Money(1)), LedgerException);
    EXPECT_THROW((void)(-min), LedgerException);
    EXPECT_THROW((void)min.abs(), LedgerException);

    Money total = max;
    EXPECT_THROW(total += max, LedgerException);
    EXPECT_EQ(total, max);
}

TEST(MoneyTest, ArithmeticAtTheEdgesOfRange) {
    const Money max(std::numeric_limits<int64_t>::max());
    EXPECT_EQ((max - max).minor, 0);
    EXPECT_EQ((-max).minor, -std::numeric_limits<int64_t>::max());
    EXPECT_EQ((Money(-1) + Money(std::numeric_limits<int64_t>::min() + 1)).minor,
              std::numeric_limits<int64_t>::min());
}

// ================================================================
// FORMATTING
// ================================================================

TEST(MoneyTest, ToString_NoScale) {
    EXPECT_EQ(Money(1000).toString(), "1000");
    EXPECT_EQ(Money(-42).toString(), "-42");
    EXPECT_EQ(Money().toString(), "0");
}

TEST(MoneyTest, ToString_WithScale) {
    EXPECT_EQ(Money(123456).toString(2), "1234.56");
    EXPECT_EQ(Money(5).toString(2), "0.05");
    EXPECT_EQ(Money(-5).toString(2), "-0.05");
    EXPECT_EQ(Money(100).toString(2), "1.00");
}

TEST(MoneyTest, ToString_Int64Min) {
    Money m(std::numeric_limits<int64_t>::min());
    EXPECT_EQ(m.toString(), "-9223372036854775808");
}
