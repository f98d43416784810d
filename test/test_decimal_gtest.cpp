#include <gtest/gtest.h>

#include "../qre/qre-decimal.hpp"
#include "../lib/log.h"

#include <cmath>
#include <stdexcept>
#include <utility>

using namespace qre;

class DecimalTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_init(NULL);
    }
};

TEST_F(DecimalTest, ParseAndFormat) {
    EXPECT_EQ(Decimal::parse("123.45").to_string(), "123.45");
    EXPECT_EQ(Decimal::parse("+000123.4").to_string(), "123.4");
    EXPECT_EQ(Decimal::parse("-.1").to_string(), "-0.1");
    EXPECT_EQ(Decimal::parse("-123.0").to_string(), "-123.0") << "trailing zeros are kept";
    EXPECT_EQ(Decimal().to_string(), "0");
}

TEST_F(DecimalTest, ExactPrecision) {
    const char* digits = "12345678901234567890.123456789012345678901234567890";
    EXPECT_EQ(Decimal::parse(digits).to_string(), digits) << "no rounding on parse";
}

TEST_F(DecimalTest, InvalidInput) {
    EXPECT_THROW(Decimal::parse("abc"), std::invalid_argument);
    EXPECT_THROW(Decimal::parse("1.2.3"), std::invalid_argument);
    EXPECT_THROW(Decimal::parse(""), std::invalid_argument);
}

TEST_F(DecimalTest, Comparison) {
    EXPECT_EQ(Decimal::parse("-123"), Decimal::parse("-123.000"));
    EXPECT_NE(Decimal::parse("0.1"), Decimal::parse("0.10001"));
    EXPECT_LT(Decimal::parse("1.5").compare(Decimal::parse("2")), 0);
    EXPECT_GT(Decimal::parse("2").compare(Decimal::parse("1.5")), 0);

    Decimal nan = Decimal::parse("NaN");
    EXPECT_TRUE(nan.is_nan());
    EXPECT_NE(nan, nan) << "NaN compares unequal to itself";
}

TEST_F(DecimalTest, ToDouble) {
    EXPECT_DOUBLE_EQ(Decimal::parse("123.4").to_double(), 123.4);
    EXPECT_DOUBLE_EQ(Decimal::parse("-0.25").to_double(), -0.25);
}

TEST_F(DecimalTest, CopyAndMove) {
    Decimal a = Decimal::parse("42.5");
    Decimal b(a);
    EXPECT_EQ(a, b);

    Decimal c;
    c = a;
    EXPECT_EQ(c.to_string(), "42.5");

    Decimal d(std::move(b));
    EXPECT_EQ(d.to_string(), "42.5");

    Decimal e;
    e = std::move(d);
    EXPECT_EQ(e, a);
}

TEST_F(DecimalTest, CopyOfMovedFromIsNaN) {
    Decimal a = Decimal::parse("1.25");
    Decimal b(std::move(a));
    EXPECT_TRUE(a.is_nan());

    Decimal c(a);
    EXPECT_TRUE(c.is_nan()) << "moved-from decimals copy as NaN";
    EXPECT_EQ(c.to_string(), "NaN");

    Decimal d;
    d = a;
    EXPECT_TRUE(d.is_nan());
    EXPECT_EQ(b.to_string(), "1.25");
}

TEST_F(DecimalTest, ToDoubleSpecialValues) {
    EXPECT_TRUE(std::isnan(Decimal::parse("NaN").to_double()));
    EXPECT_DOUBLE_EQ(Decimal::parse("1E+3").to_double(), 1000.0);
    EXPECT_TRUE(std::isinf(Decimal::parse("1E+400").to_double()));
}
