#include <gtest/gtest.h>

#include "../qre/value.hpp"
#include "../lib/log.h"

#include <limits>
#include <sstream>
#include <variant>

using namespace qre;

class ValueTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_init(NULL);
    }
};

TEST_F(ValueTest, Types) {
    EXPECT_TRUE(Value().is_null());
    EXPECT_TRUE(Value("a").is_string());
    EXPECT_TRUE(Value(1).is_int());
    EXPECT_TRUE(Value(int64_t(1) << 40).is_int());
    EXPECT_TRUE(Value(1.5).is_float());
    EXPECT_TRUE(Value(Decimal::parse("1.5")).is_decimal());
    EXPECT_TRUE(Value(datetime_from_date(2020, 1, 1)).is_datetime());

    EXPECT_STREQ(value_type_name(Value(1).type()), "int");
    EXPECT_STREQ(value_type_name(ValueType::Null), "null");
}

TEST_F(ValueTest, AccessorMismatchThrows) {
    EXPECT_THROW(Value("a").as_int(), std::bad_variant_access);
    EXPECT_THROW(Value(1).as_string(), std::bad_variant_access);
}

TEST_F(ValueTest, Equality) {
    EXPECT_EQ(Value(1), Value(int64_t(1)));
    EXPECT_NE(Value(1), Value(1.0)) << "int and float values are different types";
    EXPECT_NE(Value("1"), Value(1));
    EXPECT_EQ(Value(), Value());
    EXPECT_EQ(Value(Decimal::parse("1.50")), Value(Decimal::parse("1.5")));
}

TEST_F(ValueTest, FormatDouble) {
    EXPECT_EQ(format_double(1.0), "1.0");
    EXPECT_EQ(format_double(-10.2), "-10.2");
    EXPECT_EQ(format_double(0.1), "0.1");
    EXPECT_EQ(format_double(123.123), "123.123");
    EXPECT_EQ(format_double(1e300), "1e+300");
    EXPECT_EQ(format_double(std::numeric_limits<double>::infinity()), "inf");
}

TEST_F(ValueTest, ToString) {
    EXPECT_EQ(Value().to_string(), "null");
    EXPECT_EQ(Value("text").to_string(), "text");
    EXPECT_EQ(Value(-5).to_string(), "-5");
    EXPECT_EQ(Value(2.5).to_string(), "2.5");
    EXPECT_EQ(Value(Decimal::parse("-0.1")).to_string(), "-0.1");
    EXPECT_EQ(Value(datetime_from_date(2021, 1, 15)).to_string(), "2021-01-15");
}

TEST_F(ValueTest, ToJson) {
    EXPECT_EQ(Value().to_json(), "null");
    EXPECT_EQ(Value("say \"hi\"\n").to_json(), "\"say \\\"hi\\\"\\n\"");
    EXPECT_EQ(Value(7).to_json(), "7");
    EXPECT_EQ(Value(7.0).to_json(), "7.0");
    EXPECT_EQ(Value(std::numeric_limits<double>::quiet_NaN()).to_json(), "null");
    EXPECT_EQ(Value(Decimal::parse("3.14")).to_json(), "3.14");
    EXPECT_EQ(Value(datetime_from_date(2021, 1, 15)).to_json(), "\"2021-01-15\"");
}

TEST_F(ValueTest, JsonQuoteControlCharacters) {
    EXPECT_EQ(json_quote(std::string("a\x01" "b")), "\"a\\u0001b\"");
    EXPECT_EQ(json_quote("back\\slash"), "\"back\\\\slash\"");
    EXPECT_EQ(json_quote("\xc3\xa9"), "\"\xc3\xa9\"") << "UTF-8 passes through";
}

TEST_F(ValueTest, StreamOutput) {
    std::ostringstream os;
    os << Value("x") << ' ' << Value(3) << ' ' << Value();
    EXPECT_EQ(os.str(), "\"x\" 3 null");
}
