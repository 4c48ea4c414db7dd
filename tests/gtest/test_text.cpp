// =============================================================================
// Numeric Text Parsing Tests
// =============================================================================

#include <gtest/gtest.h>
#include "geocell/text.hpp"
#include "geocell/codec.hpp"
#include "geocell/error.hpp"
#include "geocell/geohash_cell.hpp"
#include <climits>
#include <string>

using namespace geocell;

class TextTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(TextTest, ParsesIntegers) {
    EXPECT_EQ(parse_int("7", "precision"), 7);
    EXPECT_EQ(parse_int(" -3 ", "precision"), -3);
    EXPECT_EQ(parse_int(std::to_string(INT_MAX), "precision"), INT_MAX);
    EXPECT_EQ(parse_int(std::to_string(INT_MIN), "precision"), INT_MIN);
}

// Values beyond int must not wrap into a valid precision
TEST_F(TextTest, RejectsOutOfRangeIntegers) {
    EXPECT_THROW(parse_int("4294967303", "precision"), InvalidArgumentError);  // 2^32 + 7
    EXPECT_THROW(parse_int("2147483648", "precision"), InvalidArgumentError);
    EXPECT_THROW(parse_int("-2147483649", "precision"), InvalidArgumentError);
    EXPECT_THROW(parse_int("99999999999999999999999", "precision"), InvalidArgumentError);
}

TEST_F(TextTest, RejectsMalformedIntegers) {
    EXPECT_THROW(parse_int("", "precision"), InvalidArgumentError);
    EXPECT_THROW(parse_int("   ", "precision"), InvalidArgumentError);
    EXPECT_THROW(parse_int("7x", "precision"), InvalidArgumentError);
    EXPECT_THROW(parse_int("7.5", "precision"), InvalidArgumentError);
}

TEST_F(TextTest, ParsesDoubles) {
    EXPECT_DOUBLE_EQ(parse_double("52.205", "latitude"), 52.205);
    EXPECT_DOUBLE_EQ(parse_double(" -121.7\t", "longitude"), -121.7);
    EXPECT_DOUBLE_EQ(parse_double("1e-3", "resolution"), 0.001);
}

TEST_F(TextTest, RejectsBadDoubles) {
    EXPECT_THROW(parse_double("", "latitude"), InvalidArgumentError);
    EXPECT_THROW(parse_double("x", "latitude"), InvalidArgumentError);
    EXPECT_THROW(parse_double("52.2N", "latitude"), InvalidArgumentError);
    EXPECT_THROW(parse_double("1e999", "latitude"), InvalidArgumentError);
}

TEST_F(TextTest, MessageNamesValue) {
    try {
        parse_int("4294967303", "precision");
        FAIL() << "expected InvalidArgumentError";
    } catch (const InvalidArgumentError& e) {
        std::string what = e.what();
        EXPECT_NE(what.find("precision"), std::string::npos);
        EXPECT_NE(what.find("out of range"), std::string::npos);
        EXPECT_EQ(e.context(), "parse_int");
    }
}

// Parsed text feeds encode without any silent wrap
TEST_F(TextTest, PrecisionFromText) {
    EXPECT_EQ(Codec::encode(52.205, 0.119, parse_int("7", "precision")), "u120fxw");
    EXPECT_THROW(Codec::encode(52.205, 0.119, parse_int("4294967303", "precision")),
                 InvalidArgumentError);
    EXPECT_THROW(GeohashCell("52.205,0.119", parse_int("13", "precision")), InvalidPrecisionError);
}

TEST_F(TextTest, Trim) {
    EXPECT_EQ(trim("  u120 \n"), "u120");
    EXPECT_EQ(trim(""), "");
    EXPECT_EQ(trim(" \t "), "");
}
