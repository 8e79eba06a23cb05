/**
 * test_common.cpp
 *
 * Number parsing, wraparound and register table.
 */

#include <gtest/gtest.h>
#include "common.hpp"

TEST(ParseNumber, Decimal) {
    EXPECT_EQ(parse_number("42"), 42);
    EXPECT_EQ(parse_number("-17"), -17);
    EXPECT_EQ(parse_number("+5"), 5);
    EXPECT_EQ(parse_number("  7  "), 7);
    EXPECT_EQ(parse_number("0"), 0);
}

TEST(ParseNumber, Hex) {
    EXPECT_EQ(parse_number("0x1F"), 31);
    EXPECT_EQ(parse_number("0XfF"), 255);
    EXPECT_EQ(parse_number("-0x10"), -16);
    EXPECT_EQ(parse_number("0x10010000"), 0x10010000);
}

TEST(ParseNumber, WrapsToThirtyTwoBits) {
    EXPECT_EQ(parse_number("0xFFFFFFFF"), -1);
    EXPECT_EQ(parse_number("0x80000000"), std::numeric_limits<SignedWord>::min());
    EXPECT_EQ(parse_number("2147483648"), std::numeric_limits<SignedWord>::min());
    EXPECT_EQ(parse_number("4294967296"), 0);
    EXPECT_EQ(parse_number("4294967295"), -1);
}

TEST(ParseNumber, DecimalPrefixStopsAtFirstNonDigit) {
    EXPECT_EQ(parse_number("12abc"), 12);
    EXPECT_EQ(parse_number("0x1g"), 0);
    EXPECT_EQ(parse_number("0x"), 0);
    EXPECT_EQ(parse_number("3($sp)"), 3);
}

TEST(ParseNumber, RejectsNonNumbers) {
    EXPECT_FALSE(parse_number(""));
    EXPECT_FALSE(parse_number("   "));
    EXPECT_FALSE(parse_number("abc"));
    EXPECT_FALSE(parse_number("-"));
    EXPECT_FALSE(parse_number("$t0"));
    EXPECT_FALSE(parse_number("($sp)"));
}

TEST(Wrap32, TruncatesTwosComplement) {
    EXPECT_EQ(wrap32(0x7FFFFFFFLL + 1), std::numeric_limits<SignedWord>::min());
    EXPECT_EQ(wrap32(-2147483649LL), 2147483647);
    EXPECT_EQ(wrap32(0x100000005LL), 5);
    EXPECT_EQ(wrap32(-1), -1);
}

TEST(Registers, HardwareNumbering) {
    EXPECT_EQ(reg_index("$zero"), 0);
    EXPECT_EQ(reg_index("$v0"), 2);
    EXPECT_EQ(reg_index("$a0"), 4);
    EXPECT_EQ(reg_index("$t0"), 8);
    EXPECT_EQ(reg_index("$t8"), 24);
    EXPECT_EQ(reg_index("$sp"), 29);
    EXPECT_EQ(reg_index("$ra"), 31);
    for (int i = 0; i < NUM_REGISTERS; i++) {
        EXPECT_EQ(reg_index(reg_name(i)), i);
    }
}

TEST(Registers, LookupIsExact) {
    EXPECT_EQ(reg_index("$T0"), NO_REGISTER);
    EXPECT_EQ(reg_index("t0"), NO_REGISTER);
    EXPECT_EQ(reg_index("$8"), NO_REGISTER);
    EXPECT_EQ(reg_index("$bogus"), NO_REGISTER);
}

TEST(Format, Hex) {
    EXPECT_EQ(to_hex(0x10010000), "0x10010000");
    EXPECT_EQ(to_hex(255, 2), "0xff");
}
