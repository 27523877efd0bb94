// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string>

#include "checksum/double_add_double_checksum.hpp"

#include "common/gtest_utils.hpp"

using namespace secid;

namespace {

TEST(TestDoubleAddDoubleChecksum, Valid)
{
    // Apple Inc.
    EXPECT_TRUE(is_valid_modulus10_double_add_double("037833100"));
    // Microsoft Corp.
    EXPECT_TRUE(is_valid_modulus10_double_add_double("594918104"));
    // Cisco Systems Inc.
    EXPECT_TRUE(is_valid_modulus10_double_add_double("17275R102"));
    EXPECT_TRUE(is_valid_modulus10_double_add_double("38259P508"));
    EXPECT_TRUE(is_valid_modulus10_double_add_double("68389X105"));
    // US Treasury notes
    EXPECT_TRUE(is_valid_modulus10_double_add_double("912828ZQ6"));
    EXPECT_TRUE(is_valid_modulus10_double_add_double("9128285M8"));
}

TEST(TestDoubleAddDoubleChecksum, CheckDigitZero)
{
    // Sum is a multiple of 10
    EXPECT_TRUE(is_valid_modulus10_double_add_double("000000000"));
    EXPECT_TRUE(is_valid_modulus10_double_add_double("00206RCN0"));
}

TEST(TestDoubleAddDoubleChecksum, SpecialCharacters)
{
    EXPECT_TRUE(is_valid_modulus10_double_add_double("A1B2C3*@2"));
    EXPECT_TRUE(is_valid_modulus10_double_add_double("12345#*@6"));
    EXPECT_TRUE(is_valid_modulus10_double_add_double("@#*@#*@#4"));

    EXPECT_FALSE(is_valid_modulus10_double_add_double("A1B2C3*@3"));
}

TEST(TestDoubleAddDoubleChecksum, LowercaseLetters)
{
    // 'r' is worth 59, not the 27 of 'R'
    EXPECT_TRUE(is_valid_modulus10_double_add_double("17275r101"));
    EXPECT_FALSE(is_valid_modulus10_double_add_double("17275r102"));
    EXPECT_TRUE(is_valid_modulus10_double_add_double("zzzzzzzz6"));
    EXPECT_FALSE(is_valid_modulus10_double_add_double("zzzzzzzz7"));
}

TEST(TestDoubleAddDoubleChecksum, AlteredCheckDigit)
{
    std::string code = "037833100";
    for (char digit = '1'; digit <= '9'; ++digit) {
        code.back() = digit;
        EXPECT_FALSE(is_valid_modulus10_double_add_double(code)) << code;
    }
}

TEST(TestDoubleAddDoubleChecksum, InvalidCharacters)
{
    EXPECT_FALSE(is_valid_modulus10_double_add_double("0378 3100"));
    EXPECT_FALSE(is_valid_modulus10_double_add_double("03783-100"));

    // Non-numeric check digit
    EXPECT_FALSE(is_valid_modulus10_double_add_double("03783310A"));
    EXPECT_FALSE(is_valid_modulus10_double_add_double("03783310*"));
}

TEST(TestDoubleAddDoubleChecksum, MissingCheckDigit)
{
    test::log_capture logs;

    EXPECT_TRUE(is_valid_modulus10_double_add_double("03783310"));
    EXPECT_TRUE(logs.contains(SECID_LOG_WARN, "03783310"));

    EXPECT_TRUE(is_valid_modulus10_double_add_double("0378331001"));
    EXPECT_TRUE(is_valid_modulus10_double_add_double(""));
    EXPECT_EQ(logs.entries().size(), 3U);
}

} // namespace
