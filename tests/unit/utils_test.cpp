// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <limits>

#include "utils.hpp"

#include "common/gtest_utils.hpp"

using namespace secid;

namespace {
constexpr char char_min = std::numeric_limits<char>::min();
constexpr char char_max = std::numeric_limits<char>::max();

TEST(TestUtils, IsAlpha)
{
    for (char c = char_min; c < char_max; ++c) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z')) {
            EXPECT_TRUE(isalpha(c));
        } else {
            EXPECT_FALSE(isalpha(c));
        }
    }
}

TEST(TestUtils, IsDigit)
{
    for (char c = char_min; c < char_max; ++c) {
        if (c >= '0' && c <= '9') {
            EXPECT_TRUE(isdigit(c));
        } else {
            EXPECT_FALSE(isdigit(c));
        }
    }
}

TEST(TestUtils, IsUpper)
{
    for (char c = char_min; c < char_max; ++c) {
        if (c >= 'A' && c <= 'Z') {
            EXPECT_TRUE(isupper(c));
        } else {
            EXPECT_FALSE(isupper(c));
        }
    }
}

TEST(TestUtils, IsAlnum)
{
    for (char c = char_min; c < char_max; ++c) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
            EXPECT_TRUE(isalnum(c));
        } else {
            EXPECT_FALSE(isalnum(c));
        }
    }
}

TEST(TestUtils, StringIequals)
{
    EXPECT_TRUE(string_iequals("cusip", "CUSIP"));
    EXPECT_TRUE(string_iequals("FiGi", "fIgI"));
    EXPECT_TRUE(string_iequals("", ""));
    EXPECT_FALSE(string_iequals("isin", "isi"));
    EXPECT_FALSE(string_iequals("isin", "isim"));
}

TEST(TestUtils, Prefix)
{
    EXPECT_STRV(prefix("US0378331005extra", 12), "US0378331005");
    EXPECT_STRV(prefix("037833100", 12), "037833100");
    EXPECT_STRV(prefix("", 8), "");
}

} // namespace
