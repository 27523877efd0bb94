// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string_view>

#include "exception.hpp"
#include "identifier/cusip.hpp"

#include "common/gtest_utils.hpp"

using namespace secid;
using namespace std::literals;

namespace {

TEST(TestCUSIP, Valid)
{
    for (auto code : {"037833100"sv, "594918104"sv, "17275R102"sv, "38259P508"sv, "912828ZQ6"sv,
             "00206RCN0"sv}) {
        auto id = validate_cusip(code);
        EXPECT_EQ(id.type, identifier_type::cusip);
        EXPECT_STRV(id.code, code);
        EXPECT_EQ(id.reason, acceptance::checksum);
        EXPECT_TRUE(id.verified());
    }
}

TEST(TestCUSIP, TrailingCharacters)
{
    EXPECT_STRV(validate_cusip("037833100extra").code, "037833100");
    EXPECT_STRV(validate_cusip("0378331001").code, "037833100");
    EXPECT_STRV(validate_cusip("17275R102 Cisco").code, "17275R102");
}

TEST(TestCUSIP, TooShort)
{
    EXPECT_THROW(validate_cusip(""), too_short_error);
    EXPECT_THROW(validate_cusip("0378331"), too_short_error);
    EXPECT_THROW(validate_cusip("BL"), too_short_error);

    try {
        validate_cusip("0378");
        FAIL() << "expected too_short_error";
    } catch (const too_short_error &e) {
        EXPECT_EQ(e.kind(), error_kind::too_short);
        EXPECT_THAT(e.what(), testing::HasSubstr("0378"));
    }
}

TEST(TestCUSIP, ChecksumFailed)
{
    test::log_capture logs;

    EXPECT_THROW(validate_cusip("037833101"), checksum_error);
    EXPECT_TRUE(logs.contains(
        SECID_LOG_DEBUG, "Modulus 10 Double Add Double verification, provided: 037833101"));

    EXPECT_THROW(validate_cusip("037833101extra"), checksum_error);
    EXPECT_THROW(validate_cusip("17275r102"), checksum_error);
    EXPECT_THROW(validate_cusip("17275R101"), checksum_error);
    EXPECT_THROW(validate_cusip("03783310X"), checksum_error);
    EXPECT_THROW(validate_cusip("0378-3100"), checksum_error);
}

TEST(TestCUSIP, LowercaseLetters)
{
    auto id = validate_cusip("17275r101extra");
    EXPECT_STRV(id.code, "17275r101");
    EXPECT_EQ(id.reason, acceptance::checksum);
}

TEST(TestCUSIP, MissingCheckDigit)
{
    test::log_capture logs;

    auto id = validate_cusip("03783310");
    EXPECT_STRV(id.code, "03783310");
    EXPECT_EQ(id.reason, acceptance::missing_check_digit);
    EXPECT_FALSE(id.verified());
    EXPECT_TRUE(logs.contains(SECID_LOG_WARN, "03783310"));

    // Any eight characters are accepted
    EXPECT_EQ(validate_cusip("zzzzzzzz").reason, acceptance::missing_check_digit);
}

TEST(TestCUSIP, VendorPrefix)
{
    for (auto code : {"BL0000000"sv, "BLZZZZZZZ"sv, "BL#######"sv, "BL000000"sv}) {
        auto id = validate_cusip(code);
        EXPECT_STRV(id.code, code);
        EXPECT_EQ(id.reason, acceptance::vendor_prefix);
        EXPECT_FALSE(id.verified());
    }

    EXPECT_STRV(validate_cusip("BL1234567extra").code, "BL1234567");
}

} // namespace
