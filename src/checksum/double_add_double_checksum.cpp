// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <optional>
#include <string_view>

#include "checksum/double_add_double_checksum.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace secid {

namespace {

// Digits are worth their value, 'A' is 10 and each subsequent character one
// more, lowercase letters included ('a' is 42). '*', '@' and '#' are 36 to 38.
std::optional<unsigned> character_value(char c)
{
    if (isdigit(c)) {
        return static_cast<unsigned>(c - '0');
    }

    if (isalpha(c)) {
        return static_cast<unsigned>(c - 'A') + 10;
    }

    switch (c) {
    case '*':
        return 36;
    case '@':
        return 37;
    case '#':
        return 38;
    default:
        break;
    }

    return std::nullopt;
}

} // namespace

bool is_valid_modulus10_double_add_double(std::string_view code)
{
    if (code.size() != double_add_double_code_length) {
        SECID_WARN("CUSIP missing check digit, assuming valid: {}", code);
        return true;
    }

    const char check_char = code[double_add_double_code_length - 1];
    if (!isdigit(check_char)) {
        return false;
    }

    unsigned sum = 0;
    for (std::size_t i = 0; i < double_add_double_code_length - 1; ++i) {
        auto value = character_value(code[i]);
        if (!value.has_value()) {
            return false;
        }

        auto num = *value;
        if ((i & 0x01) != 0) {
            num *= 2;
        }

        // Add the individual digits rather than the whole number
        sum += num % 10;
        for (num /= 10; num != 0; num /= 10) {
            sum += num;
        }
    }

    const auto check_digit = static_cast<unsigned>(check_char - '0');
    return check_digit == (10 - sum % 10) % 10;
}

} // namespace secid
