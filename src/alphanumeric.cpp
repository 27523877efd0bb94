// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

#include <fmt/format.h>

#include "alphanumeric.hpp"
#include "exception.hpp"
#include "utils.hpp"

namespace secid {

namespace {

constexpr int letter_offset = 55;

} // namespace

int64_t alphanumeric_to_numeric(std::string_view str)
{
    if (str.empty()) {
        throw conversion_error("cannot convert an empty string to a number");
    }

    std::string digits;
    digits.reserve(str.size() * 2);
    for (const char c : str) {
        if (isdigit(c)) {
            digits.push_back(c);
        } else if (isalpha(c)) {
            fmt::format_to(std::back_inserter(digits), "{}", static_cast<int>(c) - letter_offset);
        } else {
            throw conversion_error(
                fmt::format("invalid character '{}' in alphanumeric code: {}", c, str));
        }
    }

    int64_t result = 0;
    const auto *end = digits.data() + digits.size();
    auto [ptr, err] = std::from_chars(digits.data(), end, result);
    if (err == std::errc::result_out_of_range) {
        throw overflow_error(fmt::format("value out of range converting {} ({})", str, digits));
    }

    if (err != std::errc{} || ptr != end) {
        throw conversion_error(fmt::format("invalid numeric expansion of {} ({})", str, digits));
    }

    return result;
}

} // namespace secid
