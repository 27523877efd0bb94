// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string_view>

#include <fmt/format.h>

#include "alphanumeric.hpp"
#include "checksum/luhn_checksum.hpp"
#include "exception.hpp"
#include "identifier/figi.hpp"
#include "utils.hpp"

namespace secid {

identifier validate_figi(std::string_view input)
{
    if (input.size() < figi_length) {
        throw too_short_error(fmt::format(
            "FIGI must be at least {} characters long, provided: {}", figi_length, input));
    }

    auto code = prefix(input, figi_length);
    auto number = alphanumeric_to_numeric(code.substr(figi_prefix_length));
    if (!is_valid_luhn(number)) {
        throw checksum_error(fmt::format("FIGI failed the Luhn verification, provided: {}", code));
    }

    return {identifier_type::figi, code, acceptance::checksum};
}

} // namespace secid
