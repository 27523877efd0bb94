// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstdint>
#include <string_view>

#include <fmt/format.h>

#include "alphanumeric.hpp"
#include "checksum/luhn_checksum.hpp"
#include "exception.hpp"
#include "identifier/isin.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace secid {

identifier validate_isin(std::string_view input)
{
    if (input.size() < isin_length) {
        throw too_short_error(fmt::format(
            "ISIN must be at least {} characters long, provided: {}", isin_length, input));
    }

    auto code = prefix(input, isin_length);
    if (code.starts_with(isin_vendor_prefix)) {
        SECID_DEBUG("Accepting vendor-assigned ISIN {}", code);
        return {identifier_type::isin, code, acceptance::vendor_prefix};
    }

    int64_t number = 0;
    try {
        number = alphanumeric_to_numeric(code);
    } catch (const overflow_error &e) {
        SECID_DEBUG("Accepting unverifiable ISIN: {}", e.what());
        return {identifier_type::isin, code, acceptance::numeric_overflow};
    }

    if (!is_valid_luhn(number)) {
        throw checksum_error(fmt::format("ISIN failed the Luhn verification, provided: {}", code));
    }

    return {identifier_type::isin, code, acceptance::checksum};
}

} // namespace secid
