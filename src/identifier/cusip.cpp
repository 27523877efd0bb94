// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string_view>

#include <fmt/format.h>

#include "checksum/double_add_double_checksum.hpp"
#include "exception.hpp"
#include "identifier/cusip.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace secid {

identifier validate_cusip(std::string_view input)
{
    if (input.size() < cusip_min_length) {
        throw too_short_error(fmt::format(
            "CUSIP must be at least {} characters long, provided: {}", cusip_min_length, input));
    }

    auto code = prefix(input, input.size() == cusip_min_length ? cusip_min_length : cusip_length);
    if (code.starts_with(cusip_vendor_prefix)) {
        SECID_DEBUG("Accepting vendor-assigned CUSIP {}", code);
        return {identifier_type::cusip, code, acceptance::vendor_prefix};
    }

    if (!is_valid_modulus10_double_add_double(code)) {
        SECID_DEBUG(
            "CUSIP failed the Modulus 10 Double Add Double verification, provided: {}", code);
        throw checksum_error(fmt::format(
            "CUSIP failed the Modulus 10 Double Add Double verification, provided: {}", code));
    }

    if (code.size() != cusip_length) {
        return {identifier_type::cusip, code, acceptance::missing_check_digit};
    }

    return {identifier_type::cusip, code, acceptance::checksum};
}

} // namespace secid
