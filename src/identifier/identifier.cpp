// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <stdexcept>
#include <string_view>

#include "identifier/cusip.hpp"
#include "identifier/figi.hpp"
#include "identifier/identifier.hpp"
#include "identifier/isin.hpp"
#include "utils.hpp"

namespace secid {

identifier_type identifier_type_from_string(std::string_view str)
{
    if (string_iequals(str, "figi")) {
        return identifier_type::figi;
    }

    if (string_iequals(str, "isin")) {
        return identifier_type::isin;
    }

    if (string_iequals(str, "cusip")) {
        return identifier_type::cusip;
    }

    throw std::invalid_argument("unknown identifier type");
}

std::string_view identifier_type_to_str(identifier_type type)
{
    switch (type) {
    case identifier_type::figi:
        return "FIGI";
    case identifier_type::isin:
        return "ISIN";
    case identifier_type::cusip:
        return "CUSIP";
    }
    return "unknown";
}

std::string_view acceptance_to_str(acceptance value)
{
    switch (value) {
    case acceptance::checksum:
        return "checksum";
    case acceptance::vendor_prefix:
        return "vendor_prefix";
    case acceptance::missing_check_digit:
        return "missing_check_digit";
    case acceptance::numeric_overflow:
        return "numeric_overflow";
    }
    return "unknown";
}

identifier validate_identifier(identifier_type type, std::string_view input)
{
    switch (type) {
    case identifier_type::figi:
        return validate_figi(input);
    case identifier_type::isin:
        return validate_isin(input);
    case identifier_type::cusip:
        return validate_cusip(input);
    }

    throw std::invalid_argument("unknown identifier type");
}

} // namespace secid
