// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstdint>
#include <string_view>

namespace secid {

enum class identifier_type : uint8_t { figi, isin, cusip };

// Reason for which a code was accepted, anything other than checksum means the
// code was returned without its check digit being verified.
enum class acceptance : uint8_t { checksum, vendor_prefix, missing_check_digit, numeric_overflow };

struct identifier {
    identifier_type type;
    // Canonical code, a view into the validated input
    std::string_view code;
    acceptance reason{acceptance::checksum};

    [[nodiscard]] bool verified() const noexcept { return reason == acceptance::checksum; }
};

identifier_type identifier_type_from_string(std::string_view str);
std::string_view identifier_type_to_str(identifier_type type);
std::string_view acceptance_to_str(acceptance value);

// Validates `input` according to the scheme of `type`, see validate_figi,
// validate_isin and validate_cusip.
identifier validate_identifier(identifier_type type, std::string_view input);

} // namespace secid
