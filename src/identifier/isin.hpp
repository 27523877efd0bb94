// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <string_view>

#include "identifier/identifier.hpp"

namespace secid {

constexpr std::size_t isin_length = 12;
// Bloomberg identifiers stored in place of an ISIN, these don't carry an ISIN
// check digit.
constexpr std::string_view isin_vendor_prefix = "BBG";

// Extracts the ISIN at the start of `input` and verifies it with the Luhn
// algorithm over the numeric expansion of all twelve characters.
//
// Codes with the vendor prefix, or whose expansion doesn't fit in an int64_t,
// are accepted without verification.
//
// Throws too_short_error, conversion_error or checksum_error.
identifier validate_isin(std::string_view input);

} // namespace secid
