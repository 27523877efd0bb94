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

constexpr std::size_t figi_length = 12;
// Characters reserved for the issuer prefix, excluded from the checksum
constexpr std::size_t figi_prefix_length = 3;

// Extracts the FIGI at the start of `input`, which may be followed by any other
// characters, and verifies it with the Luhn algorithm over the numeric
// expansion of its last nine characters.
//
// Throws too_short_error, conversion_error or checksum_error.
identifier validate_figi(std::string_view input);

} // namespace secid
