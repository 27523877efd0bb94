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

// A CUSIP without its check digit
constexpr std::size_t cusip_min_length = 8;
constexpr std::size_t cusip_length = 9;
constexpr std::string_view cusip_vendor_prefix = "BL";

// Extracts the CUSIP at the start of `input`: an input of exactly eight
// characters is taken whole and accepted without a check digit, longer inputs
// are truncated to nine characters and verified with the modulus 10
// double-add-double algorithm.
//
// Throws too_short_error or checksum_error.
identifier validate_cusip(std::string_view input);

} // namespace secid
