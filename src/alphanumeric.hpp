// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstdint>
#include <string_view>

namespace secid {

// Expands every letter into the decimal digits of (c - 55), so that 'A' is 10
// and 'Z' is 35, copies digits verbatim and parses the concatenation.
//
// Throws conversion_error on empty input or non-alphanumeric characters and
// overflow_error when the expansion exceeds INT64_MAX.
int64_t alphanumeric_to_numeric(std::string_view str);

} // namespace secid
