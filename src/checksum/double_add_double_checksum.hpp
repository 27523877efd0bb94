// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <string_view>

namespace secid {

constexpr std::size_t double_add_double_code_length = 9;

// Modulus 10 "double-add-double" check digit used by CUSIP, the code is made of
// eight data characters followed by the check digit.
//
// A code which isn't exactly nine characters long has no check digit to verify,
// a warning is logged and the code is considered valid.
[[nodiscard]] bool is_valid_modulus10_double_add_double(std::string_view code);

} // namespace secid
