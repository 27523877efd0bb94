// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstdint>

namespace secid {

// The least significant digit is the check digit, doubling starts on the digit
// immediately to its left. Zero is valid, negative numbers never are.
[[nodiscard]] bool is_valid_luhn(int64_t number) noexcept;

} // namespace secid
