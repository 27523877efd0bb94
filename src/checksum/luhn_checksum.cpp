// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <cstdint>

#include "checksum/luhn_checksum.hpp"

namespace secid {

bool is_valid_luhn(int64_t number) noexcept
{
    // Precomputed doubled values
    //   for num from 0 to 9: (2 * num) / 10 + (2 * num) % 10
    static constexpr std::array<uint8_t, 10> lut = {0, 2, 4, 6, 8, 1, 3, 5, 7, 9};

    if (number < 0) {
        return false;
    }

    uint32_t sum = 0;
    bool should_double = false;
    for (; number > 0; number /= 10) {
        const auto d = static_cast<uint32_t>(number % 10);
        sum += should_double ? lut[d] : d;
        should_double = !should_double;
    }

    return sum % 10U == 0U;
}

} // namespace secid
