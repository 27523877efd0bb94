// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <string_view>

namespace secid {

// Locale-independent ASCII classification, std::isdigit and friends depend on
// the global locale and take an int.
// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
inline bool isalpha(char c) { return (static_cast<unsigned>(c) | 32) - 'a' < 26; }
inline bool isdigit(char c) { return static_cast<unsigned>(c) - '0' < 10; }
inline bool isupper(char c) { return static_cast<unsigned>(c) - 'A' < 26; }
inline bool isalnum(char c) { return isalpha(c) || isdigit(c); }
inline char tolower(char c) { return isupper(c) ? static_cast<char>(c | 32) : c; }
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

bool string_iequals(std::string_view left, std::string_view right);

// Returns the first `length` characters of `str`, or all of it when shorter.
inline std::string_view prefix(std::string_view str, std::size_t length)
{
    return str.substr(0, length);
}

} // namespace secid
