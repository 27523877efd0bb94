// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstdint>
#include <exception>
#include <string>
#include <string_view>
#include <utility>

namespace secid {

enum class error_kind : uint8_t { too_short, conversion, overflow, checksum };

inline std::string_view error_kind_to_str(error_kind kind)
{
    switch (kind) {
    case error_kind::too_short:
        return "too_short";
    case error_kind::conversion:
        return "conversion";
    case error_kind::overflow:
        return "overflow";
    case error_kind::checksum:
        return "checksum";
    }
    return "unknown";
}

// Base of all validation failures, the message includes the offending input.
class validation_error : public std::exception {
public:
    validation_error(error_kind kind, std::string message)
        : kind_(kind), message_(std::move(message))
    {}

    [[nodiscard]] const char *what() const noexcept override { return message_.c_str(); }
    [[nodiscard]] error_kind kind() const noexcept { return kind_; }

protected:
    error_kind kind_;
    std::string message_;
};

class too_short_error : public validation_error {
public:
    explicit too_short_error(std::string message)
        : validation_error(error_kind::too_short, std::move(message))
    {}
};

class conversion_error : public validation_error {
public:
    explicit conversion_error(std::string message)
        : validation_error(error_kind::conversion, std::move(message))
    {}

protected:
    conversion_error(error_kind kind, std::string message)
        : validation_error(kind, std::move(message))
    {}
};

// The numeric expansion of a code doesn't fit in an int64_t
class overflow_error : public conversion_error {
public:
    explicit overflow_error(std::string message)
        : conversion_error(error_kind::overflow, std::move(message))
    {}
};

class checksum_error : public validation_error {
public:
    explicit checksum_error(std::string message)
        : validation_error(error_kind::checksum, std::move(message))
    {}
};

} // namespace secid
