// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include <fmt/core.h> // IWYU pragma: keep

#include "secid.h"

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define SECID_LOG_HELPER(level, function, file, line, fmt_str, ...)                                \
    {                                                                                              \
        if (secid::logger::valid(level)) {                                                         \
            try {                                                                                  \
                constexpr const char *secid_log_filename_ = secid::base_name(file);                \
                auto secid_log_message_ = fmt::format(fmt_str, ##__VA_ARGS__);                     \
                secid::logger::log(                                                                \
                    level, function, secid_log_filename_, line, secid_log_message_.c_str(),        \
                    secid_log_message_.size());                                                    \
            } catch (...) {}                                                                       \
        }                                                                                          \
    }

#define SECID_LOG(level, fmt, ...)                                                                 \
    SECID_LOG_HELPER(level, __func__, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define SECID_TRACE(fmt, ...) SECID_LOG(secid::log_level::trace, fmt, ##__VA_ARGS__)
#define SECID_DEBUG(fmt, ...) SECID_LOG(secid::log_level::debug, fmt, ##__VA_ARGS__)
#define SECID_INFO(fmt, ...) SECID_LOG(secid::log_level::info, fmt, ##__VA_ARGS__)
#define SECID_WARN(fmt, ...) SECID_LOG(secid::log_level::warn, fmt, ##__VA_ARGS__)
#define SECID_ERROR(fmt, ...) SECID_LOG(secid::log_level::error, fmt, ##__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)

namespace secid {

constexpr const char *base_name(const char *path)
{
    const char *base = path;
    for (; *path != '\0'; ++path) {
        if (*path == '/' || *path == '\\') {
            base = path + 1;
        }
    }
    return base;
}

// This enum is 32 bit for compatibility with SECID_LOG_LEVEL
// NOLINTNEXTLINE(performance-enum-size)
enum class log_level : uint32_t { trace, debug, info, warn, error, off };

inline std::string_view log_level_to_str(log_level level)
{
    switch (level) {
    case log_level::trace:
        return "trace";
    case log_level::debug:
        return "debug";
    case log_level::error:
        return "error";
    case log_level::warn:
        return "warn";
    case log_level::info:
        return "info";
    case log_level::off:
        break;
    }

    return "off";
}

class logger {
public:
    using log_cb_type = secid_log_cb;

    // Validators may log from any thread
    static void init(log_cb_type cb, log_level min_level);
    static bool valid(log_level level)
    {
        return cb.load(std::memory_order_acquire) != nullptr &&
               level >= min_level.load(std::memory_order_relaxed);
    }
    static void log(log_level level, const char *function, const char *file, unsigned line,
        const char *message, size_t length);

private:
    static std::atomic<log_cb_type> cb;
    static std::atomic<log_level> min_level;
};

} // namespace secid
