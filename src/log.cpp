// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <atomic>
#include <cstddef>

#include "log.hpp"

namespace secid {

std::atomic<logger::log_cb_type> logger::cb{nullptr};
std::atomic<log_level> logger::min_level{log_level::off};

void logger::init(log_cb_type cb, log_level min_level)
{
    logger::min_level.store(min_level, std::memory_order_relaxed);
    logger::cb.store(cb, std::memory_order_release);
}

void logger::log(log_level level, const char *function, const char *file, unsigned line,
    const char *message, size_t length)
{
    auto *sink = logger::cb.load(std::memory_order_acquire);
    if (sink != nullptr) {
        sink(static_cast<SECID_LOG_LEVEL>(level), function, file, line, message, length);
    }
}

} // namespace secid
