// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstdint>
#include <exception>
#include <string_view>

#include "checksum/double_add_double_checksum.hpp"
#include "checksum/luhn_checksum.hpp"
#include "exception.hpp"
#include "identifier/identifier.hpp"
#include "log.hpp"
#include "secid.h"
#include "version.hpp"

using namespace secid;

static_assert(static_cast<uint32_t>(log_level::trace) == SECID_LOG_TRACE);
static_assert(static_cast<uint32_t>(log_level::debug) == SECID_LOG_DEBUG);
static_assert(static_cast<uint32_t>(log_level::info) == SECID_LOG_INFO);
static_assert(static_cast<uint32_t>(log_level::warn) == SECID_LOG_WARN);
static_assert(static_cast<uint32_t>(log_level::error) == SECID_LOG_ERROR);
static_assert(static_cast<uint32_t>(log_level::off) == SECID_LOG_OFF);

static_assert(static_cast<int>(acceptance::checksum) == SECID_ACCEPT_CHECKSUM);
static_assert(static_cast<int>(acceptance::vendor_prefix) == SECID_ACCEPT_VENDOR_PREFIX);
static_assert(
    static_cast<int>(acceptance::missing_check_digit) == SECID_ACCEPT_MISSING_CHECK_DIGIT);
static_assert(static_cast<int>(acceptance::numeric_overflow) == SECID_ACCEPT_NUMERIC_OVERFLOW);

namespace {

SECID_RET_CODE error_kind_to_code(error_kind kind)
{
    switch (kind) {
    case error_kind::too_short:
        return SECID_ERR_TOO_SHORT;
    case error_kind::conversion:
    case error_kind::overflow:
        return SECID_ERR_CONVERSION;
    case error_kind::checksum:
        return SECID_ERR_CHECKSUM;
    }
    return SECID_ERR_INTERNAL;
}

SECID_RET_CODE validate(
    identifier_type type, const char *input, uint32_t length, secid_result *result)
{
    if (input == nullptr) {
        SECID_DEBUG("Null input provided for {} validation", identifier_type_to_str(type));
        return SECID_ERR_INVALID_ARGUMENT;
    }

    try {
        auto id = validate_identifier(type, std::string_view{input, length});
        if (result != nullptr) {
            result->code = id.code.data();
            result->length = static_cast<uint32_t>(id.code.size());
            result->acceptance = static_cast<SECID_ACCEPTANCE>(id.reason);
        }
        return id.verified() ? SECID_OK : SECID_UNVERIFIED;
    } catch (const validation_error &e) {
        SECID_DEBUG("{} validation failed ({}): {}", identifier_type_to_str(type),
            error_kind_to_str(e.kind()), e.what());
        return error_kind_to_code(e.kind());
    } catch (const std::exception &e) {
        SECID_ERROR("{}", e.what());
    } catch (...) {
        SECID_ERROR("unknown exception");
    }

    return SECID_ERR_INTERNAL;
}

} // namespace

extern "C" {

SECID_RET_CODE secid_validate(
    SECID_TYPE type, const char *input, uint32_t length, secid_result *result)
{
    switch (type) {
    case SECID_TYPE_FIGI:
        return validate(identifier_type::figi, input, length, result);
    case SECID_TYPE_ISIN:
        return validate(identifier_type::isin, input, length, result);
    case SECID_TYPE_CUSIP:
        return validate(identifier_type::cusip, input, length, result);
    }

    SECID_DEBUG("Unknown identifier type {}", static_cast<int>(type));
    return SECID_ERR_INVALID_ARGUMENT;
}

SECID_RET_CODE secid_validate_figi(const char *input, uint32_t length, secid_result *result)
{
    return validate(identifier_type::figi, input, length, result);
}

SECID_RET_CODE secid_validate_isin(const char *input, uint32_t length, secid_result *result)
{
    return validate(identifier_type::isin, input, length, result);
}

SECID_RET_CODE secid_validate_cusip(const char *input, uint32_t length, secid_result *result)
{
    return validate(identifier_type::cusip, input, length, result);
}

bool secid_is_valid_luhn(int64_t number) { return is_valid_luhn(number); }

bool secid_is_valid_modulus10_double_add_double(const char *code, uint32_t length)
{
    if (code == nullptr) {
        return false;
    }

    try {
        return is_valid_modulus10_double_add_double(std::string_view{code, length});
    } catch (const std::exception &e) {
        SECID_ERROR("{}", e.what());
    } catch (...) {
        SECID_ERROR("unknown exception");
    }

    return false;
}

const char *secid_get_version() { return current_version.data(); }

bool secid_set_log_cb(secid_log_cb cb, SECID_LOG_LEVEL min_level)
{
    auto level = static_cast<log_level>(min_level);
    logger::init(cb, level);
    SECID_INFO("Sending log messages to binding, min level {}", log_level_to_str(level));
    return true;
}

} // extern "C"
