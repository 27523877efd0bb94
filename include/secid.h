// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#ifndef SECID_H
#define SECID_H

#ifdef __cplusplus
extern "C"
{
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

/**
 * @enum SECID_TYPE
 *
 * Identifier schemes supported by secid_validate.
 **/
typedef enum
{
    SECID_TYPE_FIGI  = 0,
    SECID_TYPE_ISIN  = 1,
    SECID_TYPE_CUSIP = 2,
} SECID_TYPE;

/**
 * @enum SECID_RET_CODE
 *
 * Codes returned by the validation functions.
 **/
typedef enum
{
    SECID_ERR_INTERNAL         = -5,
    SECID_ERR_INVALID_ARGUMENT = -4,
    // The code is well formed but its check digit is wrong
    SECID_ERR_CHECKSUM         = -3,
    // The code contains characters which can't be expanded to a number
    SECID_ERR_CONVERSION       = -2,
    SECID_ERR_TOO_SHORT        = -1,
    SECID_OK                   = 0,
    // The code was accepted without its check digit being verified
    SECID_UNVERIFIED           = 1,
} SECID_RET_CODE;

/**
 * @enum SECID_ACCEPTANCE
 *
 * Reason for which a code was accepted.
 **/
typedef enum
{
    SECID_ACCEPT_CHECKSUM            = 0,
    SECID_ACCEPT_VENDOR_PREFIX       = 1,
    SECID_ACCEPT_MISSING_CHECK_DIGIT = 2,
    SECID_ACCEPT_NUMERIC_OVERFLOW    = 3,
} SECID_ACCEPTANCE;

/**
 * @enum SECID_LOG_LEVEL
 *
 * Internal log levels, to be used when setting the minimum log level and cb.
 **/
typedef enum
{
    SECID_LOG_TRACE,
    SECID_LOG_DEBUG,
    SECID_LOG_INFO,
    SECID_LOG_WARN,
    SECID_LOG_ERROR,
    SECID_LOG_OFF,
} SECID_LOG_LEVEL;

typedef struct _secid_result secid_result;

struct _secid_result
{
    /** Start of the canonical code, points within the validated input */
    const char *code;
    /** Length of the canonical code */
    uint32_t length;
    /** Reason for which the code was accepted */
    SECID_ACCEPTANCE acceptance;
};

/**
 * @typedef secid_log_cb
 *
 * Callback used to relay log messages to the caller.
 *
 * @param level The logging level.
 * @param function The native function that emitted the message. (nonnull)
 * @param file The file of the native function that emitted the message. (nonnull)
 * @param line The line where the message was emitted.
 * @param message The logging message, NUL-terminated. (nonnull)
 * @param message_len The length of the logging message (excluding NUL terminator).
 */
typedef void (*secid_log_cb)(
    SECID_LOG_LEVEL level, const char* function, const char* file, unsigned line,
    const char* message, uint64_t message_len);

/**
 * secid_validate
 *
 * Extracts and validates the identifier at the start of the input.
 *
 * @param type Identifier scheme.
 * @param input String starting with the identifier, may contain trailing characters. (nonnull)
 * @param length Length of the input.
 * @param result Canonical code and acceptance, only written on success. (nullable)
 *
 * @return SECID_OK or SECID_UNVERIFIED on success, a negative error code otherwise.
 **/
SECID_RET_CODE secid_validate(SECID_TYPE type, const char *input, uint32_t length,
    secid_result *result);

/**
 * secid_validate_figi
 *
 * Same as secid_validate with SECID_TYPE_FIGI.
 **/
SECID_RET_CODE secid_validate_figi(const char *input, uint32_t length, secid_result *result);

/**
 * secid_validate_isin
 *
 * Same as secid_validate with SECID_TYPE_ISIN.
 **/
SECID_RET_CODE secid_validate_isin(const char *input, uint32_t length, secid_result *result);

/**
 * secid_validate_cusip
 *
 * Same as secid_validate with SECID_TYPE_CUSIP.
 **/
SECID_RET_CODE secid_validate_cusip(const char *input, uint32_t length, secid_result *result);

/**
 * secid_is_valid_luhn
 *
 * @param number Number ending with its check digit.
 *
 * @return whether the number passes the Luhn check
 **/
bool secid_is_valid_luhn(int64_t number);

/**
 * secid_is_valid_modulus10_double_add_double
 *
 * @param code Nine character code ending with its check digit. (nonnull)
 * @param length Length of the code.
 *
 * @return whether the code passes the check, codes of any other length are
 *         reported as valid.
 **/
bool secid_is_valid_modulus10_double_add_double(const char *code, uint32_t length);

/**
 * secid_get_version
 *
 * Return the version of the library
 *
 * @return version Version string, note that this should not be freed
 **/
const char *secid_get_version();

/**
 * secid_set_log_cb
 *
 * Sets the callback to relay logging messages to the caller
 *
 * @param cb The callback to call, or NULL to stop relaying messages
 * @param min_level The minimum logging level for which to relay messages
 *
 * @return whether the operation succeeded or not
 *
 * @note This function is not thread-safe
 **/
bool secid_set_log_cb(secid_log_cb cb, SECID_LOG_LEVEL min_level);

#ifdef __cplusplus
}
#endif /* __cplusplus */

#endif /* SECID_H */
