// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#ifndef PNR_H
#define PNR_H

#ifdef __cplusplus
extern "C"
{
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

/**
 * @enum PNR_LOG_LEVEL
 *
 * Internal log levels, to be used when setting the minimum log level and cb.
 **/
typedef enum
{
    PNR_LOG_TRACE,
    PNR_LOG_DEBUG,
    PNR_LOG_INFO,
    PNR_LOG_WARN,
    PNR_LOG_ERROR,
    PNR_LOG_OFF,
} PNR_LOG_LEVEL;

/**
 * @typedef pnr_log_cb
 *
 * Callback that powers pnr_set_log_cb
 *
 * @param level The logging level.
 * @param function The native function that emitted the message. (nonnull)
 * @param file The file of the native function that emmitted the message. (nonnull)
 * @param line The line where the message was emmitted.
 * @param message The logging message. NUL-terminated
 * @param message_len The length of the logging message (excluding NUL terminator).
 */
typedef void (*pnr_log_cb)(
    PNR_LOG_LEVEL level, const char* function, const char* file, unsigned line,
    const char* message, uint64_t message_len);

/**
 * pnr_valid
 *
 * Validates a Swedish personal identity number (personnummer) of the form
 * [CC]YYMMDD[-+]NNNC, coordination numbers (day + 60) included.
 *
 * @param str The number to validate, not necessarily NUL-terminated.
 * @param length The length of the string, excluding any NUL terminator.
 *
 * @return true if the number is well formed, its check digit matches and its
 *         date exists, false otherwise or if str is NULL.
 **/
bool pnr_valid(const char *str, size_t length);

/**
 * pnr_valid_cstr
 *
 * Same as pnr_valid for a NUL-terminated string.
 *
 * @param str The number to validate. (nullable)
 *
 * @return whether the number is valid.
 **/
bool pnr_valid_cstr(const char *str);

/**
 * pnr_valid_int
 *
 * Validates the decimal representation of an integer, leading zeros can't be
 * represented so numbers starting with 0 must be validated as strings.
 *
 * @param value The number to validate.
 *
 * @return whether the number is valid.
 **/
bool pnr_valid_int(int64_t value);

/**
 * pnr_get_version
 *
 * Return the version of the library
 *
 * @return version Version string, note that this should not be freed
 **/
const char *pnr_get_version();

/**
 * pnr_set_log_cb
 *
 * Sets the callback to relay logging messages to the binding
 *
 * @param cb The callback to call, or NULL to stop relaying messages
 * @param min_level The minimum logging level for which to relay messages
 *
 * @return whether the operation succeeded or not
 *
 * @note This function is not thread-safe
 **/
bool pnr_set_log_cb(pnr_log_cb cb, PNR_LOG_LEVEL min_level);

#ifdef __cplusplus
}
#endif /* __cplusplus */

#endif /* PNR_H */
