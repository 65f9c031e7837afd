// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstdint>
#include <string_view>

namespace pnr {

enum class validation_result : uint8_t {
    valid,
    malformed,
    excluded_serial,
    missing_check_digit,
    checksum_mismatch,
    invalid_date,
};

std::string_view validation_result_to_str(validation_result result);

// Runs the full pipeline and reports the first stage which rejected the input,
// only used for diagnostics, callers should rely on valid().
validation_result evaluate(std::string_view str) noexcept;

/**
 * Validates a Swedish personal identity number in one of the following forms:
 *   YYMMDDNNNC, YYMMDD-NNNC, YYMMDD+NNNC
 *   CCYYMMDDNNNC, CCYYMMDD-NNNC, CCYYMMDD+NNNC
 *
 * The century digits and separator are accepted but ignored, the checksum and
 * date are always derived from the two-digit year. Coordination numbers
 * (day + 60) are supported.
 *
 * @return true if the number is well formed, its check digit matches and its
 *         date exists.
 **/
bool valid(std::string_view str) noexcept;

/**
 * Validates the decimal representation of the given integer, leading zeros
 * are lost in the conversion so numbers born in years 00-09 must be
 * validated through the string form.
 **/
bool valid(int64_t value) noexcept;

} // namespace pnr
