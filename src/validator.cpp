// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include <fmt/format.h>

#include "calendar.hpp"
#include "checksum/luhn_checksum.hpp"
#include "log.hpp"
#include "parser.hpp"
#include "validator.hpp"

namespace pnr {

namespace {

// YYMMDDNNN
constexpr std::size_t payload_length = 9;

} // namespace

std::string_view validation_result_to_str(validation_result result)
{
    switch (result) {
    case validation_result::valid:
        return "valid";
    case validation_result::malformed:
        return "malformed";
    case validation_result::excluded_serial:
        return "excluded serial";
    case validation_result::missing_check_digit:
        return "missing check digit";
    case validation_result::checksum_mismatch:
        return "checksum mismatch";
    case validation_result::invalid_date:
        return "invalid date";
    }

    return "unknown";
}

validation_result evaluate(std::string_view str) noexcept
{
    auto [status, fields] = parse_candidate(str);
    if (status == parse_status::malformed) {
        return validation_result::malformed;
    }

    if (status == parse_status::excluded_serial) {
        return validation_result::excluded_serial;
    }

    if (!fields.check_digit.has_value()) {
        return validation_result::missing_check_digit;
    }

    // The check digit is computed over the raw day, including the coordination offset
    std::array<char, payload_length> payload{};
    auto out = fmt::format_to_n(payload.data(), payload.size(), "{:02}{:02}{:02}{:03}",
        fields.year, fields.month, fields.day, fields.serial);
    if (out.size != payload_length) {
        return validation_result::malformed;
    }

    auto expected = luhn_checksum{}.compute({payload.data(), payload.size()});
    PNR_TRACE("computed check digit {}, found {}", expected.value_or(0), *fields.check_digit);
    if (!expected.has_value() || *expected != *fields.check_digit) {
        return validation_result::checksum_mismatch;
    }

    if (!is_valid_date(fields.year, fields.month, fields.day)) {
        return validation_result::invalid_date;
    }

    return validation_result::valid;
}

bool valid(std::string_view str) noexcept
{
    auto result = evaluate(str);
    if (result != validation_result::valid) {
        PNR_DEBUG("rejected input of length {}: {}", str.size(), validation_result_to_str(result));
        return false;
    }
    return true;
}

bool valid(int64_t value) noexcept
{
    const fmt::format_int str{value};
    return valid(std::string_view{str.data(), str.size()});
}

} // namespace pnr
