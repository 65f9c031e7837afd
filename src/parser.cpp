// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

#include "parser.hpp"
#include "utils.hpp"

using namespace std::literals;

namespace pnr {

namespace {

// YYMMDD and CCYYMMDD
constexpr std::size_t short_date_length = 6;
constexpr std::size_t long_date_length = 8;
// NNN and NNNC
constexpr std::size_t serial_length = 3;
constexpr std::size_t serial_with_check_length = 4;

constexpr std::string_view excluded_serial = "000"sv;

bool parse_field(std::string_view str, unsigned &output)
{
    if (!all_digits(str)) {
        return false;
    }

    auto [res, value] = from_string<unsigned>(str);
    if (res) {
        output = value;
    }
    return res;
}

// Splits the input into its date and serial blocks, returns false if the
// input doesn't have the expected shape.
bool split(std::string_view str, std::string_view &date, std::optional<char> &separator,
    std::string_view &tail)
{
    const auto leading_digits = count_digits(str);
    if (leading_digits < str.size()) {
        // A separator can only follow a complete date
        if (leading_digits != short_date_length && leading_digits != long_date_length) {
            return false;
        }

        if (!isseparator(str[leading_digits])) {
            return false;
        }

        date = str.substr(0, leading_digits);
        separator = str[leading_digits];
        tail = str.substr(leading_digits + 1);
        return all_digits(tail) &&
               (tail.size() == serial_length || tail.size() == serial_with_check_length);
    }

    // Digits only, the length alone determines whether the century is present
    if (str.size() < short_date_length + serial_length ||
        str.size() > long_date_length + serial_with_check_length) {
        return false;
    }

    const auto date_length =
        str.size() <= short_date_length + serial_with_check_length ? short_date_length
                                                                   : long_date_length;
    date = str.substr(0, date_length);
    tail = str.substr(date_length);
    return true;
}

} // namespace

std::string_view parse_status_to_str(parse_status status)
{
    switch (status) {
    case parse_status::ok:
        return "ok";
    case parse_status::malformed:
        return "malformed";
    case parse_status::excluded_serial:
        return "excluded serial";
    }

    return "unknown";
}

std::pair<parse_status, candidate> parse_candidate(std::string_view str) noexcept
{
    std::string_view date;
    std::string_view tail;
    candidate result;

    if (str.empty() || !split(str, date, result.separator, tail)) {
        return {parse_status::malformed, {}};
    }

    std::size_t offset = 0;
    if (date.size() == long_date_length) {
        unsigned century = 0;
        if (!parse_field(date.substr(0, 2), century)) {
            return {parse_status::malformed, {}};
        }
        result.century = century;
        offset = 2;
    }

    if (!parse_field(date.substr(offset, 2), result.year) ||
        !parse_field(date.substr(offset + 2, 2), result.month) ||
        !parse_field(date.substr(offset + 4, 2), result.day)) {
        return {parse_status::malformed, {}};
    }

    auto serial = tail.substr(0, serial_length);
    if (serial == excluded_serial) {
        return {parse_status::excluded_serial, {}};
    }

    if (!parse_field(serial, result.serial)) {
        return {parse_status::malformed, {}};
    }

    if (tail.size() == serial_with_check_length) {
        unsigned check_digit = 0;
        if (!parse_field(tail.substr(serial_length), check_digit)) {
            return {parse_status::malformed, {}};
        }
        result.check_digit = check_digit;
    }

    return {parse_status::ok, result};
}

} // namespace pnr
