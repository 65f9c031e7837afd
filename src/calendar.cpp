// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <chrono>

#include "calendar.hpp"

namespace pnr {

namespace {

constexpr unsigned max_two_digit_year = 99;
constexpr unsigned max_month = 12;
constexpr unsigned max_day = 31;

} // namespace

bool is_valid_date(unsigned year, unsigned month, unsigned day) noexcept
{
    if (day > coordination_day_offset) {
        day -= coordination_day_offset;
    }

    // std::chrono::month and day only guarantee values up to 255
    if (year > max_two_digit_year || month > max_month || day > max_day) {
        return false;
    }

    const std::chrono::year_month_day date{
        std::chrono::year{two_digit_year_base + static_cast<int>(year)},
        std::chrono::month{month}, std::chrono::day{day}};

    return date.ok();
}

} // namespace pnr
