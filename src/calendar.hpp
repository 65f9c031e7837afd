// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

namespace pnr {

// Coordination numbers encode the day of birth as day + 60
constexpr unsigned coordination_day_offset = 60;

// Two-digit years are always resolved within [2000, 2099]
constexpr int two_digit_year_base = 2000;

// Strict Gregorian check of a two-digit year date, days above 60 are treated
// as coordination days.
bool is_valid_date(unsigned year, unsigned month, unsigned day) noexcept;

} // namespace pnr
