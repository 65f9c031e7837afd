// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

namespace pnr {

// Fields extracted from [CC]YYMMDD[-+]NNN[C], only valid for the duration of
// a single validation.
struct candidate {
    // Leading two digits of a 12-digit number, never used for validation
    std::optional<unsigned> century{std::nullopt};
    unsigned year{0};
    unsigned month{0};
    // Coordination numbers carry the day of birth plus 60
    unsigned day{0};
    std::optional<char> separator{std::nullopt};
    unsigned serial{0};
    std::optional<unsigned> check_digit{std::nullopt};
};

enum class parse_status : uint8_t { ok, malformed, excluded_serial };

std::string_view parse_status_to_str(parse_status status);

// Fixed-width parser, the returned candidate is only meaningful when the
// status is parse_status::ok.
std::pair<parse_status, candidate> parse_candidate(std::string_view str) noexcept;

} // namespace pnr
