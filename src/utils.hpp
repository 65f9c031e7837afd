// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
// (string, length), only for literals
#define STRL(value) value, sizeof(value) - 1
// NOLINTEND(cppcoreguidelines-macro-usage)

namespace pnr {

// Locale-independent, ASCII only
inline bool isdigit(char c) { return static_cast<unsigned>(c) - '0' < 10; }
inline bool isseparator(char c) { return c == '-' || c == '+'; }

inline bool all_digits(std::string_view str)
{
    for (auto c : str) {
        if (!isdigit(c)) {
            return false;
        }
    }
    return true;
}

// Returns the number of leading digits
inline std::size_t count_digits(std::string_view str)
{
    std::size_t count = 0;
    while (count < str.size() && isdigit(str[count])) { ++count; }
    return count;
}

template <typename T> std::pair<bool, T> from_string(std::string_view str);

} // namespace pnr
