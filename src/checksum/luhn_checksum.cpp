// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "checksum/luhn_checksum.hpp"
#include "utils.hpp"

namespace pnr {

namespace {

// Precomputed doubled values
//   for num from 0 to 9: (2 * num) / 10 + (2 * num) % 10
constexpr std::array<uint8_t, 10> doubled_lut = {0, 2, 4, 6, 8, 1, 3, 5, 7, 9};

} // namespace

std::optional<unsigned> luhn_checksum::compute(std::string_view payload) const noexcept
{
    if (payload.empty()) {
        return std::nullopt;
    }

    // The rightmost payload digit is always doubled
    uint32_t sum = 0;
    bool should_double = true;
    for (std::size_t i = payload.size(); i > 0; --i) {
        const auto c = payload[i - 1];
        if (!pnr::isdigit(c)) {
            return std::nullopt;
        }

        const auto d = static_cast<uint32_t>(c - '0');
        sum += should_double ? doubled_lut[d] : d;
        should_double = !should_double;
    }

    return (10U - (sum % 10U)) % 10U;
}

bool luhn_checksum::validate(std::string_view str) const noexcept
{
    if (str.size() < 2 || !pnr::isdigit(str.back())) {
        return false;
    }

    auto expected = compute(str.substr(0, str.size() - 1));
    return expected.has_value() && *expected == static_cast<unsigned>(str.back() - '0');
}

} // namespace pnr
