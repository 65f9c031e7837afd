// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <optional>
#include <string_view>

namespace pnr {

// Mod-10 check digit. Every other payload digit is doubled starting with the
// one next to the check digit, for a 9-digit payload these are the even
// (0-based) indices.
class luhn_checksum {
public:
    // Check digit for a digits-only payload, nullopt if the payload is empty
    // or contains anything other than ASCII digits.
    [[nodiscard]] std::optional<unsigned> compute(std::string_view payload) const noexcept;
    // Whether the last digit of the input is the check digit of the rest
    [[nodiscard]] bool validate(std::string_view str) const noexcept;
};

} // namespace pnr
