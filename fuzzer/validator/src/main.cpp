// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string_view>

#include <fmt/format.h>

#include "pnr.h"
#include "utils.hpp"
#include "validator.hpp"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *bytes, size_t size)
{
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    const std::string_view str{reinterpret_cast<const char *>(bytes), size};

    const auto result = pnr::valid(str);
    if (result != pnr_valid(str.data(), str.size())) {
        __builtin_trap();
    }

    // Integer rendering only exists for digit strings without a leading zero
    if (!str.empty() && str.size() <= 12 && str.front() != '0' && pnr::all_digits(str)) {
        auto [res, value] = pnr::from_string<int64_t>(str);
        if (!res || pnr::valid(value) != result) {
            __builtin_trap();
        }
    }

    if (size >= sizeof(int64_t)) {
        int64_t value;
        memcpy(&value, bytes, sizeof(value));
        const fmt::format_int rendered{value};
        if (pnr::valid(value) != pnr::valid(std::string_view{rendered.data(), rendered.size()})) {
            __builtin_trap();
        }
    }

    return 0;
}
