// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <exception>
#include <string_view>

#include "log.hpp"
#include "pnr.h"
#include "validator.hpp"
#include "version.hpp"

// Log level compatibility
static_assert(
    static_cast<uint32_t>(pnr::log_level::trace) == static_cast<uint32_t>(PNR_LOG_TRACE));
static_assert(
    static_cast<uint32_t>(pnr::log_level::debug) == static_cast<uint32_t>(PNR_LOG_DEBUG));
static_assert(
    static_cast<uint32_t>(pnr::log_level::info) == static_cast<uint32_t>(PNR_LOG_INFO));
static_assert(
    static_cast<uint32_t>(pnr::log_level::warn) == static_cast<uint32_t>(PNR_LOG_WARN));
static_assert(
    static_cast<uint32_t>(pnr::log_level::error) == static_cast<uint32_t>(PNR_LOG_ERROR));
static_assert(
    static_cast<uint32_t>(pnr::log_level::off) == static_cast<uint32_t>(PNR_LOG_OFF));

bool pnr_valid(const char *str, size_t length)
{
    if (str == nullptr) {
        PNR_DEBUG("tried to validate a null string");
        return false;
    }

    try {
        return pnr::valid(std::string_view{str, length});
    } catch (const std::exception &e) {
        PNR_ERROR("{}", e.what());
    } catch (...) {
        PNR_ERROR("unknown exception");
    }

    return false;
}

bool pnr_valid_cstr(const char *str)
{
    if (str == nullptr) {
        PNR_DEBUG("tried to validate a null string");
        return false;
    }

    return pnr_valid(str, strlen(str));
}

bool pnr_valid_int(int64_t value)
{
    try {
        return pnr::valid(value);
    } catch (const std::exception &e) {
        PNR_ERROR("{}", e.what());
    } catch (...) {
        PNR_ERROR("unknown exception");
    }

    return false;
}

const char *pnr_get_version() { return pnr::current_version_cstring; }

bool pnr_set_log_cb(pnr_log_cb cb, PNR_LOG_LEVEL min_level)
{
    auto level = static_cast<pnr::log_level>(min_level);
    pnr::logger::init(cb, level);
    PNR_INFO("Sending log messages to binding, min level {}", pnr::log_level_to_str(level));
    return true;
}
