/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

#pragma once

/**
 * @file CoreCommon.h
 * @brief Environment access shared by FerryCore configuration
 *
 * Components read their overrides (FERRY_LOG_LEVEL, FERRY_COPY_CHUNK_SIZE)
 * through these helpers rather than calling getenv directly.
 */

#include <cstddef>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>

namespace Ferry {
namespace Core {
    // Cross-platform safe environment variable getter that avoids returning raw pointers
    // and copies into std::string. Returns std::nullopt if the variable is not set.
    inline std::optional<std::string> safeGetEnv(const char* name) {
        if (!name) return std::nullopt;
#if defined(_WIN32)
        // Use secure getenv_s to query size first
        size_t required = 0;
        errno_t err = getenv_s(&required, nullptr, 0, name);
        if (err != 0 || required == 0) return std::nullopt;
        // required includes the null terminator
        std::string value;
        value.resize(required);
        size_t read = 0;
        err = getenv_s(&read, value.data(), value.size(), name);
        if (err != 0 || read == 0) return std::nullopt;
        if (!value.empty() && value.back() == '\0') value.pop_back();
        return value;
#else
        const char* v = std::getenv(name);
        if (!v) return std::nullopt;
        return std::string(v);
#endif
    }

    // Parses a positive byte count from an environment variable. Accepts an optional
    // K/M suffix (binary multiples). Returns std::nullopt when unset, malformed or too large.
    inline std::optional<size_t> safeGetEnvByteSize(const char* name) {
        auto raw = safeGetEnv(name);
        if (!raw || raw->empty()) return std::nullopt;

        size_t multiplier = 1;
        std::string digits = *raw;
        const char suffix = digits.back();
        if (suffix == 'k' || suffix == 'K') {
            multiplier = 1024;
            digits.pop_back();
        } else if (suffix == 'm' || suffix == 'M') {
            multiplier = 1024 * 1024;
            digits.pop_back();
        }
        if (digits.empty()) return std::nullopt;

        size_t value = 0;
        for (char c : digits) {
            if (c < '0' || c > '9') return std::nullopt;
            const auto digit = static_cast<size_t>(c - '0');
            if (value > (std::numeric_limits<size_t>::max() - digit) / 10) return std::nullopt;
            value = value * 10 + digit;
        }
        if (value == 0) return std::nullopt;
        if (value > std::numeric_limits<size_t>::max() / multiplier) return std::nullopt;
        return value * multiplier;
    }
} // namespace Core
}
