/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

namespace Ferry::Core::Logging {

/**
 * @brief Severity of a log record
 *
 * Values are kept in sync with the C shim (FerryLogLevelC in CLogger.h).
 */
enum class LogLevel : uint8_t {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warning = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

inline constexpr std::string_view logLevelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace:   return "TRACE";
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Fatal:   return "FATAL";
        case LogLevel::Off:     return "OFF";
    }
    return "UNKNOWN";
}

/**
 * @brief Parses a level name (case-insensitive), e.g. from FERRY_LOG_LEVEL
 * @return Parsed level, or nullopt if the name is not recognized
 */
std::optional<LogLevel> parseLogLevel(std::string_view name) noexcept;

} // namespace Ferry::Core::Logging
