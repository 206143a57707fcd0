/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

/**
 * @file Logger.h
 * @brief Process-wide logger with pluggable sinks
 *
 * Logger fans each record out to every registered ILogSink. The global instance starts
 * with a ConsoleSink and a minimum level of Info, which can be overridden with the
 * FERRY_LOG_LEVEL environment variable (trace, debug, info, warn, error, fatal, off).
 *
 * @code
 * FERRY_LOG_INFO("Copied " + std::to_string(bytes) + " bytes");
 * FERRY_LOG_WARNING_CAT("Transfer", "Falling back to copy+delete");
 * @endcode
 */
#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "ILogSink.h"
#include "LogLevel.h"

namespace Ferry::Core::Logging {

class Logger {
public:
    Logger();
    explicit Logger(LogLevel minLevel);
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Returns the process-wide logger
     *
     * Created on first use with a ConsoleSink attached.
     */
    static Logger& global();

    void log(LogLevel level, std::string_view category, std::string_view message);

    void trace(std::string_view category, std::string_view message) { log(LogLevel::Trace, category, message); }
    void debug(std::string_view category, std::string_view message) { log(LogLevel::Debug, category, message); }
    void info(std::string_view category, std::string_view message) { log(LogLevel::Info, category, message); }
    void warning(std::string_view category, std::string_view message) { log(LogLevel::Warning, category, message); }
    void error(std::string_view category, std::string_view message) { log(LogLevel::Error, category, message); }
    void fatal(std::string_view category, std::string_view message) { log(LogLevel::Fatal, category, message); }

    // Sink management
    void addSink(std::shared_ptr<ILogSink> sink);
    void removeSink(const std::shared_ptr<ILogSink>& sink);
    void clearSinks();
    size_t sinkCount() const;

    void setMinLevel(LogLevel level) noexcept { _minLevel.store(level, std::memory_order_relaxed); }
    LogLevel minLevel() const noexcept { return _minLevel.load(std::memory_order_relaxed); }
    bool isEnabled(LogLevel level) const noexcept {
        const auto min = minLevel();
        return min != LogLevel::Off && level >= min;
    }

    void flush();

private:
    std::atomic<LogLevel> _minLevel{LogLevel::Info};
    mutable std::mutex _sinkMutex;
    std::vector<std::shared_ptr<ILogSink>> _sinks;
};

} // namespace Ferry::Core::Logging

#define FERRY_LOG_AT_(lvl, cat, msg) \
    do { \
        auto& ferryLogger_ = ::Ferry::Core::Logging::Logger::global(); \
        if (ferryLogger_.isEnabled(lvl)) { \
            ferryLogger_.log((lvl), (cat), (msg)); \
        } \
    } while (0)

#define FERRY_LOG_TRACE(msg)   FERRY_LOG_AT_(::Ferry::Core::Logging::LogLevel::Trace, __func__, msg)
#define FERRY_LOG_DEBUG(msg)   FERRY_LOG_AT_(::Ferry::Core::Logging::LogLevel::Debug, __func__, msg)
#define FERRY_LOG_INFO(msg)    FERRY_LOG_AT_(::Ferry::Core::Logging::LogLevel::Info, __func__, msg)
#define FERRY_LOG_WARNING(msg) FERRY_LOG_AT_(::Ferry::Core::Logging::LogLevel::Warning, __func__, msg)
#define FERRY_LOG_ERROR(msg)   FERRY_LOG_AT_(::Ferry::Core::Logging::LogLevel::Error, __func__, msg)
#define FERRY_LOG_FATAL(msg)   FERRY_LOG_AT_(::Ferry::Core::Logging::LogLevel::Fatal, __func__, msg)

#define FERRY_LOG_TRACE_CAT(cat, msg)   FERRY_LOG_AT_(::Ferry::Core::Logging::LogLevel::Trace, cat, msg)
#define FERRY_LOG_DEBUG_CAT(cat, msg)   FERRY_LOG_AT_(::Ferry::Core::Logging::LogLevel::Debug, cat, msg)
#define FERRY_LOG_INFO_CAT(cat, msg)    FERRY_LOG_AT_(::Ferry::Core::Logging::LogLevel::Info, cat, msg)
#define FERRY_LOG_WARNING_CAT(cat, msg) FERRY_LOG_AT_(::Ferry::Core::Logging::LogLevel::Warning, cat, msg)
#define FERRY_LOG_ERROR_CAT(cat, msg)   FERRY_LOG_AT_(::Ferry::Core::Logging::LogLevel::Error, cat, msg)
#define FERRY_LOG_FATAL_CAT(cat, msg)   FERRY_LOG_AT_(::Ferry::Core::Logging::LogLevel::Fatal, cat, msg)
