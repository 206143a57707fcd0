/* C logger shim forwarding to C++ Logger backend */
#include "Logging/CLogger.h"

#include <cstdarg>
#include <cstdio>
#include <string>

#include "Logging/LogLevel.h"
#include "Logging/Logger.h"

using ::Ferry::Core::Logging::Logger;
using ::Ferry::Core::Logging::LogLevel;

namespace {
    constexpr const char* kDefaultCategory = "C";

    // Out-of-range values are treated as Info
    LogLevel toLogLevel(FerryLogLevelC level) noexcept {
        if (level < FERRY_LOG_TRACE_C || level > FERRY_LOG_OFF_C) {
            return LogLevel::Info;
        }
        return static_cast<LogLevel>(level);
    }

    std::string formatMessage(const char* fmt, va_list args) {
        va_list sizing;
        va_copy(sizing, args);
        const int needed = std::vsnprintf(nullptr, 0, fmt, sizing);
        va_end(sizing);
        if (needed <= 0) return {};

        std::string message(static_cast<size_t>(needed), '\0');
        std::vsnprintf(message.data(), message.size() + 1, fmt, args);
        return message;
    }

    void writeFormatted(FerryLogLevelC level, const char* category, const char* fmt, va_list args) {
        if (!fmt) return;

        auto& logger = Logger::global();
        const LogLevel mapped = toLogLevel(level);
        // Off is a threshold, not a record severity
        if (mapped == LogLevel::Off || !logger.isEnabled(mapped)) return;

        logger.log(mapped, (category && *category) ? category : kDefaultCategory, formatMessage(fmt, args));
    }
}

extern "C" {

void ferry_log_set_level(FerryLogLevelC level) {
    Logger::global().setMinLevel(toLogLevel(level));
}

FerryLogLevelC ferry_log_get_level(void) {
    return static_cast<FerryLogLevelC>(Logger::global().minLevel());
}

int ferry_log_is_enabled(FerryLogLevelC level) {
    const LogLevel mapped = toLogLevel(level);
    return mapped != LogLevel::Off && Logger::global().isEnabled(mapped) ? 1 : 0;
}

void ferry_log_vwrite(FerryLogLevelC level, const char* fmt, va_list args) {
    writeFormatted(level, kDefaultCategory, fmt, args);
}

void ferry_log_vwrite_cat(FerryLogLevelC level, const char* category, const char* fmt, va_list args) {
    writeFormatted(level, category, fmt, args);
}

void ferry_log_write(FerryLogLevelC level, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    writeFormatted(level, kDefaultCategory, fmt, args);
    va_end(args);
}

void ferry_log_write_cat(FerryLogLevelC level, const char* category, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    writeFormatted(level, category, fmt, args);
    va_end(args);
}

}  // extern "C"
