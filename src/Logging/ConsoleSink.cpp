/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

#include "ConsoleSink.h"

#include <cstdio>
#include <ctime>
#include <iostream>

namespace Ferry::Core::Logging {

namespace {
    const char* colorFor(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:   return "\033[90m";
            case LogLevel::Debug:   return "\033[36m";
            case LogLevel::Warning: return "\033[33m";
            case LogLevel::Error:
            case LogLevel::Fatal:   return "\033[31m";
            default:                return "";
        }
    }

    std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
        const auto secs = std::chrono::system_clock::to_time_t(tp);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            tp.time_since_epoch()).count() % 1000;

        std::tm tm{};
#if defined(_WIN32)
        localtime_s(&tm, &secs);
#else
        localtime_r(&secs, &tm);
#endif
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                      tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                      tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(millis));
        return buf;
    }
}

ConsoleSink::ConsoleSink(bool useColor)
    : _out(std::cout), _err(std::cerr), _useColor(useColor) {
}

ConsoleSink::ConsoleSink(std::ostream& out, std::ostream& err, bool useColor)
    : _out(out), _err(err), _useColor(useColor) {
}

std::string ConsoleSink::formatEntry(const LogEntry& entry) {
    std::string line = formatTimestamp(entry.timestamp);
    line += " [";
    line += logLevelToString(entry.level);
    line += "] ";
    if (!entry.category.empty()) {
        line += "[" + entry.category + "] ";
    }
    line += entry.message;
    return line;
}

void ConsoleSink::write(const LogEntry& entry) {
    if (!accepts(entry.level)) return;

    std::ostream& os = entry.level >= LogLevel::Warning ? _err : _out;
    if (_useColor) {
        os << colorFor(entry.level) << formatEntry(entry) << "\033[0m\n";
    } else {
        os << formatEntry(entry) << '\n';
    }
    if (entry.level >= LogLevel::Error) {
        os.flush();
    }
}

void ConsoleSink::flush() {
    _out.flush();
    _err.flush();
}

} // namespace Ferry::Core::Logging
