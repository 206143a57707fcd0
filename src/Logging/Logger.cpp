/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

#include "Logger.h"

#include <algorithm>
#include <cctype>

#include "ConsoleSink.h"
#include "../CoreCommon.h"

namespace Ferry::Core::Logging {

std::optional<LogLevel> parseLogLevel(std::string_view name) noexcept {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    if (lower == "fatal") return LogLevel::Fatal;
    if (lower == "off" || lower == "none") return LogLevel::Off;
    return std::nullopt;
}

Logger::Logger() = default;

Logger::Logger(LogLevel minLevel) : _minLevel(minLevel) {
}

Logger& Logger::global() {
    static Logger* instance = [] {
        auto* logger = new Logger();
        logger->addSink(std::make_shared<ConsoleSink>());
        if (auto env = safeGetEnv("FERRY_LOG_LEVEL")) {
            if (auto level = parseLogLevel(*env)) {
                logger->setMinLevel(*level);
            }
        }
        return logger;
    }();
    return *instance;
}

void Logger::log(LogLevel level, std::string_view category, std::string_view message) {
    if (!isEnabled(level)) return;

    LogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.level = level;
    entry.category = std::string(category);
    entry.message = std::string(message);
    entry.threadId = std::this_thread::get_id();

    std::lock_guard<std::mutex> lock(_sinkMutex);
    for (const auto& sink : _sinks) {
        if (sink->accepts(level)) {
            sink->write(entry);
        }
    }
}

void Logger::addSink(std::shared_ptr<ILogSink> sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(_sinkMutex);
    _sinks.push_back(std::move(sink));
}

void Logger::removeSink(const std::shared_ptr<ILogSink>& sink) {
    std::lock_guard<std::mutex> lock(_sinkMutex);
    _sinks.erase(std::remove(_sinks.begin(), _sinks.end(), sink), _sinks.end());
}

void Logger::clearSinks() {
    std::lock_guard<std::mutex> lock(_sinkMutex);
    _sinks.clear();
}

size_t Logger::sinkCount() const {
    std::lock_guard<std::mutex> lock(_sinkMutex);
    return _sinks.size();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(_sinkMutex);
    for (const auto& sink : _sinks) {
        sink->flush();
    }
}

} // namespace Ferry::Core::Logging
