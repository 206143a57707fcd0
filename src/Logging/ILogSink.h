/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

#pragma once
#include <atomic>
#include "LogEntry.h"

namespace Ferry::Core::Logging {

/**
 * @brief Destination for log records
 *
 * Sinks are called by Logger under its sink mutex, so implementations do not need
 * their own locking unless they are shared between loggers.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(const LogEntry& entry) = 0;
    virtual void flush() = 0;

    void setMinLevel(LogLevel level) noexcept { _minLevel.store(level, std::memory_order_relaxed); }
    LogLevel minLevel() const noexcept { return _minLevel.load(std::memory_order_relaxed); }
    bool accepts(LogLevel level) const noexcept { return level >= minLevel(); }

private:
    std::atomic<LogLevel> _minLevel{LogLevel::Trace};
};

} // namespace Ferry::Core::Logging
