/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

#pragma once
#include <ostream>
#include "ILogSink.h"

namespace Ferry::Core::Logging {

/**
 * @brief Writes records to stdout (Trace..Info) and stderr (Warning and above)
 *
 * Format: `2025-01-31 12:00:00.123 [WARN] [Transfer] message`
 */
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(bool useColor = false);
    ConsoleSink(std::ostream& out, std::ostream& err, bool useColor = false);

    void write(const LogEntry& entry) override;
    void flush() override;

    static std::string formatEntry(const LogEntry& entry);

private:
    std::ostream& _out;
    std::ostream& _err;
    bool _useColor;
};

} // namespace Ferry::Core::Logging
