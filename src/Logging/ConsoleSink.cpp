/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */

#include "ConsoleSink.h"
#include <ctime>
#include <format>
#include <iostream>

namespace Steadfast {
namespace Core {
namespace Logging {

    ConsoleSink::ConsoleSink()
        : _out(&std::cout)
        , _err(&std::cerr) {
    }

    ConsoleSink::ConsoleSink(std::ostream& out, std::ostream& err)
        : _out(&out)
        , _err(&err) {
    }

    std::string ConsoleSink::format(const LogEntry& entry) {
        auto t = std::chrono::system_clock::to_time_t(entry.timestamp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            entry.timestamp.time_since_epoch()).count() % 1000;
        std::tm tm{};
        localtime_r(&t, &tm);
        return std::format("[{:02}:{:02}:{:02}.{:03}] [{}] [{}] {}",
                           tm.tm_hour, tm.tm_min, tm.tm_sec, ms,
                           logLevelToString(entry.level), entry.category, entry.message);
    }

    void ConsoleSink::write(const LogEntry& entry) {
        if (!accepts(entry.level)) return;
        auto line = format(entry);
        std::lock_guard<std::mutex> lock(_mutex);
        std::ostream& stream = (entry.level >= LogLevel::Warning) ? *_err : *_out;
        stream << line << '\n';
    }

    void ConsoleSink::flush() {
        std::lock_guard<std::mutex> lock(_mutex);
        _out->flush();
        _err->flush();
    }

} // namespace Logging
} // namespace Core
} // namespace Steadfast
