/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */

#pragma once

#include <atomic>
#include "LogEntry.h"

namespace Steadfast {
namespace Core {
namespace Logging {

    /**
     * @brief Destination for log entries
     *
     * Sinks are called from whichever thread logs, so implementations must be
     * thread-safe. Entries below minLevel() are never delivered.
     */
    class ILogSink {
    public:
        virtual ~ILogSink() = default;

        virtual void write(const LogEntry& entry) = 0;
        virtual void flush() = 0;

        void setMinLevel(LogLevel level) noexcept { _minLevel.store(level, std::memory_order_release); }
        LogLevel minLevel() const noexcept { return _minLevel.load(std::memory_order_acquire); }
        bool accepts(LogLevel level) const noexcept { return level >= minLevel(); }

    private:
        std::atomic<LogLevel> _minLevel{LogLevel::Trace};
    };

} // namespace Logging
} // namespace Core
} // namespace Steadfast
