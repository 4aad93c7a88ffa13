/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */

#pragma once

#include <chrono>
#include <string>
#include <thread>
#include "LogLevel.h"

namespace Steadfast {
namespace Core {
namespace Logging {

    /**
     * @brief A single formatted log record handed to every sink
     */
    struct LogEntry {
        std::chrono::system_clock::time_point timestamp;
        LogLevel level = LogLevel::Info;
        std::string category;
        std::string message;
        std::thread::id threadId;

        LogEntry() = default;
        LogEntry(LogLevel lvl, std::string cat, std::string msg)
            : timestamp(std::chrono::system_clock::now())
            , level(lvl)
            , category(std::move(cat))
            , message(std::move(msg))
            , threadId(std::this_thread::get_id()) {}
    };

} // namespace Logging
} // namespace Core
} // namespace Steadfast
