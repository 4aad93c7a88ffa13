/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace Steadfast {
namespace Core {
namespace Logging {

    /**
     * @brief Severity of a log entry, ordered from most to least verbose
     */
    enum class LogLevel : uint8_t {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warning = 3,
        Error = 4,
        Fatal = 5
    };

    inline const char* logLevelToString(LogLevel level) noexcept {
        switch (level) {
            case LogLevel::Trace:   return "TRACE";
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
            case LogLevel::Fatal:   return "FATAL";
        }
        return "INFO";
    }

    // Accepts the lowercase names used by STEADFAST_LOG_LEVEL
    inline std::optional<LogLevel> parseLogLevel(std::string_view name) noexcept {
        if (name == "trace") return LogLevel::Trace;
        if (name == "debug") return LogLevel::Debug;
        if (name == "info") return LogLevel::Info;
        if (name == "warning" || name == "warn") return LogLevel::Warning;
        if (name == "error") return LogLevel::Error;
        if (name == "fatal") return LogLevel::Fatal;
        return std::nullopt;
    }

} // namespace Logging
} // namespace Core
} // namespace Steadfast
