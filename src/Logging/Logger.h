/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */

/**
 * @file Logger.h
 * @brief Process-wide logger fanning entries out to registered sinks
 *
 * The global logger starts with a ConsoleSink. Its minimum level is Info unless the
 * STEADFAST_LOG_LEVEL environment variable names another level.
 *
 * @code
 * STEADFAST_LOG_INFO("Mounted " + path);
 * STEADFAST_LOG_DEBUG_CAT("Elevation", "Session " + id + " connected");
 * @endcode
 */

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "ILogSink.h"
#include "LogLevel.h"

namespace Steadfast {
namespace Core {
namespace Logging {

    class Logger {
    public:
        explicit Logger(std::string name);

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        static Logger& global();

        void addSink(std::shared_ptr<ILogSink> sink);
        void removeSink(const std::shared_ptr<ILogSink>& sink);
        void clearSinks();
        size_t sinkCount() const;

        void setMinLevel(LogLevel level) noexcept { _minLevel.store(level, std::memory_order_release); }
        LogLevel minLevel() const noexcept { return _minLevel.load(std::memory_order_acquire); }
        bool isEnabled(LogLevel level) const noexcept { return level >= minLevel(); }

        void log(LogLevel level, const std::string& category, const std::string& message);
        void flush();

        const std::string& name() const noexcept { return _name; }

    private:
        std::string _name;
        std::atomic<LogLevel> _minLevel{LogLevel::Info};
        mutable std::mutex _sinkMutex;
        std::vector<std::shared_ptr<ILogSink>> _sinks;
    };

} // namespace Logging
} // namespace Core
} // namespace Steadfast

#define STEADFAST_LOG_AT(level, category, message)                                                   \
    do {                                                                                             \
        auto& steadfastLogger_ = ::Steadfast::Core::Logging::Logger::global();                      \
        if (steadfastLogger_.isEnabled(level)) steadfastLogger_.log((level), (category), (message)); \
    } while (0)

#define STEADFAST_LOG_TRACE(message) STEADFAST_LOG_AT(::Steadfast::Core::Logging::LogLevel::Trace, __func__, message)
#define STEADFAST_LOG_DEBUG(message) STEADFAST_LOG_AT(::Steadfast::Core::Logging::LogLevel::Debug, __func__, message)
#define STEADFAST_LOG_INFO(message) STEADFAST_LOG_AT(::Steadfast::Core::Logging::LogLevel::Info, __func__, message)
#define STEADFAST_LOG_WARNING(message) STEADFAST_LOG_AT(::Steadfast::Core::Logging::LogLevel::Warning, __func__, message)
#define STEADFAST_LOG_ERROR(message) STEADFAST_LOG_AT(::Steadfast::Core::Logging::LogLevel::Error, __func__, message)
#define STEADFAST_LOG_FATAL(message) STEADFAST_LOG_AT(::Steadfast::Core::Logging::LogLevel::Fatal, __func__, message)

#define STEADFAST_LOG_TRACE_CAT(cat, message) STEADFAST_LOG_AT(::Steadfast::Core::Logging::LogLevel::Trace, cat, message)
#define STEADFAST_LOG_DEBUG_CAT(cat, message) STEADFAST_LOG_AT(::Steadfast::Core::Logging::LogLevel::Debug, cat, message)
#define STEADFAST_LOG_INFO_CAT(cat, message) STEADFAST_LOG_AT(::Steadfast::Core::Logging::LogLevel::Info, cat, message)
#define STEADFAST_LOG_WARNING_CAT(cat, message) STEADFAST_LOG_AT(::Steadfast::Core::Logging::LogLevel::Warning, cat, message)
#define STEADFAST_LOG_ERROR_CAT(cat, message) STEADFAST_LOG_AT(::Steadfast::Core::Logging::LogLevel::Error, cat, message)
#define STEADFAST_LOG_FATAL_CAT(cat, message) STEADFAST_LOG_AT(::Steadfast::Core::Logging::LogLevel::Fatal, cat, message)
