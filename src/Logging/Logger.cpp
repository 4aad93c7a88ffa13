/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */
#include "Logger.h"
#include <algorithm>
#include "ConsoleSink.h"
#include "LogEntry.h"
#include "../CoreCommon.h"

namespace Steadfast {
namespace Core {
namespace Logging {

    Logger::Logger(std::string name)
        : _name(std::move(name)) {
    }

    Logger& Logger::global() {
        static Logger* instance = [] {
            auto* logger = new Logger("Global");
            logger->addSink(std::make_shared<ConsoleSink>());
            if (auto env = safeGetEnv("STEADFAST_LOG_LEVEL")) {
                if (auto level = parseLogLevel(*env)) {
                    logger->setMinLevel(*level);
                }
            }
            return logger;
        }();
        return *instance;
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

    void Logger::log(LogLevel level, const std::string& category, const std::string& message) {
        if (!isEnabled(level)) return;

        LogEntry entry(level, category, message);

        // Snapshot so sinks can log or be removed without deadlocking
        std::vector<std::shared_ptr<ILogSink>> sinks;
        {
            std::lock_guard<std::mutex> lock(_sinkMutex);
            sinks = _sinks;
        }
        for (auto& sink : sinks) {
            if (sink->accepts(level)) {
                sink->write(entry);
            }
        }
        if (level == LogLevel::Fatal) {
            for (auto& sink : sinks) sink->flush();
        }
    }

    void Logger::flush() {
        std::vector<std::shared_ptr<ILogSink>> sinks;
        {
            std::lock_guard<std::mutex> lock(_sinkMutex);
            sinks = _sinks;
        }
        for (auto& sink : sinks) sink->flush();
    }

} // namespace Logging
} // namespace Core
} // namespace Steadfast
