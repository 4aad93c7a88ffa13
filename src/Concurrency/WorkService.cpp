/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */
#include "WorkService.h"
#include <algorithm>
#include <chrono>
#include "WorkContractGroup.h"
#include "../Logging/Logger.h"

namespace Steadfast {
namespace Core {
namespace Concurrency {

    WorkService::WorkService(Config config)
        : _config(config) {
        size_t hw = std::thread::hardware_concurrency();
        _threadCount = _config.threadCount ? _config.threadCount : std::max<size_t>(hw, 2);
    }

    WorkService::~WorkService() {
        stop();
        std::lock_guard<std::mutex> lock(_groupsMutex);
        for (auto* group : _groups) {
            group->setConcurrencyProvider(nullptr);
        }
        _groups.clear();
    }

    void WorkService::start() {
        bool expected = false;
        if (!_running.compare_exchange_strong(expected, true)) return;

        _workers.reserve(_threadCount);
        for (size_t i = 0; i < _threadCount; ++i) {
            _workers.emplace_back([this, i] { workerLoop(i); });
        }
        STEADFAST_LOG_DEBUG_CAT("WorkService", "Started " + std::to_string(_threadCount) + " worker threads");
    }

    void WorkService::stop() {
        bool expected = true;
        if (!_running.compare_exchange_strong(expected, false)) return;
        {
            std::lock_guard<std::mutex> lock(_wakeMutex);
            ++_wakeSequence;
        }
        _wakeCondition.notify_all();
        for (auto& worker : _workers) {
            if (worker.joinable()) worker.join();
        }
        _workers.clear();
        STEADFAST_LOG_DEBUG_CAT("WorkService", "Stopped worker threads");
    }

    bool WorkService::addWorkContractGroup(WorkContractGroup* group) {
        if (!group) return false;
        {
            std::lock_guard<std::mutex> lock(_groupsMutex);
            if (_groups.size() >= _config.maxGroups) return false;
            if (std::find(_groups.begin(), _groups.end(), group) != _groups.end()) return false;
            _groups.push_back(group);
        }
        group->setConcurrencyProvider(this);
        // Work scheduled before registration must not sit idle
        notifyWorkAvailable(group);
        return true;
    }

    bool WorkService::removeWorkContractGroup(WorkContractGroup* group) {
        bool removed = false;
        {
            std::lock_guard<std::mutex> lock(_groupsMutex);
            auto it = std::find(_groups.begin(), _groups.end(), group);
            if (it != _groups.end()) {
                _groups.erase(it);
                removed = true;
            }
        }
        if (removed) {
            group->setConcurrencyProvider(nullptr);
        }
        return removed;
    }

    size_t WorkService::groupCount() const {
        std::lock_guard<std::mutex> lock(_groupsMutex);
        return _groups.size();
    }

    void WorkService::notifyWorkAvailable(WorkContractGroup* /*group*/) {
        {
            std::lock_guard<std::mutex> lock(_wakeMutex);
            ++_wakeSequence;
        }
        _wakeCondition.notify_one();
    }

    void WorkService::notifyGroupDestroyed(WorkContractGroup* group) {
        std::lock_guard<std::mutex> lock(_groupsMutex);
        _groups.erase(std::remove(_groups.begin(), _groups.end(), group), _groups.end());
    }

    bool WorkService::executeFromGroups(size_t& cursor) {
        std::vector<WorkContractGroup*> snapshot;
        {
            std::lock_guard<std::mutex> lock(_groupsMutex);
            snapshot = _groups;
        }
        if (snapshot.empty()) return false;

        for (size_t n = 0; n < snapshot.size(); ++n) {
            auto* group = snapshot[(cursor + n) % snapshot.size()];
            // Group may have been removed since the snapshot
            {
                std::lock_guard<std::mutex> lock(_groupsMutex);
                if (std::find(_groups.begin(), _groups.end(), group) == _groups.end()) continue;
            }
            if (group->executeNext()) {
                cursor = (cursor + n + 1) % snapshot.size();
                return true;
            }
        }
        return false;
    }

    void WorkService::workerLoop(size_t workerIndex) {
        size_t cursor = workerIndex;
        while (_running.load(std::memory_order_acquire)) {
            uint64_t seenSequence;
            {
                std::lock_guard<std::mutex> lock(_wakeMutex);
                seenSequence = _wakeSequence;
            }
            if (executeFromGroups(cursor)) continue;

            std::unique_lock<std::mutex> lock(_wakeMutex);
            _wakeCondition.wait_for(lock, std::chrono::milliseconds(10), [this, seenSequence] {
                return _wakeSequence != seenSequence || !_running.load(std::memory_order_acquire);
            });
        }
    }

} // namespace Concurrency
} // namespace Core
} // namespace Steadfast
