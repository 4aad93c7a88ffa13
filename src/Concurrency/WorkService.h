/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */

/**
 * @file WorkService.h
 * @brief Worker thread pool that drains registered WorkContractGroups
 *
 * Groups are registered with addWorkContractGroup() and notify the service when work
 * becomes ready. Workers visit groups round-robin so a group with a long-running
 * contract does not starve the others.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>
#include <vector>
#include "IConcurrencyProvider.h"

namespace Steadfast {
namespace Core {
namespace Concurrency {

    class WorkService : public IConcurrencyProvider {
    public:
        struct Config {
            size_t threadCount = 0;   ///< 0 => hardware concurrency (at least 2)
            size_t maxGroups = 64;
        };

        explicit WorkService(Config config);
        ~WorkService() override;

        WorkService(const WorkService&) = delete;
        WorkService& operator=(const WorkService&) = delete;

        void start();
        void stop();
        bool isRunning() const noexcept { return _running.load(std::memory_order_acquire); }

        /**
         * @brief Registers a group for execution
         *
         * A group must be removed (or the service stopped) before the group is destroyed.
         * @return false if the group is null, already registered, or the limit is reached
         */
        bool addWorkContractGroup(WorkContractGroup* group);
        bool removeWorkContractGroup(WorkContractGroup* group);
        size_t groupCount() const;
        size_t threadCount() const noexcept { return _threadCount; }

        void notifyWorkAvailable(WorkContractGroup* group) override;
        void notifyGroupDestroyed(WorkContractGroup* group) override;

    private:
        void workerLoop(size_t workerIndex);
        bool executeFromGroups(size_t& cursor);

        Config _config;
        size_t _threadCount;
        std::atomic<bool> _running{false};
        std::vector<std::thread> _workers;

        mutable std::mutex _groupsMutex;
        std::vector<WorkContractGroup*> _groups;

        std::mutex _wakeMutex;
        std::condition_variable _wakeCondition;
        uint64_t _wakeSequence = 0;
    };

} // namespace Concurrency
} // namespace Core
} // namespace Steadfast
