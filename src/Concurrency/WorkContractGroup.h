/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */

/**
 * @file WorkContractGroup.h
 * @brief Bounded pool of schedulable work contracts
 *
 * A WorkContractGroup owns a fixed number of contract slots. Callers create a contract
 * from a callable, schedule it, and either let a WorkService drain the group on its
 * worker threads or pump it themselves with executeAllBackgroundWork(). Completed
 * contracts return their slot to the free list automatically.
 *
 * @code
 * WorkContractGroup group(256, "FileOps");
 * auto handle = group.createContract([]{ doWork(); });
 * handle.schedule();
 * group.executeAllBackgroundWork();
 * @endcode
 */

#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include "WorkContractHandle.h"

namespace Steadfast {
namespace Core {
namespace Concurrency {

    class IConcurrencyProvider;

    class WorkContractGroup {
    public:
        WorkContractGroup(size_t capacity, std::string name);
        ~WorkContractGroup();

        WorkContractGroup(const WorkContractGroup&) = delete;
        WorkContractGroup& operator=(const WorkContractGroup&) = delete;

        /**
         * @brief Allocates a contract slot for the given work
         * @return A handle in the Allocated state, or an invalid handle when the group is
         *         full or stopping
         */
        WorkContractHandle createContract(std::function<void()> work);

        ScheduleResult scheduleContract(const WorkContractHandle& handle);
        ScheduleResult unscheduleContract(const WorkContractHandle& handle);
        void releaseContract(const WorkContractHandle& handle);
        bool isValidHandle(const WorkContractHandle& handle) const;
        ContractState getContractState(const WorkContractHandle& handle) const;

        /**
         * @brief Executes one ready contract on the calling thread
         * @return false if nothing was ready
         */
        bool executeNext();

        /**
         * @brief Executes the given contract on the calling thread if it is still waiting
         *
         * Other ready contracts are left to the workers.
         * @return false if the contract is not scheduled (already running, finished or stale)
         */
        bool executeContract(const WorkContractHandle& handle);

        /**
         * @brief Executes ready contracts on the calling thread until none remain
         * @return Number of contracts executed
         */
        size_t executeAllBackgroundWork();

        // Blocks until no contract is scheduled or executing
        void wait();

        void stop();
        void resume();
        bool isStopping() const;

        size_t capacity() const noexcept { return _capacity; }
        size_t activeCount() const;
        size_t scheduledCount() const;
        size_t executingCount() const;
        const std::string& name() const noexcept { return _name; }

        void setConcurrencyProvider(IConcurrencyProvider* provider);
        IConcurrencyProvider* concurrencyProvider() const;

    private:
        struct ContractSlot {
            ContractState state = ContractState::Free;
            uint32_t generation = 1;
            std::function<void()> work;
        };

        bool validateLocked(const WorkContractHandle& handle) const;
        void freeSlotLocked(uint32_t index);
        void runClaimed(uint32_t index, std::function<void()>& work);

        const size_t _capacity;
        std::string _name;

        mutable std::mutex _mutex;
        std::condition_variable _waitCondition;
        std::vector<ContractSlot> _contracts;
        std::vector<uint32_t> _freeList;
        std::deque<uint32_t> _ready;
        size_t _activeCount = 0;
        size_t _executingCount = 0;
        bool _stopping = false;
        IConcurrencyProvider* _concurrencyProvider = nullptr;
    };

} // namespace Concurrency
} // namespace Core
} // namespace Steadfast
