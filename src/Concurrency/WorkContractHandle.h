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
#include <string>

namespace Steadfast {
namespace Core {
namespace Concurrency {

    class WorkContractGroup;

    enum class ContractState : uint32_t {
        Free = 0,       ///< Contract slot is available for allocation
        Allocated = 1,  ///< Contract has been allocated but not scheduled
        Scheduled = 2,  ///< Contract is scheduled and ready for execution
        Executing = 3,  ///< Contract is currently being executed
        Completed = 4   ///< Contract has completed execution
    };

    enum class ScheduleResult {
        Scheduled,         ///< Contract is now scheduled
        AlreadyScheduled,  ///< Contract was already scheduled
        NotScheduled,      ///< Contract is not scheduled (successful unschedule)
        Executing,         ///< Cannot modify - currently executing
        Invalid            ///< Invalid handle provided
    };

    /**
     * @brief Value handle to a contract slot inside a WorkContractGroup
     *
     * Handles are stamped with the slot index and a generation counter, so a handle
     * to a slot that has since been reused reports !valid() instead of touching the
     * new occupant.
     */
    class WorkContractHandle {
    public:
        WorkContractHandle() = default;

        ScheduleResult schedule();
        ScheduleResult unschedule();
        bool valid() const;
        void release();
        bool isScheduled() const;
        bool isExecuting() const;

        WorkContractGroup* owner() const noexcept { return _group; }
        uint32_t index() const noexcept { return _index; }
        uint32_t generation() const noexcept { return _generation; }

        std::string toString() const;

        bool operator==(const WorkContractHandle& other) const noexcept = default;

    private:
        friend class WorkContractGroup;

        WorkContractHandle(WorkContractGroup* group, uint32_t index, uint32_t generation)
            : _group(group), _index(index), _generation(generation) {}

        WorkContractGroup* _group = nullptr;
        uint32_t _index = 0;
        uint32_t _generation = 0;
    };

} // namespace Concurrency
} // namespace Core
} // namespace Steadfast
