/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */
#include "WorkContractHandle.h"
#include "WorkContractGroup.h"
#include <format>

namespace Steadfast {
namespace Core {
namespace Concurrency {

    ScheduleResult WorkContractHandle::schedule() {
        if (!_group) return ScheduleResult::Invalid;
        return _group->scheduleContract(*this);
    }

    ScheduleResult WorkContractHandle::unschedule() {
        if (!_group) return ScheduleResult::Invalid;
        return _group->unscheduleContract(*this);
    }

    bool WorkContractHandle::valid() const {
        return _group && _group->isValidHandle(*this);
    }

    void WorkContractHandle::release() {
        if (_group) {
            _group->releaseContract(*this);
        }
        _group = nullptr;
    }

    bool WorkContractHandle::isScheduled() const {
        if (!_group) return false;
        return _group->getContractState(*this) == ContractState::Scheduled;
    }

    bool WorkContractHandle::isExecuting() const {
        if (!_group) return false;
        return _group->getContractState(*this) == ContractState::Executing;
    }

    std::string WorkContractHandle::toString() const {
        if (_group) {
            return std::format("WorkContractHandle(owner={}, idx={}, gen={})",
                               static_cast<const void*>(_group), _index, _generation);
        }
        return "WorkContractHandle(invalid)";
    }

} // namespace Concurrency
} // namespace Core
} // namespace Steadfast
