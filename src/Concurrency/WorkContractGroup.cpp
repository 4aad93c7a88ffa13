/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */
#include "WorkContractGroup.h"
#include <algorithm>
#include "IConcurrencyProvider.h"
#include "../Logging/Logger.h"

namespace Steadfast {
namespace Core {
namespace Concurrency {

    WorkContractGroup::WorkContractGroup(size_t capacity, std::string name)
        : _capacity(std::max<size_t>(capacity, 1))
        , _name(std::move(name))
        , _contracts(_capacity) {
        _freeList.reserve(_capacity);
        // Lowest indices are handed out first
        for (size_t i = _capacity; i > 0; --i) {
            _freeList.push_back(static_cast<uint32_t>(i - 1));
        }
    }

    WorkContractGroup::~WorkContractGroup() {
        // Stop accepting new work, then let in-flight work drain
        stop();
        {
            std::unique_lock<std::mutex> lock(_mutex);
            _ready.clear();
            _waitCondition.wait(lock, [this] { return _executingCount == 0; });
            for (uint32_t i = 0; i < _capacity; ++i) {
                if (_contracts[i].state != ContractState::Free) {
                    freeSlotLocked(i);
                }
            }
        }

        IConcurrencyProvider* provider = concurrencyProvider();
        if (provider) {
            provider->notifyGroupDestroyed(this);
        }
    }

    WorkContractHandle WorkContractGroup::createContract(std::function<void()> work) {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_stopping) {
            STEADFAST_LOG_WARNING_CAT("WorkContractGroup", "Group '" + _name + "' is stopping, contract rejected");
            return {};
        }
        if (_freeList.empty()) {
            STEADFAST_LOG_ERROR_CAT("WorkContractGroup", "Group '" + _name + "' is out of contract slots");
            return {};
        }
        uint32_t index = _freeList.back();
        _freeList.pop_back();
        auto& slot = _contracts[index];
        slot.state = ContractState::Allocated;
        slot.work = std::move(work);
        ++_activeCount;
        return WorkContractHandle(this, index, slot.generation);
    }

    bool WorkContractGroup::validateLocked(const WorkContractHandle& handle) const {
        if (handle.owner() != this) return false;
        if (handle.index() >= _capacity) return false;
        const auto& slot = _contracts[handle.index()];
        return slot.generation == handle.generation() && slot.state != ContractState::Free;
    }

    void WorkContractGroup::freeSlotLocked(uint32_t index) {
        auto& slot = _contracts[index];
        slot.state = ContractState::Free;
        slot.work = nullptr;
        ++slot.generation;
        _freeList.push_back(index);
        --_activeCount;
    }

    ScheduleResult WorkContractGroup::scheduleContract(const WorkContractHandle& handle) {
        IConcurrencyProvider* provider = nullptr;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (!validateLocked(handle) || _stopping) return ScheduleResult::Invalid;
            auto& slot = _contracts[handle.index()];
            switch (slot.state) {
                case ContractState::Scheduled: return ScheduleResult::AlreadyScheduled;
                case ContractState::Executing: return ScheduleResult::Executing;
                case ContractState::Allocated: break;
                default: return ScheduleResult::Invalid;
            }
            slot.state = ContractState::Scheduled;
            _ready.push_back(handle.index());
            provider = _concurrencyProvider;
        }
        if (provider) {
            provider->notifyWorkAvailable(this);
        }
        return ScheduleResult::Scheduled;
    }

    ScheduleResult WorkContractGroup::unscheduleContract(const WorkContractHandle& handle) {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!validateLocked(handle)) return ScheduleResult::Invalid;
        auto& slot = _contracts[handle.index()];
        if (slot.state == ContractState::Executing) return ScheduleResult::Executing;
        if (slot.state == ContractState::Scheduled) {
            _ready.erase(std::remove(_ready.begin(), _ready.end(), handle.index()), _ready.end());
            slot.state = ContractState::Allocated;
            if (_ready.empty() && _executingCount == 0) {
                _waitCondition.notify_all();
            }
        }
        return ScheduleResult::NotScheduled;
    }

    void WorkContractGroup::releaseContract(const WorkContractHandle& handle) {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!validateLocked(handle)) return;
        auto& slot = _contracts[handle.index()];
        if (slot.state == ContractState::Executing) {
            // The executing thread frees the slot when the work returns
            return;
        }
        if (slot.state == ContractState::Scheduled) {
            _ready.erase(std::remove(_ready.begin(), _ready.end(), handle.index()), _ready.end());
        }
        freeSlotLocked(handle.index());
        if (_ready.empty() && _executingCount == 0) {
            _waitCondition.notify_all();
        }
    }

    bool WorkContractGroup::isValidHandle(const WorkContractHandle& handle) const {
        std::lock_guard<std::mutex> lock(_mutex);
        return validateLocked(handle);
    }

    ContractState WorkContractGroup::getContractState(const WorkContractHandle& handle) const {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!validateLocked(handle)) return ContractState::Free;
        return _contracts[handle.index()].state;
    }

    bool WorkContractGroup::executeNext() {
        uint32_t index;
        std::function<void()> work;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (_stopping || _ready.empty()) return false;
            index = _ready.front();
            _ready.pop_front();
            auto& slot = _contracts[index];
            slot.state = ContractState::Executing;
            work = std::move(slot.work);
            ++_executingCount;
        }
        runClaimed(index, work);
        return true;
    }

    bool WorkContractGroup::executeContract(const WorkContractHandle& handle) {
        std::function<void()> work;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (_stopping || !validateLocked(handle)) return false;
            auto& slot = _contracts[handle.index()];
            if (slot.state != ContractState::Scheduled) return false;
            auto it = std::find(_ready.begin(), _ready.end(), handle.index());
            if (it == _ready.end()) return false;
            _ready.erase(it);
            slot.state = ContractState::Executing;
            work = std::move(slot.work);
            ++_executingCount;
        }
        runClaimed(handle.index(), work);
        return true;
    }

    void WorkContractGroup::runClaimed(uint32_t index, std::function<void()>& work) {
        try {
            if (work) work();
        } catch (const std::exception& e) {
            STEADFAST_LOG_ERROR_CAT("WorkContractGroup", "Contract in group '" + _name + "' threw: " + e.what());
        } catch (...) {
            STEADFAST_LOG_ERROR_CAT("WorkContractGroup", "Contract in group '" + _name + "' threw an unknown exception");
        }

        std::lock_guard<std::mutex> lock(_mutex);
        --_executingCount;
        freeSlotLocked(index);
        if (_ready.empty() && _executingCount == 0) {
            _waitCondition.notify_all();
        }
    }

    size_t WorkContractGroup::executeAllBackgroundWork() {
        size_t executed = 0;
        while (executeNext()) {
            ++executed;
        }
        return executed;
    }

    void WorkContractGroup::wait() {
        std::unique_lock<std::mutex> lock(_mutex);
        _waitCondition.wait(lock, [this] {
            return _executingCount == 0 && (_ready.empty() || _stopping);
        });
    }

    void WorkContractGroup::stop() {
        std::lock_guard<std::mutex> lock(_mutex);
        _stopping = true;
        _waitCondition.notify_all();
    }

    void WorkContractGroup::resume() {
        IConcurrencyProvider* provider = nullptr;
        bool hasReady = false;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _stopping = false;
            provider = _concurrencyProvider;
            hasReady = !_ready.empty();
        }
        if (provider && hasReady) {
            provider->notifyWorkAvailable(this);
        }
    }

    bool WorkContractGroup::isStopping() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _stopping;
    }

    size_t WorkContractGroup::activeCount() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _activeCount;
    }

    size_t WorkContractGroup::scheduledCount() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _ready.size();
    }

    size_t WorkContractGroup::executingCount() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _executingCount;
    }

    void WorkContractGroup::setConcurrencyProvider(IConcurrencyProvider* provider) {
        std::lock_guard<std::mutex> lock(_mutex);
        _concurrencyProvider = provider;
    }

    IConcurrencyProvider* WorkContractGroup::concurrencyProvider() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _concurrencyProvider;
    }

} // namespace Concurrency
} // namespace Core
} // namespace Steadfast
