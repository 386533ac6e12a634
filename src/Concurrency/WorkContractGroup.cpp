/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the AsyncFile Core project.
 */

#include "WorkContractGroup.h"

#include <exception>
#include <sstream>

#include "../CoreCommon.h"
#include "../Logging/Logger.h"
#include "IConcurrencyProvider.h"

namespace AsyncFile {
namespace Core {
namespace Concurrency {

    WorkContractGroup::WorkContractGroup(size_t capacity, std::string name)
        : _capacity(capacity)
        , _name(std::move(name))
        , _contracts(capacity) {
        // Free list is popped from the back; push in reverse so slot 0 is used first
        _freeList.reserve(capacity);
        for (size_t i = capacity; i > 0; --i) {
            _freeList.push_back(static_cast<uint32_t>(i - 1));
        }
    }

    WorkContractGroup::~WorkContractGroup() {
        // Stop handing out work, then let running contracts finish
        stop();
        wait();

        // Release everything still allocated or scheduled. Closures are destroyed
        // outside the lock since they may hold resources whose destructors call back in.
        std::vector<std::function<void()>> abandoned;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            for (uint32_t i = 0; i < _contracts.size(); ++i) {
                if (_contracts[i].state == ContractState::Allocated ||
                    _contracts[i].state == ContractState::Scheduled) {
                    abandoned.push_back(freeSlotLocked(i));
                }
            }
        }
        abandoned.clear();

        AFILE_ASSERT(_activeCount.load() == 0, "WorkContractGroup destroyed with active contracts");

        IConcurrencyProvider* provider = nullptr;
        {
            std::shared_lock<std::shared_mutex> lock(_concurrencyProviderMutex);
            provider = _concurrencyProvider;
        }
        if (provider) {
            provider->notifyGroupDestroyed(this);
        }
    }

    WorkContractHandle WorkContractGroup::createContract(std::function<void()> work,
                                                         ExecutionType executionType,
                                                         Priority priority) {
        if (!work || _stopping.load(std::memory_order_acquire)) {
            return WorkContractHandle();
        }

        std::lock_guard<std::mutex> lock(_mutex);
        if (_freeList.empty()) {
            return WorkContractHandle();
        }
        uint32_t index = _freeList.back();
        _freeList.pop_back();

        auto& slot = _contracts[index];
        slot.state = ContractState::Allocated;
        slot.executionType = executionType;
        slot.priority = priority;
        slot.work = std::move(work);
        _activeCount.fetch_add(1, std::memory_order_acq_rel);

        return WorkContractHandle(this, index, slot.generation);
    }

    ScheduleResult WorkContractGroup::scheduleContract(const WorkContractHandle& handle) {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (!validateLocked(handle)) return ScheduleResult::Invalid;

            auto& slot = _contracts[handle.index()];
            switch (slot.state) {
                case ContractState::Scheduled:
                    return ScheduleResult::AlreadyScheduled;
                case ContractState::Executing:
                    return ScheduleResult::Executing;
                case ContractState::Allocated:
                    break;
                default:
                    return ScheduleResult::Invalid;
            }

            slot.state = ContractState::Scheduled;
            slot.sequence = _nextSequence++;
            if (slot.executionType == ExecutionType::MainThread) {
                _mainThreadReady.insert(keyFor(handle.index()));
                _mainThreadScheduledCount.fetch_add(1, std::memory_order_acq_rel);
            } else {
                _ready.insert(keyFor(handle.index()));
                _scheduledCount.fetch_add(1, std::memory_order_acq_rel);
            }
        }

        std::shared_lock<std::shared_mutex> lock(_concurrencyProviderMutex);
        if (_concurrencyProvider) {
            _concurrencyProvider->notifyWorkAvailable(this);
        }
        return ScheduleResult::Scheduled;
    }

    ScheduleResult WorkContractGroup::unscheduleContract(const WorkContractHandle& handle) {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (!validateLocked(handle)) return ScheduleResult::Invalid;

            auto& slot = _contracts[handle.index()];
            if (slot.state == ContractState::Executing) return ScheduleResult::Executing;
            if (slot.state != ContractState::Scheduled) return ScheduleResult::NotScheduled;

            if (slot.executionType == ExecutionType::MainThread) {
                _mainThreadReady.erase(keyFor(handle.index()));
                _mainThreadScheduledCount.fetch_sub(1, std::memory_order_acq_rel);
            } else {
                _ready.erase(keyFor(handle.index()));
                _scheduledCount.fetch_sub(1, std::memory_order_acq_rel);
            }
            slot.state = ContractState::Allocated;
        }
        notifyWaiters();
        return ScheduleResult::NotScheduled;
    }

    void WorkContractGroup::releaseContract(const WorkContractHandle& handle) {
        std::function<void()> discarded;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (!validateLocked(handle)) return;
            auto state = _contracts[handle.index()].state;
            if (state != ContractState::Allocated && state != ContractState::Scheduled) return;
            discarded = freeSlotLocked(handle.index());
        }
        notifyWaiters();
    }

    bool WorkContractGroup::isValidHandle(const WorkContractHandle& handle) const noexcept {
        std::lock_guard<std::mutex> lock(_mutex);
        return validateLocked(handle);
    }

    ContractState WorkContractGroup::getContractState(const WorkContractHandle& handle) const noexcept {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!validateLocked(handle)) return ContractState::Free;
        return _contracts[handle.index()].state;
    }

    WorkContractHandle WorkContractGroup::selectForExecution() {
        return selectFrom(_ready, _scheduledCount);
    }

    WorkContractHandle WorkContractGroup::selectForMainThreadExecution() {
        return selectFrom(_mainThreadReady, _mainThreadScheduledCount);
    }

    WorkContractHandle WorkContractGroup::selectFrom(std::set<ReadyKey>& readySet,
                                                     std::atomic<size_t>& scheduledCounter) {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_stopping.load(std::memory_order_acquire) || readySet.empty()) {
            return WorkContractHandle();
        }
        auto it = readySet.begin();
        uint32_t index = it->index;
        readySet.erase(it);

        auto& slot = _contracts[index];
        slot.state = ContractState::Executing;
        scheduledCounter.fetch_sub(1, std::memory_order_acq_rel);
        _executingCount.fetch_add(1, std::memory_order_acq_rel);
        return WorkContractHandle(this, index, slot.generation);
    }

    void WorkContractGroup::executeContract(const WorkContractHandle& handle) {
        std::function<void()> work;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (!validateLocked(handle) || _contracts[handle.index()].state != ContractState::Executing) {
                return;
            }
            work = std::move(_contracts[handle.index()].work);
        }

        try {
            work();
        } catch (const std::exception& e) {
            AFILE_LOG_ERROR_CAT("WorkContractGroup",
                                _name + ": contract threw an exception: " + e.what());
        }
        // Closure state goes away before the slot becomes reusable
        work = nullptr;

        {
            std::lock_guard<std::mutex> lock(_mutex);
            auto& slot = _contracts[handle.index()];
            slot.generation++;
            slot.state = ContractState::Free;
            _freeList.push_back(handle.index());
            _activeCount.fetch_sub(1, std::memory_order_acq_rel);
            _executingCount.fetch_sub(1, std::memory_order_acq_rel);
        }
        notifyWaiters();
    }

    void WorkContractGroup::executeAllBackgroundWork() {
        for (;;) {
            WorkContractHandle handle = selectForExecution();
            if (!handle.owner()) break;
            executeContract(handle);
        }
    }

    size_t WorkContractGroup::executeAllMainThreadWork() {
        return executeMainThreadWork(_capacity);
    }

    size_t WorkContractGroup::executeMainThreadWork(size_t maxContracts) {
        size_t executed = 0;
        while (executed < maxContracts) {
            WorkContractHandle handle = selectForMainThreadExecution();
            if (!handle.owner()) break;
            executeContract(handle);
            ++executed;
        }
        return executed;
    }

    void WorkContractGroup::stop() {
        _stopping.store(true, std::memory_order_seq_cst);
        notifyWaiters();
    }

    void WorkContractGroup::resume() {
        _stopping.store(false, std::memory_order_seq_cst);

        bool hasReady = false;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            hasReady = !_ready.empty();
        }
        if (hasReady) {
            std::shared_lock<std::shared_mutex> lock(_concurrencyProviderMutex);
            if (_concurrencyProvider) {
                _concurrencyProvider->notifyWorkAvailable(this);
            }
        }
    }

    void WorkContractGroup::wait() {
        std::unique_lock<std::mutex> lock(_waitMutex);
        _waitCondition.wait(lock, [this]() {
            if (_stopping.load(std::memory_order_seq_cst)) {
                return _executingCount.load(std::memory_order_acquire) == 0;
            }
            return _scheduledCount.load(std::memory_order_acquire) == 0 &&
                   _mainThreadScheduledCount.load(std::memory_order_acquire) == 0 &&
                   _executingCount.load(std::memory_order_acquire) == 0;
        });
    }

    void WorkContractGroup::setConcurrencyProvider(IConcurrencyProvider* provider) {
        std::unique_lock<std::shared_mutex> lock(_concurrencyProviderMutex);
        _concurrencyProvider = provider;
    }

    IConcurrencyProvider* WorkContractGroup::concurrencyProvider() const {
        std::shared_lock<std::shared_mutex> lock(_concurrencyProviderMutex);
        return _concurrencyProvider;
    }

    std::string WorkContractGroup::debugString() const {
        std::ostringstream oss;
        oss << "WorkContractGroup(\"" << _name << "\", cap=" << _capacity
            << ") [active:" << activeCount()
            << " sched:" << scheduledCount()
            << " exec:" << executingCount()
            << " mainSched:" << mainThreadScheduledCount()
            << " stopping:" << (isStopping() ? "true" : "false") << "]";
        return oss.str();
    }

    bool WorkContractGroup::validateLocked(const WorkContractHandle& handle) const noexcept {
        if (handle.owner() != this) return false;
        if (handle.index() >= _contracts.size()) return false;
        const auto& slot = _contracts[handle.index()];
        return slot.state != ContractState::Free && slot.generation == handle.generation();
    }

    WorkContractGroup::ReadyKey WorkContractGroup::keyFor(uint32_t index) const noexcept {
        const auto& slot = _contracts[index];
        return ReadyKey{slot.priority, slot.sequence, index};
    }

    std::function<void()> WorkContractGroup::freeSlotLocked(uint32_t index) {
        auto& slot = _contracts[index];
        if (slot.state == ContractState::Scheduled) {
            if (slot.executionType == ExecutionType::MainThread) {
                _mainThreadReady.erase(keyFor(index));
                _mainThreadScheduledCount.fetch_sub(1, std::memory_order_acq_rel);
            } else {
                _ready.erase(keyFor(index));
                _scheduledCount.fetch_sub(1, std::memory_order_acq_rel);
            }
        }
        std::function<void()> work = std::move(slot.work);
        slot.work = nullptr;
        slot.generation++;
        slot.state = ContractState::Free;
        _freeList.push_back(index);
        _activeCount.fetch_sub(1, std::memory_order_acq_rel);
        return work;
    }

    void WorkContractGroup::notifyWaiters() {
        std::lock_guard<std::mutex> lock(_waitMutex);
        _waitCondition.notify_all();
    }

} // namespace Concurrency
} // namespace Core
} // namespace AsyncFile
