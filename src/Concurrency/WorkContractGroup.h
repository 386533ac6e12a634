/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the AsyncFile Core project.
 */

/**
 * @file WorkContractGroup.h
 * @brief Fixed-capacity pool of one-shot work contracts
 *
 * A WorkContractGroup owns up to `capacity` contracts. Each contract wraps a
 * closure that runs exactly once, on whichever thread selects it, or is
 * released without running (its closure is destroyed in that case). Ready
 * contracts are ordered by Priority, highest first, and by submission order
 * among equal priorities.
 *
 * Threads drive the group in one of two ways:
 * - A WorkService registered with addWorkContractGroup() selects and executes
 *   background contracts on its worker threads.
 * - Any thread may call executeAllBackgroundWork() to drain ready work inline,
 *   which is how FileOperationHandle::wait() makes progress without a service.
 *
 * @code
 * WorkContractGroup group(256, "IO");
 * auto h = group.createContract([]{ doWork(); }, ExecutionType::AnyThread, Priority::normal());
 * h.schedule();
 * group.executeAllBackgroundWork();
 * @endcode
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

#include "Priority.h"
#include "WorkContractHandle.h"

namespace AsyncFile {
namespace Core {
namespace Concurrency {

    class IConcurrencyProvider;

    enum class ExecutionType {
        AnyThread,   ///< Picked up by worker threads or executeAllBackgroundWork()
        MainThread   ///< Only run by executeMainThreadWork()
    };

    class WorkContractGroup {
    public:
        explicit WorkContractGroup(size_t capacity, std::string name = "WorkContractGroup");
        ~WorkContractGroup();

        WorkContractGroup(const WorkContractGroup&) = delete;
        WorkContractGroup& operator=(const WorkContractGroup&) = delete;

        /**
         * @brief Allocates a contract slot for the given closure
         * @return A handle in the Allocated state, or an invalid handle if the
         *         group is full or stopping
         */
        WorkContractHandle createContract(std::function<void()> work,
                                          ExecutionType executionType = ExecutionType::AnyThread,
                                          Priority priority = Priority());

        ScheduleResult scheduleContract(const WorkContractHandle& handle);
        ScheduleResult unscheduleContract(const WorkContractHandle& handle);

        /// Frees an Allocated or Scheduled slot. Executing contracts are left alone.
        void releaseContract(const WorkContractHandle& handle);

        bool isValidHandle(const WorkContractHandle& handle) const noexcept;
        ContractState getContractState(const WorkContractHandle& handle) const noexcept;

        /**
         * @brief Claims the highest-priority ready background contract
         *
         * The returned contract is in the Executing state and must be passed to
         * executeContract(). Returns an invalid handle when nothing is ready or the
         * group is stopping.
         */
        WorkContractHandle selectForExecution();
        WorkContractHandle selectForMainThreadExecution();

        /// Runs a contract previously claimed by a select call, then frees its slot
        void executeContract(const WorkContractHandle& handle);

        void executeAllBackgroundWork();
        size_t executeAllMainThreadWork();
        size_t executeMainThreadWork(size_t maxContracts);

        /// Stops handing out work. Already executing contracts finish normally.
        void stop();
        void resume();
        bool isStopping() const noexcept { return _stopping.load(std::memory_order_acquire); }

        /**
         * @brief Blocks until no contract is executing and, unless stopping, none is scheduled
         *
         * Does not execute anything itself; pair with a WorkService or another
         * thread that drains the group.
         */
        void wait();

        size_t capacity() const noexcept { return _capacity; }
        size_t activeCount() const noexcept { return _activeCount.load(std::memory_order_acquire); }
        size_t scheduledCount() const noexcept { return _scheduledCount.load(std::memory_order_acquire); }
        size_t executingCount() const noexcept { return _executingCount.load(std::memory_order_acquire); }
        size_t mainThreadScheduledCount() const noexcept {
            return _mainThreadScheduledCount.load(std::memory_order_acquire);
        }
        const std::string& name() const noexcept { return _name; }

        void setConcurrencyProvider(IConcurrencyProvider* provider);
        IConcurrencyProvider* concurrencyProvider() const;

        std::string debugString() const;

    private:
        struct ContractSlot {
            ContractState state = ContractState::Free;
            uint32_t generation = 1;
            ExecutionType executionType = ExecutionType::AnyThread;
            Priority priority;
            uint64_t sequence = 0;
            std::function<void()> work;
        };

        // Ordering key for the ready sets: higher priority first, then FIFO
        struct ReadyKey {
            Priority priority;
            uint64_t sequence;
            uint32_t index;

            bool operator<(const ReadyKey& other) const noexcept {
                if (priority != other.priority) return priority > other.priority;
                return sequence < other.sequence;
            }
        };

        bool validateLocked(const WorkContractHandle& handle) const noexcept;
        ReadyKey keyFor(uint32_t index) const noexcept;
        WorkContractHandle selectFrom(std::set<ReadyKey>& readySet, std::atomic<size_t>& scheduledCounter);
        std::function<void()> freeSlotLocked(uint32_t index);
        void notifyWaiters();

        const size_t _capacity;
        const std::string _name;

        mutable std::mutex _mutex;
        std::vector<ContractSlot> _contracts;
        std::vector<uint32_t> _freeList;
        std::set<ReadyKey> _ready;
        std::set<ReadyKey> _mainThreadReady;
        uint64_t _nextSequence = 0;

        std::atomic<size_t> _activeCount{0};
        std::atomic<size_t> _scheduledCount{0};
        std::atomic<size_t> _mainThreadScheduledCount{0};
        std::atomic<size_t> _executingCount{0};
        std::atomic<bool> _stopping{false};

        std::mutex _waitMutex;
        std::condition_variable _waitCondition;

        mutable std::shared_mutex _concurrencyProviderMutex;
        IConcurrencyProvider* _concurrencyProvider = nullptr;
    };

} // namespace Concurrency
} // namespace Core
} // namespace AsyncFile
