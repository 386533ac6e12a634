/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the AsyncFile Core project.
 */

/**
 * @file WorkService.h
 * @brief Worker thread pool that drains registered WorkContractGroups
 *
 * Groups are registered with addWorkContractGroup(). Worker threads visit the
 * groups round-robin, select the highest-priority ready contract from each and
 * execute it. Idle workers sleep until a group reports scheduled work.
 *
 * A group must outlive its registration; a group that is destroyed while still
 * registered removes itself through IConcurrencyProvider::notifyGroupDestroyed().
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <vector>

#include "IConcurrencyProvider.h"

namespace AsyncFile {
namespace Core {
namespace Concurrency {

    class WorkContractGroup;

    class WorkService : public IConcurrencyProvider {
    public:
        struct Config {
            size_t threadCount = 0;  ///< 0 selects std::thread::hardware_concurrency()
            size_t maxWorkGroups = 64;
            std::chrono::milliseconds idleWait{10};  ///< Upper bound on an idle worker's sleep
        };

        enum class GroupOperationStatus {
            Added,
            Removed,
            Exists,
            NotFound,
            OutOfSpace
        };

        explicit WorkService(Config config);
        ~WorkService() override;

        WorkService(const WorkService&) = delete;
        WorkService& operator=(const WorkService&) = delete;

        void start();
        /// Joins all worker threads. Contracts still scheduled stay scheduled.
        void stop();
        bool isRunning() const noexcept { return _running.load(std::memory_order_acquire); }

        GroupOperationStatus addWorkContractGroup(WorkContractGroup* group);
        GroupOperationStatus removeWorkContractGroup(WorkContractGroup* group);
        size_t getWorkContractGroupCount() const;
        size_t getThreadCount() const noexcept { return _threadCount; }

        void notifyWorkAvailable(WorkContractGroup* group) override;
        void notifyGroupDestroyed(WorkContractGroup* group) override;

    private:
        void workerLoop(size_t workerIndex);
        bool executeOne(size_t& cursor);

        Config _config;
        size_t _threadCount = 0;

        mutable std::shared_mutex _groupsMutex;
        std::vector<WorkContractGroup*> _groups;

        std::vector<std::thread> _threads;
        std::atomic<bool> _running{false};

        std::mutex _wakeMutex;
        std::condition_variable _wakeCondition;
        uint64_t _wakeEpoch = 0;
    };

} // namespace Concurrency
} // namespace Core
} // namespace AsyncFile
