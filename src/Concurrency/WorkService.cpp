/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the AsyncFile Core project.
 */

#include "WorkService.h"

#include <algorithm>

#include "../Logging/Logger.h"
#include "WorkContractGroup.h"

namespace AsyncFile {
namespace Core {
namespace Concurrency {

    WorkService::WorkService(Config config) : _config(config) {
        _threadCount = _config.threadCount;
        if (_threadCount == 0) {
            _threadCount = std::max<size_t>(1, std::thread::hardware_concurrency());
        }
    }

    WorkService::~WorkService() {
        stop();

        std::unique_lock<std::shared_mutex> lock(_groupsMutex);
        for (auto* group : _groups) {
            group->setConcurrencyProvider(nullptr);
        }
        _groups.clear();
    }

    void WorkService::start() {
        bool expected = false;
        if (!_running.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
            return;
        }
        _threads.reserve(_threadCount);
        for (size_t i = 0; i < _threadCount; ++i) {
            _threads.emplace_back(&WorkService::workerLoop, this, i);
        }
        AFILE_LOG_DEBUG_CAT("WorkService", "Started " + std::to_string(_threadCount) + " worker threads");
    }

    void WorkService::stop() {
        bool expected = true;
        if (!_running.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(_wakeMutex);
            ++_wakeEpoch;
        }
        _wakeCondition.notify_all();
        for (auto& t : _threads) {
            if (t.joinable()) t.join();
        }
        _threads.clear();
    }

    WorkService::GroupOperationStatus WorkService::addWorkContractGroup(WorkContractGroup* group) {
        if (!group) return GroupOperationStatus::NotFound;
        {
            std::unique_lock<std::shared_mutex> lock(_groupsMutex);
            if (std::find(_groups.begin(), _groups.end(), group) != _groups.end()) {
                return GroupOperationStatus::Exists;
            }
            if (_groups.size() >= _config.maxWorkGroups) {
                return GroupOperationStatus::OutOfSpace;
            }
            _groups.push_back(group);
        }
        group->setConcurrencyProvider(this);
        // The group may already hold scheduled work
        notifyWorkAvailable(group);
        return GroupOperationStatus::Added;
    }

    WorkService::GroupOperationStatus WorkService::removeWorkContractGroup(WorkContractGroup* group) {
        // Exclusive lock waits for any worker currently executing from the group
        std::unique_lock<std::shared_mutex> lock(_groupsMutex);
        auto it = std::find(_groups.begin(), _groups.end(), group);
        if (it == _groups.end()) {
            return GroupOperationStatus::NotFound;
        }
        _groups.erase(it);
        lock.unlock();

        if (group->concurrencyProvider() == this) {
            group->setConcurrencyProvider(nullptr);
        }
        return GroupOperationStatus::Removed;
    }

    size_t WorkService::getWorkContractGroupCount() const {
        std::shared_lock<std::shared_mutex> lock(_groupsMutex);
        return _groups.size();
    }

    void WorkService::notifyWorkAvailable(WorkContractGroup*) {
        {
            std::lock_guard<std::mutex> lock(_wakeMutex);
            ++_wakeEpoch;
        }
        _wakeCondition.notify_one();
    }

    void WorkService::notifyGroupDestroyed(WorkContractGroup* group) {
        std::unique_lock<std::shared_mutex> lock(_groupsMutex);
        _groups.erase(std::remove(_groups.begin(), _groups.end(), group), _groups.end());
    }

    bool WorkService::executeOne(size_t& cursor) {
        std::shared_lock<std::shared_mutex> lock(_groupsMutex);
        const size_t count = _groups.size();
        for (size_t i = 0; i < count; ++i) {
            WorkContractGroup* group = _groups[(cursor + i) % count];
            WorkContractHandle handle = group->selectForExecution();
            if (handle.owner()) {
                group->executeContract(handle);
                cursor = (cursor + i + 1) % count;
                return true;
            }
        }
        return false;
    }

    void WorkService::workerLoop(size_t workerIndex) {
        size_t cursor = workerIndex;
        while (_running.load(std::memory_order_acquire)) {
            uint64_t epoch;
            {
                std::lock_guard<std::mutex> lock(_wakeMutex);
                epoch = _wakeEpoch;
            }
            if (executeOne(cursor)) {
                continue;
            }
            std::unique_lock<std::mutex> lock(_wakeMutex);
            _wakeCondition.wait_for(lock, _config.idleWait, [&]() {
                return _wakeEpoch != epoch || !_running.load(std::memory_order_acquire);
            });
        }
    }

} // namespace Concurrency
} // namespace Core
} // namespace AsyncFile
