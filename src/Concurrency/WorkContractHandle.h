/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the AsyncFile Core project.
 */

/**
 * @file WorkContractHandle.h
 * @brief Stamped handle for scheduling and managing work contracts
 *
 * A WorkContractHandle carries (owner + index + generation) as stamped by
 * WorkContractGroup. The group is the source of truth; a handle is valid only
 * while its generation matches the live slot, so stale handles are detected
 * instead of touching a reused slot.
 */

#pragma once

#include <cstdint>
#include <string>

namespace AsyncFile {
namespace Core {
namespace Concurrency {

    class WorkContractGroup;

    /**
     * @brief States that a work contract can be in during its lifecycle
     */
    enum class ContractState : uint32_t {
        Free = 0,       ///< Slot is available for allocation
        Allocated = 1,  ///< Allocated but not scheduled
        Scheduled = 2,  ///< Scheduled and waiting for a thread
        Executing = 3   ///< Currently running
    };

    /**
     * @brief Result of schedule/unschedule operations
     */
    enum class ScheduleResult {
        Scheduled,         ///< Contract is now scheduled
        AlreadyScheduled,  ///< Contract was already scheduled
        NotScheduled,      ///< Contract is not scheduled (successful unschedule)
        Executing,         ///< Cannot modify, currently executing
        Invalid            ///< Invalid handle or stopped group
    };

    /**
     * @class WorkContractHandle
     * @brief Copyable identity of one contract slot
     *
     * Copying a handle copies only its stamp. Once the contract finishes
     * executing or is released, valid() becomes false.
     *
     * @code
     * WorkContractGroup group(64);
     * auto h = group.createContract([]{ doWork(); });
     * if (h.schedule() == ScheduleResult::Scheduled) { // queued }
     * @endcode
     */
    class WorkContractHandle {
    public:
        WorkContractHandle() = default;

        ScheduleResult schedule();

        /**
         * @brief Removes this contract from the ready set
         *
         * Succeeds only in the Scheduled state; a running contract cannot be pulled back.
         * @return NotScheduled on success, Executing if too late, or Invalid
         */
        ScheduleResult unschedule();

        bool valid() const;

        /// Frees the slot without running the work. The stored closure is destroyed.
        void release();

        bool isScheduled() const;
        bool isExecuting() const;

        WorkContractGroup* owner() const noexcept { return _owner; }
        uint32_t index() const noexcept { return _index; }
        uint32_t generation() const noexcept { return _generation; }

        std::string toString() const;

        friend bool operator==(const WorkContractHandle& a, const WorkContractHandle& b) noexcept {
            return a._owner == b._owner && a._index == b._index && a._generation == b._generation;
        }

    private:
        friend class WorkContractGroup;

        WorkContractHandle(WorkContractGroup* owner, uint32_t index, uint32_t generation) noexcept
            : _owner(owner), _index(index), _generation(generation) {}

        WorkContractGroup* _owner = nullptr;
        uint32_t _index = 0;
        uint32_t _generation = 0;
    };

} // namespace Concurrency
} // namespace Core
} // namespace AsyncFile
