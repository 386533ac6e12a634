/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the AsyncFile Core project.
 */

#include "WorkContractHandle.h"
#include "WorkContractGroup.h"

#include <sstream>

namespace AsyncFile {
namespace Core {
namespace Concurrency {

    ScheduleResult WorkContractHandle::schedule() {
        if (!_owner) return ScheduleResult::Invalid;
        return _owner->scheduleContract(*this);
    }

    ScheduleResult WorkContractHandle::unschedule() {
        if (!_owner) return ScheduleResult::Invalid;
        return _owner->unscheduleContract(*this);
    }

    bool WorkContractHandle::valid() const {
        return _owner && _owner->isValidHandle(*this);
    }

    void WorkContractHandle::release() {
        if (_owner) {
            _owner->releaseContract(*this);
        }
        // Clear identity so later calls are cheap no-ops
        _owner = nullptr;
        _index = 0;
        _generation = 0;
    }

    bool WorkContractHandle::isScheduled() const {
        if (!_owner) return false;
        return _owner->getContractState(*this) == ContractState::Scheduled;
    }

    bool WorkContractHandle::isExecuting() const {
        if (!_owner) return false;
        return _owner->getContractState(*this) == ContractState::Executing;
    }

    std::string WorkContractHandle::toString() const {
        std::ostringstream oss;
        if (_owner) {
            oss << "WorkContractHandle(owner=" << static_cast<const void*>(_owner)
                << ", idx=" << _index << ", gen=" << _generation << ")";
        } else {
            oss << "WorkContractHandle(invalid)";
        }
        return oss.str();
    }

} // namespace Concurrency
} // namespace Core
} // namespace AsyncFile
