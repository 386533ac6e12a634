/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the AsyncFile Core project.
 */

#pragma once

namespace AsyncFile {
namespace Core {
namespace Concurrency {

    class WorkContractGroup;

    /**
     * @brief Receives notifications from WorkContractGroup
     *
     * Implemented by WorkService. A group calls notifyWorkAvailable() every time a
     * contract is scheduled, and notifyGroupDestroyed() from its destructor after
     * all of its work has drained.
     */
    class IConcurrencyProvider {
    public:
        virtual ~IConcurrencyProvider() = default;

        virtual void notifyWorkAvailable(WorkContractGroup* group) = 0;
        virtual void notifyGroupDestroyed(WorkContractGroup* group) = 0;
    };

} // namespace Concurrency
} // namespace Core
} // namespace AsyncFile
