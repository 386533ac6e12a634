/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the AsyncFile Core project.
 */

/**
 * @file Priority.h
 * @brief Opaque scheduling weight attached to every unit of work
 *
 * Priority is only ever compared. Higher values are selected first by
 * WorkContractGroup; contracts of equal priority run in submission order.
 * Callers outside the scheduler must treat it as an opaque token.
 */

#pragma once

#include <compare>
#include <cstdint>

namespace AsyncFile {
namespace Core {
namespace Concurrency {

    class Priority {
    public:
        constexpr Priority() noexcept = default;
        constexpr explicit Priority(uint8_t weight) noexcept : _weight(weight) {}

        static constexpr Priority background() noexcept { return Priority(32); }
        static constexpr Priority normal() noexcept { return Priority(128); }
        static constexpr Priority userInitiated() noexcept { return Priority(192); }
        static constexpr Priority highestAsync() noexcept { return Priority(254); }
        /// Used by test suites so their work is never starved by background load
        static constexpr Priority unitTest() noexcept { return Priority(255); }

        constexpr uint8_t weight() const noexcept { return _weight; }

        friend constexpr auto operator<=>(const Priority&, const Priority&) noexcept = default;

    private:
        uint8_t _weight = 128;
    };

} // namespace Concurrency
} // namespace Core
} // namespace AsyncFile
