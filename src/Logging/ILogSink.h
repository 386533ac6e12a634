/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the AsyncFile Core project.
 */

#pragma once

#include <atomic>

#include "LogEntry.h"

namespace AsyncFile {
namespace Core {
namespace Logging {

    /**
     * @brief Destination for log records
     *
     * Sinks are shared between threads; write() may be called concurrently and
     * implementations serialize internally as needed.
     */
    class ILogSink {
    public:
        virtual ~ILogSink() = default;

        virtual void write(const LogEntry& entry) = 0;
        virtual void flush() {}

        void setMinLevel(LogLevel level) noexcept { _minLevel.store(level, std::memory_order_relaxed); }
        LogLevel minLevel() const noexcept { return _minLevel.load(std::memory_order_relaxed); }
        bool accepts(LogLevel level) const noexcept { return level >= minLevel(); }

    private:
        std::atomic<LogLevel> _minLevel{LogLevel::Trace};
    };

} // namespace Logging
} // namespace Core
} // namespace AsyncFile
