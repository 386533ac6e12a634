/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the AsyncFile Core project.
 */

#pragma once

#include <iosfwd>
#include <mutex>

#include "ILogSink.h"

namespace AsyncFile {
namespace Core {
namespace Logging {

    /**
     * @brief Writes records to stdout, or stderr for Warning and above
     *
     * Line format: "HH:MM:SS.mmm [LEVEL] [category] message".
     */
    class ConsoleSink : public ILogSink {
    public:
        ConsoleSink();
        // Routes every level to one stream. Used by tests to capture output.
        explicit ConsoleSink(std::ostream& out);

        void write(const LogEntry& entry) override;
        void flush() override;

        static std::string formatEntry(const LogEntry& entry);

    private:
        std::ostream* _out = nullptr;
        std::mutex _mutex;
    };

} // namespace Logging
} // namespace Core
} // namespace AsyncFile
