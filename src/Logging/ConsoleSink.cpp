/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the AsyncFile Core project.
 */

#include "ConsoleSink.h"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace AsyncFile {
namespace Core {
namespace Logging {

    ConsoleSink::ConsoleSink() = default;

    ConsoleSink::ConsoleSink(std::ostream& out) : _out(&out) {}

    std::string ConsoleSink::formatEntry(const LogEntry& entry) {
        using namespace std::chrono;
        const auto t = system_clock::to_time_t(entry.timestamp);
        const auto ms = duration_cast<milliseconds>(entry.timestamp.time_since_epoch()).count() % 1000;

        std::tm tm{};
#if defined(_WIN32)
        localtime_s(&tm, &t);
#else
        localtime_r(&t, &tm);
#endif
        std::ostringstream oss;
        oss << std::put_time(&tm, "%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms
            << " [" << toString(entry.level) << "]";
        if (!entry.category.empty()) {
            oss << " [" << entry.category << "]";
        }
        oss << ' ' << entry.message;
        return oss.str();
    }

    void ConsoleSink::write(const LogEntry& entry) {
        if (!accepts(entry.level)) return;
        const std::string line = formatEntry(entry);

        std::lock_guard<std::mutex> lock(_mutex);
        std::ostream& os = _out ? *_out : (entry.level >= LogLevel::Warning ? std::cerr : std::cout);
        os << line << '\n';
        if (entry.level >= LogLevel::Error) {
            os.flush();
        }
    }

    void ConsoleSink::flush() {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_out) {
            _out->flush();
        } else {
            std::cout.flush();
            std::cerr.flush();
        }
    }

} // namespace Logging
} // namespace Core
} // namespace AsyncFile
