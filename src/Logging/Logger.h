/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the AsyncFile Core project.
 */

#pragma once

/**
 * @file Logger.h
 * @brief Process-wide logger with pluggable sinks
 *
 * Logger::global() is created on first use with a ConsoleSink attached. Its
 * minimum level defaults to Info and can be overridden with the
 * AFILE_LOG_LEVEL environment variable (trace, debug, info, warn, error,
 * fatal, off).
 *
 * @code
 * AFILE_LOG_INFO("service started");
 * AFILE_LOG_WARNING_CAT("RemoteFileBackend", "origin not configured");
 * @endcode
 */

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "ILogSink.h"
#include "LogLevel.h"

namespace AsyncFile {
namespace Core {
namespace Logging {

    class Logger {
    public:
        Logger();
        ~Logger();

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        static Logger& global();

        void addSink(std::shared_ptr<ILogSink> sink);
        bool removeSink(const std::shared_ptr<ILogSink>& sink);
        void clearSinks();
        size_t sinkCount() const;

        void setMinLevel(LogLevel level) noexcept { _minLevel.store(level, std::memory_order_relaxed); }
        LogLevel minLevel() const noexcept { return _minLevel.load(std::memory_order_relaxed); }
        bool isEnabled(LogLevel level) const noexcept {
            return level != LogLevel::Off && level >= minLevel();
        }

        void log(LogLevel level, std::string_view category, std::string_view message);
        void flush();

    private:
        std::atomic<LogLevel> _minLevel{LogLevel::Info};
        mutable std::mutex _sinksMutex;
        std::vector<std::shared_ptr<ILogSink>> _sinks;
    };

} // namespace Logging
} // namespace Core
} // namespace AsyncFile

#define AFILE_LOG_AT(level, category, message)                                                   \
    do {                                                                                         \
        auto& afileLogger_ = ::AsyncFile::Core::Logging::Logger::global();                       \
        if (afileLogger_.isEnabled(level)) {                                                     \
            afileLogger_.log((level), (category), (message));                                    \
        }                                                                                        \
    } while (0)

#define AFILE_LOG_TRACE(msg) AFILE_LOG_AT(::AsyncFile::Core::Logging::LogLevel::Trace, "", msg)
#define AFILE_LOG_DEBUG(msg) AFILE_LOG_AT(::AsyncFile::Core::Logging::LogLevel::Debug, "", msg)
#define AFILE_LOG_INFO(msg) AFILE_LOG_AT(::AsyncFile::Core::Logging::LogLevel::Info, "", msg)
#define AFILE_LOG_WARNING(msg) AFILE_LOG_AT(::AsyncFile::Core::Logging::LogLevel::Warning, "", msg)
#define AFILE_LOG_ERROR(msg) AFILE_LOG_AT(::AsyncFile::Core::Logging::LogLevel::Error, "", msg)
#define AFILE_LOG_FATAL(msg) AFILE_LOG_AT(::AsyncFile::Core::Logging::LogLevel::Fatal, "", msg)

#define AFILE_LOG_TRACE_CAT(cat, msg) AFILE_LOG_AT(::AsyncFile::Core::Logging::LogLevel::Trace, cat, msg)
#define AFILE_LOG_DEBUG_CAT(cat, msg) AFILE_LOG_AT(::AsyncFile::Core::Logging::LogLevel::Debug, cat, msg)
#define AFILE_LOG_INFO_CAT(cat, msg) AFILE_LOG_AT(::AsyncFile::Core::Logging::LogLevel::Info, cat, msg)
#define AFILE_LOG_WARNING_CAT(cat, msg) AFILE_LOG_AT(::AsyncFile::Core::Logging::LogLevel::Warning, cat, msg)
#define AFILE_LOG_ERROR_CAT(cat, msg) AFILE_LOG_AT(::AsyncFile::Core::Logging::LogLevel::Error, cat, msg)
#define AFILE_LOG_FATAL_CAT(cat, msg) AFILE_LOG_AT(::AsyncFile::Core::Logging::LogLevel::Fatal, cat, msg)
