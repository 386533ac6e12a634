/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the AsyncFile Core project.
 */

#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <thread>

#include "../CoreCommon.h"
#include "ConsoleSink.h"
#include "LogEntry.h"

namespace AsyncFile {
namespace Core {
namespace Logging {

    std::optional<LogLevel> parseLogLevel(std::string_view text) noexcept {
        std::string lower;
        lower.reserve(text.size());
        for (char c : text) {
            lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        if (lower == "trace") return LogLevel::Trace;
        if (lower == "debug") return LogLevel::Debug;
        if (lower == "info") return LogLevel::Info;
        if (lower == "warn" || lower == "warning") return LogLevel::Warning;
        if (lower == "error") return LogLevel::Error;
        if (lower == "fatal") return LogLevel::Fatal;
        if (lower == "off") return LogLevel::Off;
        return std::nullopt;
    }

    Logger::Logger() = default;

    Logger::~Logger() {
        flush();
    }

    Logger& Logger::global() {
        static Logger* instance = [] {
            // Never destroyed; static destructors may still log
            auto* logger = new Logger();
            logger->addSink(std::make_shared<ConsoleSink>());
            if (auto env = safeGetEnv("AFILE_LOG_LEVEL")) {
                if (auto level = parseLogLevel(*env)) {
                    logger->setMinLevel(*level);
                }
            }
            return logger;
        }();
        return *instance;
    }

    void Logger::addSink(std::shared_ptr<ILogSink> sink) {
        if (!sink) return;
        std::lock_guard<std::mutex> lock(_sinksMutex);
        _sinks.push_back(std::move(sink));
    }

    bool Logger::removeSink(const std::shared_ptr<ILogSink>& sink) {
        std::lock_guard<std::mutex> lock(_sinksMutex);
        auto it = std::find(_sinks.begin(), _sinks.end(), sink);
        if (it == _sinks.end()) return false;
        _sinks.erase(it);
        return true;
    }

    void Logger::clearSinks() {
        std::lock_guard<std::mutex> lock(_sinksMutex);
        _sinks.clear();
    }

    size_t Logger::sinkCount() const {
        std::lock_guard<std::mutex> lock(_sinksMutex);
        return _sinks.size();
    }

    void Logger::log(LogLevel level, std::string_view category, std::string_view message) {
        if (!isEnabled(level)) return;

        LogEntry entry;
        entry.timestamp = std::chrono::system_clock::now();
        entry.level = level;
        entry.category.assign(category.data(), category.size());
        entry.message.assign(message.data(), message.size());
        entry.threadId = std::this_thread::get_id();

        // Snapshot so sinks run without holding the registry lock
        std::vector<std::shared_ptr<ILogSink>> sinks;
        {
            std::lock_guard<std::mutex> lock(_sinksMutex);
            sinks = _sinks;
        }
        for (auto& sink : sinks) {
            if (sink->accepts(level)) {
                sink->write(entry);
            }
        }
    }

    void Logger::flush() {
        std::vector<std::shared_ptr<ILogSink>> sinks;
        {
            std::lock_guard<std::mutex> lock(_sinksMutex);
            sinks = _sinks;
        }
        for (auto& sink : sinks) {
            sink->flush();
        }
    }

} // namespace Logging
} // namespace Core
} // namespace AsyncFile
