/* C logger shim forwarding to the C++ Logger */
#include "Logging/CLogger.h"

#include <cstdarg>
#include <cstdio>
#include <string>

#include "Logging/LogLevel.h"
#include "Logging/Logger.h"

using ::AsyncFile::Core::Logging::Logger;
using ::AsyncFile::Core::Logging::LogLevel;

static LogLevel toLogLevel(AfileLogLevelC lvl) noexcept {
    switch (lvl) {
        case AFILE_LOG_TRACE_C:
            return LogLevel::Trace;
        case AFILE_LOG_DEBUG_C:
            return LogLevel::Debug;
        case AFILE_LOG_INFO_C:
            return LogLevel::Info;
        case AFILE_LOG_WARN_C:
            return LogLevel::Warning;
        case AFILE_LOG_ERROR_C:
            return LogLevel::Error;
        case AFILE_LOG_FATAL_C:
            return LogLevel::Fatal;
        default:
            return LogLevel::Info;
    }
}

static void writeFormatted(AfileLogLevelC level, const char* category, const char* fmt, va_list args) {
    if (!fmt) return;
    const LogLevel mapped = toLogLevel(level);
    auto& logger = Logger::global();
    if (!logger.isEnabled(mapped)) return;

    va_list sizing;
    va_copy(sizing, args);
    int needed = std::vsnprintf(nullptr, 0, fmt, sizing);
    va_end(sizing);
    if (needed < 0) return;

    std::string message(static_cast<size_t>(needed), '\0');
    std::vsnprintf(message.data(), message.size() + 1, fmt, args);

    logger.log(mapped, (category && *category) ? category : "C", message);
}

extern "C" {

void afile_log_vwrite(AfileLogLevelC level, const char* fmt, va_list args) {
    writeFormatted(level, "C", fmt, args);
}

void afile_log_vwrite_cat(AfileLogLevelC level, const char* category, const char* fmt, va_list args) {
    writeFormatted(level, category, fmt, args);
}

void afile_log_write(AfileLogLevelC level, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    writeFormatted(level, "C", fmt, args);
    va_end(args);
}

void afile_log_write_cat(AfileLogLevelC level, const char* category, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    writeFormatted(level, category, fmt, args);
    va_end(args);
}

}  // extern "C"
