#pragma once

// C-compatible logging shim that forwards to the AsyncFile Core logger.
// printf-style entry points and macros usable from both C and C++.

#include <stdarg.h>
#ifdef __cplusplus
extern "C" {
#endif

// Values match Logging::LogLevel
typedef enum AfileLogLevelC
{
    AFILE_LOG_TRACE_C = 0,
    AFILE_LOG_DEBUG_C = 1,
    AFILE_LOG_INFO_C = 2,
    AFILE_LOG_WARN_C = 3,
    AFILE_LOG_ERROR_C = 4,
    AFILE_LOG_FATAL_C = 5
} AfileLogLevelC;

void afile_log_write(AfileLogLevelC level, const char* fmt, ...);
void afile_log_write_cat(AfileLogLevelC level, const char* category, const char* fmt, ...);

void afile_log_vwrite(AfileLogLevelC level, const char* fmt, va_list args);
void afile_log_vwrite_cat(AfileLogLevelC level, const char* category, const char* fmt, va_list args);

#ifdef __cplusplus
}  // extern "C"
#endif

#ifndef AFILE_LOG_CATEGORY_DEFAULT
#define AFILE_LOG_CATEGORY_DEFAULT __func__
#endif

#define AFILE_LOG_DEBUG_F(fmt, ...) \
    afile_log_write_cat(AFILE_LOG_DEBUG_C, AFILE_LOG_CATEGORY_DEFAULT, (fmt), ##__VA_ARGS__)
#define AFILE_LOG_INFO_F(fmt, ...) \
    afile_log_write_cat(AFILE_LOG_INFO_C, AFILE_LOG_CATEGORY_DEFAULT, (fmt), ##__VA_ARGS__)
#define AFILE_LOG_WARNING_F(fmt, ...) \
    afile_log_write_cat(AFILE_LOG_WARN_C, AFILE_LOG_CATEGORY_DEFAULT, (fmt), ##__VA_ARGS__)
#define AFILE_LOG_ERROR_F(fmt, ...) \
    afile_log_write_cat(AFILE_LOG_ERROR_C, AFILE_LOG_CATEGORY_DEFAULT, (fmt), ##__VA_ARGS__)

#define AFILE_LOG_DEBUG_CAT_F(cat, fmt, ...) afile_log_write_cat(AFILE_LOG_DEBUG_C, (cat), (fmt), ##__VA_ARGS__)
#define AFILE_LOG_INFO_CAT_F(cat, fmt, ...) afile_log_write_cat(AFILE_LOG_INFO_C, (cat), (fmt), ##__VA_ARGS__)
#define AFILE_LOG_WARNING_CAT_F(cat, fmt, ...) afile_log_write_cat(AFILE_LOG_WARN_C, (cat), (fmt), ##__VA_ARGS__)
#define AFILE_LOG_ERROR_CAT_F(cat, fmt, ...) afile_log_write_cat(AFILE_LOG_ERROR_C, (cat), (fmt), ##__VA_ARGS__)
