#pragma once

// C-compatible logging shim that forwards to FerryCore's C++ logger backend.
// Provides printf-style logging macros that can be used from both C and C++.

#include <stdarg.h>
#ifdef __cplusplus
extern "C" {
#endif

// C-visible log levels (keep values in sync with Logging::LogLevel)
typedef enum FerryLogLevelC
{
    FERRY_LOG_TRACE_C = 0,
    FERRY_LOG_DEBUG_C = 1,
    FERRY_LOG_INFO_C = 2,
    FERRY_LOG_WARN_C = 3,
    FERRY_LOG_ERROR_C = 4,
    FERRY_LOG_FATAL_C = 5,
    FERRY_LOG_OFF_C = 6
} FerryLogLevelC;

// Core C APIs (printf-style)
void ferry_log_write(FerryLogLevelC level, const char* fmt, ...);
void ferry_log_write_cat(FerryLogLevelC level, const char* category, const char* fmt, ...);

// Minimum level of the process-wide logger, shared with C++ callers
void ferry_log_set_level(FerryLogLevelC level);
FerryLogLevelC ferry_log_get_level(void);
int ferry_log_is_enabled(FerryLogLevelC level);

// va_list variants
void ferry_log_vwrite(FerryLogLevelC level, const char* fmt, va_list args);
void ferry_log_vwrite_cat(FerryLogLevelC level, const char* category, const char* fmt, va_list args);

#ifdef __cplusplus
}  // extern "C"
#endif

// ------------------------------------------------------------
// Macros usable from BOTH C and C++ (printf-style)
// By default, non-category macros use __func__ as the category.
// ------------------------------------------------------------
#ifndef FERRY_LOG_CATEGORY_DEFAULT
#define FERRY_LOG_CATEGORY_DEFAULT __func__
#endif

#define FERRY_LOG_TRACE_F(fmt, ...) \
    ferry_log_write_cat(FERRY_LOG_TRACE_C, FERRY_LOG_CATEGORY_DEFAULT, (fmt), ##__VA_ARGS__)
#define FERRY_LOG_DEBUG_F(fmt, ...) \
    ferry_log_write_cat(FERRY_LOG_DEBUG_C, FERRY_LOG_CATEGORY_DEFAULT, (fmt), ##__VA_ARGS__)
#define FERRY_LOG_INFO_F(fmt, ...) \
    ferry_log_write_cat(FERRY_LOG_INFO_C, FERRY_LOG_CATEGORY_DEFAULT, (fmt), ##__VA_ARGS__)
#define FERRY_LOG_WARNING_F(fmt, ...) \
    ferry_log_write_cat(FERRY_LOG_WARN_C, FERRY_LOG_CATEGORY_DEFAULT, (fmt), ##__VA_ARGS__)
#define FERRY_LOG_ERROR_F(fmt, ...) \
    ferry_log_write_cat(FERRY_LOG_ERROR_C, FERRY_LOG_CATEGORY_DEFAULT, (fmt), ##__VA_ARGS__)
#define FERRY_LOG_FATAL_F(fmt, ...) \
    ferry_log_write_cat(FERRY_LOG_FATAL_C, FERRY_LOG_CATEGORY_DEFAULT, (fmt), ##__VA_ARGS__)

#define FERRY_LOG_TRACE_CAT_F(cat, fmt, ...) ferry_log_write_cat(FERRY_LOG_TRACE_C, (cat), (fmt), ##__VA_ARGS__)
#define FERRY_LOG_DEBUG_CAT_F(cat, fmt, ...) ferry_log_write_cat(FERRY_LOG_DEBUG_C, (cat), (fmt), ##__VA_ARGS__)
#define FERRY_LOG_INFO_CAT_F(cat, fmt, ...) ferry_log_write_cat(FERRY_LOG_INFO_C, (cat), (fmt), ##__VA_ARGS__)
#define FERRY_LOG_WARNING_CAT_F(cat, fmt, ...) ferry_log_write_cat(FERRY_LOG_WARN_C, (cat), (fmt), ##__VA_ARGS__)
#define FERRY_LOG_ERROR_CAT_F(cat, fmt, ...) ferry_log_write_cat(FERRY_LOG_ERROR_C, (cat), (fmt), ##__VA_ARGS__)
#define FERRY_LOG_FATAL_CAT_F(cat, fmt, ...) ferry_log_write_cat(FERRY_LOG_FATAL_C, (cat), (fmt), ##__VA_ARGS__)
