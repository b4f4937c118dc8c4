#pragma once
#include <stdint.h>

// =====================================================
// Event Log
// =====================================================
// Diagnostic messages are written to the serial port as
// single JSON lines, the same framing the host link uses
// for replies, so one reader can consume both:
//
//   {"event":"log","ms":1234,"level":"info","tag":"ctrl","msg":"..."}
//
// ms is platform_millis() at the time of the call.
//
// Messages longer than LOG_MSG_MAX are truncated. Double
// quotes and backslashes in the message are replaced.
// =====================================================

#define LOG_LEVEL_DEBUG 0
#define LOG_LEVEL_INFO  1
#define LOG_LEVEL_WARN  2
#define LOG_LEVEL_ERROR 3
#define LOG_LEVEL_NONE  4

// Minimum level that is emitted (override via build flags)
#ifndef LOG_LEVEL
#define LOG_LEVEL LOG_LEVEL_INFO
#endif

#define LOG_MSG_MAX 160

void log_write(uint8_t level, const char* tag, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));

#if LOG_LEVEL <= LOG_LEVEL_DEBUG
#define log_debug(tag, ...) log_write(LOG_LEVEL_DEBUG, tag, __VA_ARGS__)
#else
#define log_debug(tag, ...) do {} while (0)
#endif

#if LOG_LEVEL <= LOG_LEVEL_INFO
#define log_info(tag, ...) log_write(LOG_LEVEL_INFO, tag, __VA_ARGS__)
#else
#define log_info(tag, ...) do {} while (0)
#endif

#if LOG_LEVEL <= LOG_LEVEL_WARN
#define log_warn(tag, ...) log_write(LOG_LEVEL_WARN, tag, __VA_ARGS__)
#else
#define log_warn(tag, ...) do {} while (0)
#endif

#if LOG_LEVEL <= LOG_LEVEL_ERROR
#define log_error(tag, ...) log_write(LOG_LEVEL_ERROR, tag, __VA_ARGS__)
#else
#define log_error(tag, ...) do {} while (0)
#endif
