#include "event_log.h"
#include "platform_serial.h"
#include "platform_timing.h"
#include <stdarg.h>
#include <stdio.h>

static const char* levelName(uint8_t level) {
    switch (level) {
        case LOG_LEVEL_DEBUG: return "debug";
        case LOG_LEVEL_INFO:  return "info";
        case LOG_LEVEL_WARN:  return "warn";
        case LOG_LEVEL_ERROR: return "error";
        default:              return "?";
    }
}

void log_write(uint8_t level, const char* tag, const char* fmt, ...) {
    if (level < LOG_LEVEL) {
        return;
    }

    char msg[LOG_MSG_MAX];
    va_list args;
    va_start(args, fmt);
    vsnprintf(msg, sizeof(msg), fmt, args);
    va_end(args);

    // Keep the line valid JSON without a full escaper
    for (char* p = msg; *p; ++p) {
        if (*p == '"') *p = '\'';
        else if (*p == '\\') *p = '/';
        else if (*p == '\r' || *p == '\n') *p = ' ';
    }

    char line[LOG_MSG_MAX + 64];
    snprintf(line, sizeof(line),
             "{\"event\":\"log\",\"ms\":%lu,\"level\":\"%s\",\"tag\":\"%s\",\"msg\":\"%s\"}",
             (unsigned long)platform_millis(), levelName(level), tag ? tag : "", msg);
    platform_serial_println(line);
}
