#include "blinkq_log.h"
#include "platform_serial.h"
#include "platform_timing.h"

#include <stdarg.h>
#include <stdio.h>

static const char* levelMarker(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "[D] ";
        case LogLevel::Info:  return "[I] ";
        case LogLevel::Warn:  return "[W] ";
        case LogLevel::Error: return "[E] ";
        default:              return "";
    }
}

void blinkq_log(LogLevel level, const char* tag, const char* format, ...) {
    if (static_cast<uint8_t>(level) < BLINKQ_LOG_LEVEL || level == LogLevel::None) {
        return;
    }

    char prefix[24];
    snprintf(prefix, sizeof(prefix), "[%8lu] ", static_cast<unsigned long>(platform_millis()));
    platform_serial_print(prefix);
    platform_serial_print(levelMarker(level));

    snprintf(prefix, sizeof(prefix), "[%-4s] ", tag ? tag : "");
    platform_serial_print(prefix);

    char message[BLINKQ_LOG_LINE_MAX];
    va_list args;
    va_start(args, format);
    vsnprintf(message, sizeof(message), format, args);
    va_end(args);

    platform_serial_println(message);
}
