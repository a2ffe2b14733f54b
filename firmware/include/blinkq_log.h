#pragma once
#include <stdint.h>

// =====================================================
// Logging
// =====================================================
// Tagged, levelled log lines on the platform console:
//   [    1234] [I] [APP ] message
//
// BLINKQ_LOG_LEVEL is fixed at compile time; calls below
// it return before any formatting happens.
//
// Do not log from an ISR. BlinkQueue does not log.
// =====================================================

enum class LogLevel : uint8_t {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4   // Disable all logging
};

// Minimum level (0 = Debug ... 4 = None); override via build flags
#ifndef BLINKQ_LOG_LEVEL
#define BLINKQ_LOG_LEVEL 1
#endif

// Longest formatted message (longer ones are truncated)
#ifndef BLINKQ_LOG_LINE_MAX
#define BLINKQ_LOG_LINE_MAX 96
#endif

namespace LogTag {
    constexpr const char* APP   = "APP";
    constexpr const char* QUEUE = "QUEU";
    constexpr const char* BOARD = "BRD";
}

// printf-style log line
void blinkq_log(LogLevel level, const char* tag, const char* format, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

#define BLINKQ_LOG_DEBUG(tag, ...) blinkq_log(LogLevel::Debug, tag, __VA_ARGS__)
#define BLINKQ_LOG_INFO(tag, ...)  blinkq_log(LogLevel::Info,  tag, __VA_ARGS__)
#define BLINKQ_LOG_WARN(tag, ...)  blinkq_log(LogLevel::Warn,  tag, __VA_ARGS__)
#define BLINKQ_LOG_ERROR(tag, ...) blinkq_log(LogLevel::Error, tag, __VA_ARGS__)
