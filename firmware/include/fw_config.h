#pragma once

// ============================
// Firmware Version Definition
// ============================

// Major version number (increment on breaking changes)
#define BLINKQ_VERSION_MAJOR 1

// Minor version (add new features)
#define BLINKQ_VERSION_MINOR 0

// Patch version (bug fixes)
#define BLINKQ_VERSION_PATCH 0

// String form
#define BLINKQ_STR_HELPER(x) #x
#define BLINKQ_STR(x) BLINKQ_STR_HELPER(x)

#define BLINKQ_VERSION_STRING  \
    BLINKQ_STR(BLINKQ_VERSION_MAJOR) "." BLINKQ_STR(BLINKQ_VERSION_MINOR) "." BLINKQ_STR(BLINKQ_VERSION_PATCH)


// ============================
// Build Metadata
// ============================

// Auto-insert build date/time (gcc predefined macros)
#define BLINKQ_BUILD_DATE __DATE__
#define BLINKQ_BUILD_TIME __TIME__

// Optional git hash (inject via -DBLINKQ_BUILD_HASH=...)
#ifndef BLINKQ_BUILD_HASH
#define BLINKQ_BUILD_HASH "dev"
#endif


// ============================
// Blink Timing & Queues
// ============================

// Time between BlinkQueue steps (one Morse unit)
#ifndef BLINKQ_STEP_INTERVAL_MS
#define BLINKQ_STEP_INTERVAL_MS 250
#endif

// Pause after both queues drain, before they are refilled
#ifndef BLINKQ_ROUND_PAUSE_MS
#define BLINKQ_ROUND_PAUSE_MS 1000
#endif

#ifndef BLINKQ_LED0_QUEUE_CAPACITY
#define BLINKQ_LED0_QUEUE_CAPACITY 1
#endif

#ifndef BLINKQ_LED1_QUEUE_CAPACITY
#define BLINKQ_LED1_QUEUE_CAPACITY 8
#endif

// Text played on LED 1 each round
#ifndef BLINKQ_MESSAGE
#define BLINKQ_MESSAGE "HELLO."
#endif

#ifndef BLINKQ_SERIAL_BAUD
#define BLINKQ_SERIAL_BAUD 115200
#endif
