#pragma once
#include <stdint.h>

// =====================================================
// Platform Timing Abstraction
// =====================================================
// Millisecond clock used to pace BlinkQueue::step().
// The queue itself never reads the clock; only the
// Application decides when a step is due.
//
// Usage:
//   - Call platform_timing_init() once at startup
//   - Compare platform_millis() deltas with unsigned
//     subtraction so the ~49 day wrap is harmless
// =====================================================

// Initialize timing system (call once at startup)
void platform_timing_init();

// Get milliseconds since startup (wraps every ~49 days)
uint32_t platform_millis();
