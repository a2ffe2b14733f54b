#pragma once
#include <stdint.h>
#include <stddef.h>

// =====================================================
// Platform Serial Abstraction
// =====================================================
// Write-only console used by the logger (blinkq_log.h).
// Arduino builds print to Serial; host test builds
// capture the text in memory.
// =====================================================

// Initialize the console
// baud: baud rate (ignored for USB CDC, kept for compatibility)
void platform_serial_begin(uint32_t baud);

// Print a string (no newline)
void platform_serial_print(const char* str);

// Print a string with newline (\r\n)
void platform_serial_println(const char* str);

// Flush output buffer (wait for transmission to complete)
// Application flushes once after the startup banner
void platform_serial_flush();
