// Platform timing implementation for Arduino framework
#include "platform_timing.h"
#include <Arduino.h>

void platform_timing_init() {
    // Arduino starts its tick counter before setup()
}

uint32_t platform_millis() {
    return millis();
}
