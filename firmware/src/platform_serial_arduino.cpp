// Platform serial implementation for Arduino framework
#include "platform_serial.h"
#include <Arduino.h>

void platform_serial_begin(uint32_t baud) {
    Serial.begin(baud);
}

void platform_serial_print(const char* str) {
    Serial.print(str);
}

void platform_serial_println(const char* str) {
    Serial.println(str);
}

void platform_serial_flush() {
    Serial.flush();
}
