#pragma once
#include <stdint.h>
#include <stdbool.h>

// =====================================================
// Platform GPIO Abstraction
// =====================================================
// Output-only GPIO access for the blink queue pins.
// Arduino builds link platform_gpio_arduino.cpp; host
// test builds link a fake that records every write.
//
// Usage:
//   - Include this header instead of Arduino.h for GPIO
//   - Prefer GpioOutputPin (output_pin.h) over calling
//     these directly
// =====================================================

// Output driver type
typedef enum {
    PLATFORM_GPIO_MODE_OUTPUT,
    PLATFORM_GPIO_MODE_OUTPUT_OD  // Open-drain output
} platform_gpio_mode_t;

// Output levels
typedef enum {
    PLATFORM_GPIO_LOW = 0,
    PLATFORM_GPIO_HIGH = 1
} platform_gpio_state_t;

// Configure a pin as an output
// pin: Platform-specific pin identifier (e.g., PA5 on STM32 Arduino)
// mode: Push-pull or open-drain
void platform_gpio_pin_mode(uint32_t pin, platform_gpio_mode_t mode);

// Drive an output pin
// pin: Platform-specific pin identifier
// state: HIGH or LOW
void platform_gpio_write(uint32_t pin, platform_gpio_state_t state);
