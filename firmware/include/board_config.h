#pragma once
// =====================================================
// Board Pin Configuration
// =====================================================
// Central location for the blink output pins and their
// wiring polarity. Override any value via build flags:
//   build_flags = -DBLINKQ_LED0_PIN=PA5 -DBLINKQ_LED0_ACTIVE_LOW=1
// =====================================================

#include <stdint.h>

// For Arduino builds, include Arduino.h to get pin definitions (PA5, PA6, etc.)
#ifdef ARDUINO
#include <Arduino.h>
#endif

// =====================================================
// LED 0: SOS beacon
// =====================================================

#ifndef BLINKQ_LED0_PIN
#ifdef PA5
#define BLINKQ_LED0_PIN PA5   // Arduino: PA5 (D13)
#else
#define BLINKQ_LED0_PIN 5     // Generic: GPIO 5
#endif
#endif

// 1 = LED lights when the pin is driven low
#ifndef BLINKQ_LED0_ACTIVE_LOW
#define BLINKQ_LED0_ACTIVE_LOW 0
#endif

// =====================================================
// LED 1: message in Morse code
// =====================================================

#ifndef BLINKQ_LED1_PIN
#ifdef PA6
#define BLINKQ_LED1_PIN PA6   // Arduino: PA6 (D12)
#else
#define BLINKQ_LED1_PIN 6     // Generic: GPIO 6
#endif
#endif

#ifndef BLINKQ_LED1_ACTIVE_LOW
#define BLINKQ_LED1_ACTIVE_LOW 1
#endif
