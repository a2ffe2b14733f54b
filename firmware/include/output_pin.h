#pragma once
#include <stdint.h>

#include "platform_gpio.h"

// =====================================================
// GPIO Output Pin
// =====================================================
// Adapts a platform GPIO to the pin interface expected
// by BlinkQueue (begin / setHigh / setLow). Holds only
// the pin number, so it is cheap to copy or move.
// =====================================================

class GpioOutputPin {
public:
    // mode: PLATFORM_GPIO_MODE_OUTPUT or PLATFORM_GPIO_MODE_OUTPUT_OD
    explicit GpioOutputPin(uint32_t pin,
                           platform_gpio_mode_t mode = PLATFORM_GPIO_MODE_OUTPUT);

    // Configure the pin as an output
    void begin();

    void setHigh();
    void setLow();

    uint32_t number() const { return _pin; }

private:
    uint32_t _pin;
    platform_gpio_mode_t _mode;
};
