#include "output_pin.h"

GpioOutputPin::GpioOutputPin(uint32_t pin, platform_gpio_mode_t mode)
    : _pin(pin)
    , _mode(mode) {
}

void GpioOutputPin::begin() {
    platform_gpio_pin_mode(_pin, _mode);
}

void GpioOutputPin::setHigh() {
    platform_gpio_write(_pin, PLATFORM_GPIO_HIGH);
}

void GpioOutputPin::setLow() {
    platform_gpio_write(_pin, PLATFORM_GPIO_LOW);
}
