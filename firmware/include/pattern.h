#pragma once
#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

// =====================================================
// Blink Pattern
// =====================================================
// A sequence of up to 32 on/off steps packed into a
// uint32_t, plus the number of steps actually used.
//
// Steps are read most-significant-bit first, so literals
// read left to right in playback order:
//   Pattern(0b1000, 4)  -> on, off, off, off
//
// A 1 bit means "drive the pin to its active level",
// a 0 bit means "inactive". Which physical level is
// active is decided by the BlinkQueue, not the pattern.
// =====================================================

class Pattern {
public:
    static constexpr uint8_t MAX_BITS = 32;

    // Empty pattern (zero steps)
    constexpr Pattern()
        : _bits(0)
        , _length(0) {
    }

    // Lengths above MAX_BITS are clamped; bits above
    // the length are discarded.
    constexpr Pattern(uint32_t bits, uint8_t length)
        : _bits(maskBits(bits, clampLength(length)))
        , _length(clampLength(length)) {
    }

    constexpr uint32_t bits() const { return _bits; }
    constexpr uint8_t length() const { return _length; }
    constexpr bool isEmpty() const { return _length == 0; }

    // Step value at playback position (0 = first step).
    // Positions past the end read as inactive.
    constexpr bool bitAt(uint8_t position) const {
        if (position >= _length) {
            return false;
        }
        return ((_bits >> (_length - 1 - position)) & 1u) != 0;
    }

    // Play this pattern, then `other`. Truncated to the
    // first MAX_BITS steps if the result is too long.
    constexpr Pattern append(const Pattern& other) const {
        const uint8_t total = static_cast<uint8_t>(_length + other._length);
        const uint64_t joined = (static_cast<uint64_t>(_bits) << other._length) | other._bits;
        if (total > MAX_BITS) {
            return Pattern(static_cast<uint32_t>(joined >> (total - MAX_BITS)), MAX_BITS);
        }
        return Pattern(static_cast<uint32_t>(joined), total);
    }

    // Same steps in reverse order
    constexpr Pattern reverse() const {
        uint32_t reversed = 0;
        for (uint8_t i = 0; i < _length; i++) {
            if ((_bits >> i) & 1u) {
                reversed |= (1u << (_length - 1 - i));
            }
        }
        return Pattern(reversed, _length);
    }

    constexpr bool operator==(const Pattern& other) const {
        return _length == other._length && _bits == other._bits;
    }

    constexpr bool operator!=(const Pattern& other) const {
        return !(*this == other);
    }

    // Render steps as '1'/'0' characters (for logs).
    // Always NUL-terminates when outSize > 0.
    // Returns: number of step characters written
    size_t format(char* out, size_t outSize) const;

private:
    static constexpr uint8_t clampLength(uint8_t length) {
        return length > MAX_BITS ? MAX_BITS : length;
    }

    static constexpr uint32_t maskBits(uint32_t bits, uint8_t length) {
        return length >= MAX_BITS ? bits : (bits & ((1u << length) - 1u));
    }

    uint32_t _bits;
    uint8_t _length;
};
