#pragma once
#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>
#include <utility>

#include "pattern.h"
#include "bounded_fifo.h"

// =====================================================
// Blink Queue
// =====================================================
// Plays queued Patterns on a single output pin, one
// step per call to step(). Has no notion of time: call
// step() from a timer tick or a paced main loop. If
// 0b101010 should blink at 1 Hz, step every 500 ms.
//
// Pin requirements (any type providing):
//   void begin();    // configure as output
//   void setHigh();
//   void setLow();
//
// The queue owns its pin. When no pattern is playing the
// pin is held at the inactive level (high for active-low
// wiring, low otherwise).
//
// No internal locking. If enqueue() runs in the main
// loop and step() in an ISR, the caller must mask the
// interrupt around enqueue().
// =====================================================

enum class EnqueueResult : uint8_t {
    Ok = 0,
    QueueFull
};

template <typename Pin, size_t Capacity>
class BlinkQueue {
public:
    BlinkQueue(Pin pin, bool activeLow)
        : _pin(std::move(pin))
        , _cursor(0)
        , _activeLow(activeLow) {
    }

    // Configure the pin and drive it inactive (call once at startup)
    void begin() {
        _pin.begin();
        drive(false);
    }

    // Append a pattern to the back of the queue.
    // Zero-length patterns are accepted and skipped on playback.
    EnqueueResult enqueue(const Pattern& pattern) {
        if (!_patterns.push(pattern)) {
            return EnqueueResult::QueueFull;
        }
        return EnqueueResult::Ok;
    }

    // Advance one step and drive the pin.
    // Returns: physical level driven (true = high)
    bool step() {
        while (!_patterns.empty() && _patterns.front().isEmpty()) {
            _patterns.pop();
            _cursor = 0;
        }

        if (_patterns.empty()) {
            _cursor = 0;
            return drive(false);
        }

        const Pattern& current = _patterns.front();
        const bool active = current.bitAt(_cursor);
        const uint8_t length = current.length();

        _cursor++;
        if (_cursor >= length) {
            // Last step stays on the pin until the next call
            _patterns.pop();
            _cursor = 0;
        }

        return drive(active);
    }

    bool isIdle() const { return _patterns.empty(); }
    bool isFull() const { return _patterns.full(); }
    size_t size() const { return _patterns.size(); }
    static constexpr size_t capacity() { return Capacity; }

    // Position within the front pattern (0 when idle)
    uint8_t cursor() const { return _cursor; }
    bool isActiveLow() const { return _activeLow; }

    Pin& pin() { return _pin; }
    const Pin& pin() const { return _pin; }

private:
    bool drive(bool active) {
        const bool high = active != _activeLow;
        if (high) {
            _pin.setHigh();
        } else {
            _pin.setLow();
        }
        return high;
    }

    Pin _pin;
    BoundedFifo<Pattern, Capacity> _patterns;
    uint8_t _cursor;
    bool _activeLow;
};
