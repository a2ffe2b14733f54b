#pragma once
#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

// =====================================================
// Bounded FIFO
// =====================================================
// Fixed-capacity ring buffer. Storage is inline, so a
// BoundedFifo never allocates and never grows: push()
// fails once Capacity items are queued.
//
// Not interrupt-safe. Callers serialize access.
// =====================================================

template <typename T, size_t Capacity>
class BoundedFifo {
    static_assert(Capacity > 0, "BoundedFifo capacity must be non-zero");

public:
    BoundedFifo()
        : _items{}
        , _head(0)
        , _count(0) {
    }

    // Append to the back
    // Returns false (and changes nothing) when full
    bool push(const T& item) {
        if (full()) {
            return false;
        }
        _items[(_head + _count) % Capacity] = item;
        _count++;
        return true;
    }

    // Drop the front item
    bool pop() {
        if (empty()) {
            return false;
        }
        _head = (_head + 1) % Capacity;
        _count--;
        return true;
    }

    // Move the front item into `out`
    bool pop(T& out) {
        if (empty()) {
            return false;
        }
        out = _items[_head];
        return pop();
    }

    // Front item. Only meaningful when !empty().
    const T& front() const { return _items[_head]; }

    size_t size() const { return _count; }
    static constexpr size_t capacity() { return Capacity; }
    bool empty() const { return _count == 0; }
    bool full() const { return _count == Capacity; }

    void clear() {
        _head = 0;
        _count = 0;
    }

private:
    T _items[Capacity];
    size_t _head;
    size_t _count;
};
