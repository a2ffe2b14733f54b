#include "pattern.h"

constexpr uint8_t Pattern::MAX_BITS;

size_t Pattern::format(char* out, size_t outSize) const {
    if (!out || outSize == 0) {
        return 0;
    }

    size_t written = 0;
    for (uint8_t i = 0; i < _length && written + 1 < outSize; i++) {
        out[written++] = bitAt(i) ? '1' : '0';
    }
    out[written] = '\0';
    return written;
}
