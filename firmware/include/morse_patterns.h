#pragma once
#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#include "pattern.h"
#include "blink_queue.h"

// =====================================================
// Pattern Library
// =====================================================
// Ready-made patterns for BlinkQueue.
//
// Morse timing (one step = one unit):
//   dot  = on 1, off 1   -> 10
//   dash = on 3, off 1   -> 1110
// A letter is its elements back to back, so each letter
// ends with a single off step. WORD_GAP adds four more.
// =====================================================

namespace MorsePatterns {

constexpr Pattern DOT  = Pattern(0b10, 2);
constexpr Pattern DASH = Pattern(0b1110, 4);

constexpr Pattern A = DOT.append(DASH);
constexpr Pattern B = DASH.append(DOT).append(DOT).append(DOT);
constexpr Pattern C = DASH.append(DOT).append(DASH).append(DOT);
constexpr Pattern D = DASH.append(DOT).append(DOT);
constexpr Pattern E = DOT;
constexpr Pattern F = DOT.append(DOT).append(DASH).append(DOT);
constexpr Pattern G = DASH.append(DASH).append(DOT);
constexpr Pattern H = DOT.append(DOT).append(DOT).append(DOT);
constexpr Pattern I = DOT.append(DOT);
constexpr Pattern J = DOT.append(DASH).append(DASH).append(DASH);
constexpr Pattern K = DASH.append(DOT).append(DASH);
constexpr Pattern L = DOT.append(DASH).append(DOT).append(DOT);
constexpr Pattern M = DASH.append(DASH);
constexpr Pattern N = DASH.append(DOT);
constexpr Pattern O = DASH.append(DASH).append(DASH);
constexpr Pattern P = DOT.append(DASH).append(DASH).append(DOT);
constexpr Pattern Q = DASH.append(DASH).append(DOT).append(DASH);
constexpr Pattern R = DOT.append(DASH).append(DOT);
constexpr Pattern S = DOT.append(DOT).append(DOT);
constexpr Pattern T = DASH;
constexpr Pattern U = DOT.append(DOT).append(DASH);
constexpr Pattern V = DOT.append(DOT).append(DOT).append(DASH);
constexpr Pattern W = DOT.append(DASH).append(DASH);
constexpr Pattern X = DASH.append(DOT).append(DOT).append(DASH);
constexpr Pattern Y = DASH.append(DOT).append(DASH).append(DASH);
constexpr Pattern Z = DASH.append(DASH).append(DOT).append(DOT);

constexpr Pattern ZERO  = DASH.append(DASH).append(DASH).append(DASH).append(DASH);
constexpr Pattern ONE   = DOT.append(DASH).append(DASH).append(DASH).append(DASH);
constexpr Pattern TWO   = DOT.append(DOT).append(DASH).append(DASH).append(DASH);
constexpr Pattern THREE = DOT.append(DOT).append(DOT).append(DASH).append(DASH);
constexpr Pattern FOUR  = DOT.append(DOT).append(DOT).append(DOT).append(DASH);
constexpr Pattern FIVE  = DOT.append(DOT).append(DOT).append(DOT).append(DOT);
constexpr Pattern SIX   = DASH.append(DOT).append(DOT).append(DOT).append(DOT);
constexpr Pattern SEVEN = DASH.append(DASH).append(DOT).append(DOT).append(DOT);
constexpr Pattern EIGHT = DASH.append(DASH).append(DASH).append(DOT).append(DOT);
constexpr Pattern NINE  = DASH.append(DASH).append(DASH).append(DASH).append(DOT);

constexpr Pattern FULL_STOP        = A.append(A).append(A);                      // .-.-.-
constexpr Pattern COMMA            = M.append(I).append(M);                      // --..--
constexpr Pattern COLON            = O.append(S);                                // ---...
constexpr Pattern QUESTION_MARK    = I.append(M).append(I);                      // ..--..
constexpr Pattern APOSTROPHE       = J.append(N);                                // .----.
constexpr Pattern HYPHEN           = DASH.append(FOUR);                          // -....-
constexpr Pattern FRACTION_BAR     = X.append(DOT);                              // -..-.
constexpr Pattern OPEN_BRACKET     = Y.append(DOT);                              // -.--.
constexpr Pattern CLOSE_BRACKET    = Y.append(DOT).append(DASH);                 // -.--.-
constexpr Pattern QUOTATION_MARK   = R.append(R);                                // .-..-.
constexpr Pattern AT_SIGN          = A.append(C);                                // .--.-.
constexpr Pattern EQUALS_SIGN      = B.append(DASH);                             // -...-
constexpr Pattern PLUS_SIGN        = A.append(R);                                // .-.-.
constexpr Pattern EXCLAMATION_MARK = C.append(M);                                // -.-.--
constexpr Pattern ERROR            = H.append(H);                                // ........

constexpr Pattern SOS = S.append(O).append(S);

constexpr Pattern WORD_GAP = Pattern(0b0000, 4);

// Look up the pattern for a character (case-insensitive).
// ' ' maps to WORD_GAP.
// Returns: false if the character has no Morse code
bool patternFor(char c, Pattern& out);

} // namespace MorsePatterns

namespace BlinkPatterns {

constexpr Pattern SHORT_ON_OFF  = Pattern(0b10, 2);
constexpr Pattern SHORT_OFF_ON  = SHORT_ON_OFF.reverse();

constexpr Pattern MEDIUM_ON_OFF = Pattern(0b1100, 4);
constexpr Pattern MEDIUM_OFF_ON = MEDIUM_ON_OFF.reverse();

constexpr Pattern LONG_ON_OFF   = Pattern(0b11110000, 8);
constexpr Pattern LONG_OFF_ON   = LONG_ON_OFF.reverse();

constexpr Pattern QUARTER_DUTY  = Pattern(0b1000, 4);

} // namespace BlinkPatterns

// Queue `text` as Morse code, one pattern per character.
// Characters without a Morse code are skipped. Stops at
// the first QueueFull.
// Returns: number of characters consumed; resume from
// text + result once the queue drains.
template <typename Pin, size_t Capacity>
size_t enqueueMorse(BlinkQueue<Pin, Capacity>& queue, const char* text) {
    if (!text) {
        return 0;
    }

    size_t consumed = 0;
    for (; text[consumed] != '\0'; consumed++) {
        Pattern pattern;
        if (!MorsePatterns::patternFor(text[consumed], pattern)) {
            continue;
        }
        if (queue.enqueue(pattern) == EnqueueResult::QueueFull) {
            break;
        }
    }
    return consumed;
}
