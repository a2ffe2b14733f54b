#include "morse_patterns.h"

namespace MorsePatterns {

static const Pattern LETTERS[] = {
    A, B, C, D, E, F, G, H, I, J, K, L, M,
    N, O, P, Q, R, S, T, U, V, W, X, Y, Z
};

static const Pattern DIGITS[] = {
    ZERO, ONE, TWO, THREE, FOUR, FIVE, SIX, SEVEN, EIGHT, NINE
};

bool patternFor(char c, Pattern& out) {
    if (c >= 'a' && c <= 'z') {
        c = static_cast<char>(c - 'a' + 'A');
    }

    if (c >= 'A' && c <= 'Z') {
        out = LETTERS[c - 'A'];
        return true;
    }

    if (c >= '0' && c <= '9') {
        out = DIGITS[c - '0'];
        return true;
    }

    switch (c) {
        case ' ':  out = WORD_GAP;         return true;
        case '.':  out = FULL_STOP;        return true;
        case ',':  out = COMMA;            return true;
        case ':':  out = COLON;            return true;
        case '?':  out = QUESTION_MARK;    return true;
        case '\'': out = APOSTROPHE;       return true;
        case '-':  out = HYPHEN;           return true;
        case '/':  out = FRACTION_BAR;     return true;
        case '(':  out = OPEN_BRACKET;     return true;
        case ')':  out = CLOSE_BRACKET;    return true;
        case '"':  out = QUOTATION_MARK;   return true;
        case '@':  out = AT_SIGN;          return true;
        case '=':  out = EQUALS_SIGN;      return true;
        case '+':  out = PLUS_SIGN;        return true;
        case '!':  out = EXCLAMATION_MARK; return true;
        default:
            return false;
    }
}

} // namespace MorsePatterns
