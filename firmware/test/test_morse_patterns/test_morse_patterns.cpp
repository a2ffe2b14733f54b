// =====================================================
// Pattern Library Unit Tests
// =====================================================
// Morse encodings, character lookup, enqueueMorse()
// and the common blink constants.
//
// Run with: ctest (host build) or pio test -e native
// =====================================================

#include <unity.h>
#include <string.h>
#include "morse_patterns.h"
#include "../mock_output_pin.h"

void setUp() {
}

void tearDown() {
}

// =====================================================
// Helpers
// =====================================================

// Build the expected step string for dots/dashes (".-" -> "101110")
static void expandMorse(const char* code, char* out, size_t outSize) {
    size_t used = 0;
    for (; *code; code++) {
        const char* element = (*code == '-') ? "1110" : "10";
        size_t len = strlen(element);
        TEST_ASSERT_TRUE(used + len < outSize);
        memcpy(out + used, element, len);
        used += len;
    }
    out[used] = '\0';
}

static void assertMorse(const char* code, const Pattern& pattern) {
    char expected[40];
    char actual[40];
    expandMorse(code, expected, sizeof(expected));
    pattern.format(actual, sizeof(actual));
    TEST_ASSERT_EQUAL_STRING_MESSAGE(expected, actual, code);
}

// =====================================================
// Encodings
// =====================================================

void test_element_encoding() {
    TEST_ASSERT_TRUE(MorsePatterns::DOT == Pattern(0b10, 2));
    TEST_ASSERT_TRUE(MorsePatterns::DASH == Pattern(0b1110, 4));
}

void test_letter_encodings() {
    static const char* const CODES[] = {
        ".-", "-...", "-.-.", "-..", ".", "..-.", "--.", "....", "..", ".---",
        "-.-", ".-..", "--", "-.", "---", ".--.", "--.-", ".-.", "...", "-",
        "..-", "...-", ".--", "-..-", "-.--", "--.."
    };

    for (char c = 'A'; c <= 'Z'; c++) {
        Pattern pattern;
        TEST_ASSERT_TRUE(MorsePatterns::patternFor(c, pattern));
        assertMorse(CODES[c - 'A'], pattern);
    }
}

void test_digit_encodings() {
    static const char* const CODES[] = {
        "-----", ".----", "..---", "...--", "....-",
        ".....", "-....", "--...", "---..", "----."
    };

    for (char c = '0'; c <= '9'; c++) {
        Pattern pattern;
        TEST_ASSERT_TRUE(MorsePatterns::patternFor(c, pattern));
        assertMorse(CODES[c - '0'], pattern);
    }
}

void test_punctuation_encodings() {
    assertMorse(".-.-.-", MorsePatterns::FULL_STOP);
    assertMorse("--..--", MorsePatterns::COMMA);
    assertMorse("---...", MorsePatterns::COLON);
    assertMorse("..--..", MorsePatterns::QUESTION_MARK);
    assertMorse(".----.", MorsePatterns::APOSTROPHE);
    assertMorse("-....-", MorsePatterns::HYPHEN);
    assertMorse("-..-.", MorsePatterns::FRACTION_BAR);
    assertMorse("-.--.", MorsePatterns::OPEN_BRACKET);
    assertMorse("-.--.-", MorsePatterns::CLOSE_BRACKET);
    assertMorse(".-..-.", MorsePatterns::QUOTATION_MARK);
    assertMorse(".--.-.", MorsePatterns::AT_SIGN);
    assertMorse("-...-", MorsePatterns::EQUALS_SIGN);
    assertMorse(".-.-.", MorsePatterns::PLUS_SIGN);
    assertMorse("-.-.--", MorsePatterns::EXCLAMATION_MARK);
    assertMorse("........", MorsePatterns::ERROR);
}

void test_sos() {
    assertMorse("...---...", MorsePatterns::SOS);
    TEST_ASSERT_EQUAL(24, MorsePatterns::SOS.length());
}

void test_hello_lengths() {
    TEST_ASSERT_EQUAL(8, MorsePatterns::H.length());
    TEST_ASSERT_EQUAL(2, MorsePatterns::E.length());
    TEST_ASSERT_EQUAL(10, MorsePatterns::L.length());
    TEST_ASSERT_EQUAL(12, MorsePatterns::O.length());
    TEST_ASSERT_EQUAL(18, MorsePatterns::FULL_STOP.length());
}

// =====================================================
// Lookup
// =====================================================

void test_lookup_is_case_insensitive() {
    Pattern upper;
    Pattern lower;

    TEST_ASSERT_TRUE(MorsePatterns::patternFor('Q', upper));
    TEST_ASSERT_TRUE(MorsePatterns::patternFor('q', lower));
    TEST_ASSERT_TRUE(upper == lower);
}

void test_lookup_space_is_word_gap() {
    Pattern pattern;

    TEST_ASSERT_TRUE(MorsePatterns::patternFor(' ', pattern));
    TEST_ASSERT_TRUE(pattern == MorsePatterns::WORD_GAP);
    TEST_ASSERT_EQUAL(4, pattern.length());
    TEST_ASSERT_EQUAL_HEX32(0, pattern.bits());
}

void test_lookup_unknown_character() {
    Pattern pattern(0b1, 1);

    TEST_ASSERT_FALSE(MorsePatterns::patternFor('#', pattern));
    TEST_ASSERT_FALSE(MorsePatterns::patternFor('\n', pattern));
    TEST_ASSERT_TRUE(pattern == Pattern(0b1, 1));
}

// =====================================================
// enqueueMorse
// =====================================================

void test_enqueue_morse_whole_message() {
    BlinkQueue<MockOutputPin, 8> queue(MockOutputPin(), false);

    TEST_ASSERT_EQUAL(6, enqueueMorse(queue, "HELLO."));
    TEST_ASSERT_EQUAL(6, queue.size());

    int steps = 0;
    while (!queue.isIdle()) {
        queue.step();
        steps++;
    }
    TEST_ASSERT_EQUAL(60, steps);
}

void test_enqueue_morse_skips_unknown_characters() {
    BlinkQueue<MockOutputPin, 8> queue(MockOutputPin(), false);

    TEST_ASSERT_EQUAL(4, enqueueMorse(queue, "E#~T"));
    TEST_ASSERT_EQUAL(2, queue.size());
}

void test_enqueue_morse_stops_when_full() {
    BlinkQueue<MockOutputPin, 2> queue(MockOutputPin(), false);
    const char* text = "SOS";

    size_t consumed = enqueueMorse(queue, text);
    TEST_ASSERT_EQUAL(2, consumed);
    TEST_ASSERT_TRUE(queue.isFull());

    // Drain the first S (6 steps) and resume
    for (int i = 0; i < 6; i++) {
        queue.step();
    }
    TEST_ASSERT_EQUAL(1, enqueueMorse(queue, text + consumed));
    TEST_ASSERT_EQUAL(2, queue.size());
}

void test_enqueue_morse_null_and_empty() {
    BlinkQueue<MockOutputPin, 2> queue(MockOutputPin(), false);

    TEST_ASSERT_EQUAL(0, enqueueMorse(queue, nullptr));
    TEST_ASSERT_EQUAL(0, enqueueMorse(queue, ""));
    TEST_ASSERT_TRUE(queue.isIdle());
}

// =====================================================
// Blink constants
// =====================================================

void test_blink_constants() {
    TEST_ASSERT_TRUE(BlinkPatterns::SHORT_OFF_ON == Pattern(0b01, 2));
    TEST_ASSERT_TRUE(BlinkPatterns::MEDIUM_OFF_ON == Pattern(0b0011, 4));
    TEST_ASSERT_TRUE(BlinkPatterns::LONG_OFF_ON == Pattern(0b00001111, 8));
    TEST_ASSERT_EQUAL(4, BlinkPatterns::QUARTER_DUTY.length());
    TEST_ASSERT_TRUE(BlinkPatterns::QUARTER_DUTY.bitAt(0));
    TEST_ASSERT_FALSE(BlinkPatterns::QUARTER_DUTY.bitAt(1));
}

// =====================================================
// Test Runner
// =====================================================

int main(int argc, char **argv) {
    UNITY_BEGIN();

    RUN_TEST(test_element_encoding);
    RUN_TEST(test_letter_encodings);
    RUN_TEST(test_digit_encodings);
    RUN_TEST(test_punctuation_encodings);
    RUN_TEST(test_sos);
    RUN_TEST(test_hello_lengths);
    RUN_TEST(test_lookup_is_case_insensitive);
    RUN_TEST(test_lookup_space_is_word_gap);
    RUN_TEST(test_lookup_unknown_character);
    RUN_TEST(test_enqueue_morse_whole_message);
    RUN_TEST(test_enqueue_morse_skips_unknown_characters);
    RUN_TEST(test_enqueue_morse_stops_when_full);
    RUN_TEST(test_enqueue_morse_null_and_empty);
    RUN_TEST(test_blink_constants);

    return UNITY_END();
}
