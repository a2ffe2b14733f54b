#include "application.h"
#include "morse_patterns.h"
#include "platform_serial.h"
#include "platform_timing.h"
#include "blinkq_log.h"

#include <string.h>

Application::Application(const char* message)
    : _beacon(GpioOutputPin(BLINKQ_LED0_PIN), BLINKQ_LED0_ACTIVE_LOW != 0)
    , _message(GpioOutputPin(BLINKQ_LED1_PIN), BLINKQ_LED1_ACTIVE_LOW != 0)
    , _messageText(message ? message : "")
    , _pendingText(nullptr)
    , _lastStepMs(0)
    , _restStartMs(0)
    , _roundCount(0)
    , _resting(false)
{
}

void Application::init() {
    // Initialize platform abstractions
    platform_timing_init();
    platform_serial_begin(BLINKQ_SERIAL_BAUD);

    BLINKQ_LOG_INFO(LogTag::APP, "blinkq " BLINKQ_VERSION_STRING " (" BLINKQ_BUILD_HASH ", "
                    BLINKQ_BUILD_DATE " " BLINKQ_BUILD_TIME ")");

    // Pins rest inactive until the first round
    _beacon.begin();
    _message.begin();
    BLINKQ_LOG_INFO(LogTag::BOARD, "LED0 pin %lu%s, LED1 pin %lu%s, step %u ms",
                    static_cast<unsigned long>(_beacon.pin().number()),
                    _beacon.isActiveLow() ? " (active-low)" : "",
                    static_cast<unsigned long>(_message.pin().number()),
                    _message.isActiveLow() ? " (active-low)" : "",
                    static_cast<unsigned>(BLINKQ_STEP_INTERVAL_MS));
    platform_serial_flush();

    // First round starts on the first loop()
    _resting = true;
    _restStartMs = platform_millis() - BLINKQ_ROUND_PAUSE_MS;
}

void Application::loop() {
    uint32_t nowMs = platform_millis();

    feedMessage();

    if (_resting) {
        if (nowMs - _restStartMs < BLINKQ_ROUND_PAUSE_MS) {
            return;
        }
        _resting = false;
        startRound();
        stepQueues(nowMs);
        return;
    }

    if (nowMs - _lastStepMs < BLINKQ_STEP_INTERVAL_MS) {
        return;
    }

    if (isIdle()) {
        // Last step of the round has had its full interval;
        // drive both pins inactive and rest.
        stepQueues(nowMs);
        _resting = true;
        _restStartMs = nowMs;
        BLINKQ_LOG_DEBUG(LogTag::APP, "round %lu done, resting %u ms",
                         static_cast<unsigned long>(_roundCount),
                         static_cast<unsigned>(BLINKQ_ROUND_PAUSE_MS));
        return;
    }

    stepQueues(nowMs);
}

bool Application::isIdle() const {
    bool textLeft = _pendingText && *_pendingText;
    return _beacon.isIdle() && _message.isIdle() && !textLeft;
}

void Application::startRound() {
    _roundCount++;

    char steps[Pattern::MAX_BITS + 1];
    MorsePatterns::SOS.format(steps, sizeof(steps));
    if (_beacon.enqueue(MorsePatterns::SOS) == EnqueueResult::QueueFull) {
        BLINKQ_LOG_WARN(LogTag::QUEUE, "LED0 queue full, SOS dropped");
    } else {
        BLINKQ_LOG_DEBUG(LogTag::QUEUE, "LED0 <- %s", steps);
    }

    _pendingText = _messageText;
    feedMessage();
    if (*_pendingText != '\0') {
        BLINKQ_LOG_DEBUG(LogTag::QUEUE, "LED1 queue full, %u chars wait for room",
                         static_cast<unsigned>(strlen(_pendingText)));
    }

    BLINKQ_LOG_INFO(LogTag::APP, "round %lu: SOS + \"%s\"",
                    static_cast<unsigned long>(_roundCount), _messageText);
}

void Application::feedMessage() {
    if (!_pendingText || *_pendingText == '\0') {
        return;
    }

    _pendingText += enqueueMorse(_message, _pendingText);
}

void Application::stepQueues(uint32_t nowMs) {
    _lastStepMs = nowMs;
    _beacon.step();
    _message.step();
}
