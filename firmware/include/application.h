#pragma once
// =====================================================
// Application Class
// =====================================================
// Demo firmware: LED 0 repeats SOS, LED 1 repeats a
// text message in Morse code. Both queues step together
// every BLINKQ_STEP_INTERVAL_MS; once both drain, the
// pins rest inactive for BLINKQ_ROUND_PAUSE_MS and the
// next round is queued.
//
// Usage:
//   Application app;
//   app.init();
//   while (true) { app.loop(); }
// =====================================================

#include <stdint.h>
#include "board_config.h"
#include "fw_config.h"
#include "blink_queue.h"
#include "output_pin.h"

class Application {
public:
    typedef BlinkQueue<GpioOutputPin, BLINKQ_LED0_QUEUE_CAPACITY> BeaconQueue;
    typedef BlinkQueue<GpioOutputPin, BLINKQ_LED1_QUEUE_CAPACITY> MessageQueue;

    // message: text for LED 1; must outlive the Application
    explicit Application(const char* message = BLINKQ_MESSAGE);

    // Initialize all components (call once at startup)
    void init();

    // Main loop iteration (call repeatedly)
    void loop();

    // Both queues drained and no message text left to queue
    bool isIdle() const;

    // =====================================================
    // Component Access (for testing/debugging)
    // =====================================================

    BeaconQueue& getBeaconQueue() { return _beacon; }
    MessageQueue& getMessageQueue() { return _message; }
    uint32_t getRoundCount() const { return _roundCount; }
    bool isResting() const { return _resting; }

private:
    void startRound();
    void feedMessage();
    void stepQueues(uint32_t nowMs);

    // =====================================================
    // Components
    // =====================================================

    BeaconQueue _beacon;
    MessageQueue _message;

    // =====================================================
    // State
    // =====================================================

    const char* _messageText;
    const char* _pendingText;   // Rest of the message not yet queued
    uint32_t _lastStepMs;
    uint32_t _restStartMs;
    uint32_t _roundCount;
    bool _resting;
};
