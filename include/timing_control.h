/**
 * @file timing_control.h
 * @brief Start-timer exchange over START_CONTROL / START_RESULT
 * @version 1.0.0
 *
 * States: IDLE -> COUNTING on a start command, back to IDLE on a cancel
 * command or on an accepted result. A result arriving while IDLE is a
 * stale or duplicate frame and is discarded.
 */

#ifndef TIMING_CONTROL_H
#define TIMING_CONTROL_H

#include <Arduino.h>
#include <atomic>
#include "ble_transport.h"
#include "config.h"
#include "observer_list.h"
#include "wire_codec.h"

// =============================================================================
// CONSTANTS
// =============================================================================

#define MAX_TIMING_CALLBACKS 4

// =============================================================================
// STATE TRANSITION
// =============================================================================

/**
 * @brief Represents a timing state transition
 */
struct TimingTransition {
    TimingState fromState;
    TimingState toState;
    TimingTrigger trigger;

    TimingTransition() :
        fromState(TimingState::IDLE),
        toState(TimingState::IDLE),
        trigger(TimingTrigger::RESET) {}

    TimingTransition(TimingState from, TimingState to, TimingTrigger trig) :
        fromState(from),
        toState(to),
        trigger(trig) {}
};

// =============================================================================
// CALLBACK TYPES
// =============================================================================

typedef void (*TimingChangeCallback)(const TimingTransition& transition);

/**
 * @brief Called with each accepted start result
 */
typedef void (*TimingResultCallback)(const UtcTimestamp& result, void* context);

// =============================================================================
// TIMING CONTROL
// =============================================================================

/**
 * @brief Two-command start/cancel exchange plus the result decode
 *
 * Usage:
 *   timing.begin(&transport, &observers);
 *   timing.setLinkReady(true);
 *   timing.sendStart();                       // IDLE -> COUNTING
 *
 *   // For each START_RESULT notification:
 *   timing.onResultNotification(data, length); // COUNTING -> IDLE
 */
class TimingControl {
public:
    TimingControl();

    void begin(BleTransport* transport, ObserverList* observers);

    /**
     * @brief START_CONTROL bound (commands allowed)
     */
    void setLinkReady(bool ready) { _linkReady = ready; }

    /**
     * @brief Write 0x00 (with response) and enter COUNTING
     * @return false if the channel is unbound or the write was rejected
     */
    bool sendStart();

    /**
     * @brief Write 0x01 (with response) and enter IDLE
     * @return false if the channel is unbound or the write was rejected
     */
    bool sendCancel();

    /**
     * @brief Handle a START_RESULT value
     * @return true if the result was decoded and accepted
     */
    bool onResultNotification(const uint8_t* data, size_t length);

    /**
     * @brief Return to IDLE, keeping the last result
     */
    void reset();

    // =========================================================================
    // STATE
    // =========================================================================

    TimingState getState() const {
        return _state.load(std::memory_order_acquire);
    }

    bool isCounting() const { return getState() == TimingState::COUNTING; }

    bool hasResult() const { return _hasResult; }

    /**
     * @brief Most recent accepted result (valid when hasResult())
     */
    const UtcTimestamp& getLastResult() const { return _lastResult; }

    // =========================================================================
    // CALLBACKS
    // =========================================================================

    /**
     * @brief Register callback for state changes
     * @return false if max callbacks reached
     */
    bool onStateChange(TimingChangeCallback callback);

    void clearCallbacks();

    void setResultCallback(TimingResultCallback callback, void* context);

    /**
     * @brief Log discarded (malformed or stale) results
     */
    void setVerbose(bool verbose) { _verbose = verbose; }
    bool isVerbose() const { return _verbose; }

private:
    BleTransport* _transport;
    ObserverList* _observers;
    bool _linkReady;

    std::atomic<TimingState> _state;
    UtcTimestamp _lastResult;
    bool _hasResult;

    TimingChangeCallback _callbacks[MAX_TIMING_CALLBACKS];
    uint8_t _callbackCount;

    TimingResultCallback _resultCallback;
    void* _resultContext;

    bool _verbose;

    bool sendCommand(size_t (*build)(uint8_t*, size_t), const char* label);
    void applyTransition(TimingState newState, TimingTrigger trigger);
};

#endif // TIMING_CONTROL_H
