/**
 * @file timing_control.cpp
 * @brief Start-timer exchange - Implementation
 * @version 1.0.0
 */

#include "timing_control.h"

// =============================================================================
// CONSTRUCTOR
// =============================================================================

TimingControl::TimingControl() :
    _transport(nullptr),
    _observers(nullptr),
    _linkReady(false),
    _state(TimingState::IDLE),
    _hasResult(false),
    _callbackCount(0),
    _resultCallback(nullptr),
    _resultContext(nullptr),
    _verbose(XFER_VERBOSE_DEFAULT)
{
    for (int i = 0; i < MAX_TIMING_CALLBACKS; i++) {
        _callbacks[i] = nullptr;
    }
}

void TimingControl::begin(BleTransport* transport, ObserverList* observers) {
    _transport = transport;
    _observers = observers;
    _state.store(TimingState::IDLE, std::memory_order_release);
    _hasResult = false;
    _lastResult = UtcTimestamp();
}

// =============================================================================
// COMMANDS
// =============================================================================

bool TimingControl::sendCommand(size_t (*build)(uint8_t*, size_t), const char* label) {
    if (!_linkReady || !_transport) {
        Serial.printf("[TIMING] %s rejected - not connected\n", label);
        return false;
    }

    uint8_t frame[1];
    size_t frameLength = build(frame, sizeof(frame));
    if (!_transport->write(frame, frameLength, Channel::TIMING_CONTROL, true)) {
        Serial.printf("[TIMING] ERROR: %s write failed\n", label);
        return false;
    }
    return true;
}

bool TimingControl::sendStart() {
    if (!sendCommand(buildStartTiming, "Start")) {
        return false;
    }
    applyTransition(TimingState::COUNTING, TimingTrigger::START_SENT);
    return true;
}

bool TimingControl::sendCancel() {
    if (!sendCommand(buildCancelTiming, "Cancel")) {
        return false;
    }
    applyTransition(TimingState::IDLE, TimingTrigger::CANCEL_SENT);
    return true;
}

// =============================================================================
// RESULT
// =============================================================================

bool TimingControl::onResultNotification(const uint8_t* data, size_t length) {
    UtcTimestamp result;
    if (!decodeTimingResult(data, length, result)) {
        if (_verbose) {
            Serial.printf("[TIMING] Discarded malformed result (%u bytes)\n", (unsigned)length);
        }
        return false;
    }

    if (getState() != TimingState::COUNTING) {
        if (_verbose) {
            Serial.println(F("[TIMING] Discarded result while idle"));
        }
        return false;
    }

    _lastResult = result;
    _hasResult = true;

    char stamp[32];
    result.format(stamp, sizeof(stamp));
    Serial.printf("[TIMING] Start result %s\n", stamp);

    applyTransition(TimingState::IDLE, TimingTrigger::RESULT_ACCEPTED);

    if (_resultCallback) {
        _resultCallback(result, _resultContext);
    }
    return true;
}

void TimingControl::reset() {
    applyTransition(TimingState::IDLE, TimingTrigger::RESET);
}

// =============================================================================
// TRANSITIONS
// =============================================================================

void TimingControl::applyTransition(TimingState newState, TimingTrigger trigger) {
    TimingState previous = _state.exchange(newState, std::memory_order_acq_rel);

    Serial.printf("[TIMING] %s -> %s [%s]\n",
        timingStateToString(previous),
        timingStateToString(newState),
        timingTriggerToString(trigger));

    TimingTransition transition(previous, newState, trigger);
    for (int i = 0; i < _callbackCount; i++) {
        if (_callbacks[i]) {
            _callbacks[i](transition);
        }
    }

    if (_observers) {
        _observers->notify(ObservedChange::TIMING_STATE);
    }
}

// =============================================================================
// CALLBACKS
// =============================================================================

bool TimingControl::onStateChange(TimingChangeCallback callback) {
    // Check if already registered
    for (int i = 0; i < _callbackCount; i++) {
        if (_callbacks[i] == callback) {
            return true;
        }
    }

    if (_callbackCount >= MAX_TIMING_CALLBACKS) {
        Serial.println(F("[TIMING] WARNING: Max callbacks reached"));
        return false;
    }

    _callbacks[_callbackCount++] = callback;
    return true;
}

void TimingControl::clearCallbacks() {
    for (int i = 0; i < MAX_TIMING_CALLBACKS; i++) {
        _callbacks[i] = nullptr;
    }
    _callbackCount = 0;
}

void TimingControl::setResultCallback(TimingResultCallback callback, void* context) {
    _resultCallback = callback;
    _resultContext = context;
}
