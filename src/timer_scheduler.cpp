/**
 * @file timer_scheduler.cpp
 * @brief Keyed one-shot millisecond scheduler implementation
 */

#include "timer_scheduler.h"

// Global instance
TimerScheduler scheduler;

TimerScheduler::TimerScheduler() {
    for (uint8_t i = 0; i < MAX_TIMERS; i++) {
        _timers[i].active = false;
        _timers[i].key = 0;
        _timers[i].callback = nullptr;
        _timers[i].context = nullptr;
        _timers[i].fireTimeMs = 0;
    }
}

uint8_t TimerScheduler::schedule(uint32_t key, uint32_t delayMs, SchedulerCallback callback, void* context) {
    return scheduleAt(key, millis(), delayMs, callback, context);
}

uint8_t TimerScheduler::scheduleAt(uint32_t key, uint32_t nowMs, uint32_t delayMs,
                                   SchedulerCallback callback, void* context) {
    if (!callback) {
        return INVALID_ID;
    }

    // Re-arming a key replaces its pending timer in place
    int slot = findKey(key);

    if (slot < 0) {
        for (uint8_t i = 0; i < MAX_TIMERS; i++) {
            if (!_timers[i].active) {
                slot = i;
                break;
            }
        }
    }

    if (slot < 0) {
        Serial.printf("[TIMER] WARNING: No free slot for key %lu\n", (unsigned long)key);
        return INVALID_ID;
    }

    _timers[slot].key = key;
    _timers[slot].fireTimeMs = nowMs + delayMs;
    _timers[slot].callback = callback;
    _timers[slot].context = context;
    _timers[slot].active = true;
    return static_cast<uint8_t>(slot);
}

void TimerScheduler::cancel(uint8_t id) {
    if (id < MAX_TIMERS) {
        _timers[id].active = false;
        _timers[id].callback = nullptr;
        _timers[id].context = nullptr;
    }
}

bool TimerScheduler::cancelKey(uint32_t key) {
    int slot = findKey(key);
    if (slot < 0) {
        return false;
    }
    cancel(static_cast<uint8_t>(slot));
    return true;
}

void TimerScheduler::cancelAll() {
    for (uint8_t i = 0; i < MAX_TIMERS; i++) {
        _timers[i].active = false;
        _timers[i].callback = nullptr;
        _timers[i].context = nullptr;
    }
}

void TimerScheduler::update() {
    update(millis());
}

void TimerScheduler::update(uint32_t nowMs) {
    for (uint8_t i = 0; i < MAX_TIMERS; i++) {
        // Signed difference keeps the comparison valid across millis() wrap
        if (_timers[i].active && static_cast<int32_t>(nowMs - _timers[i].fireTimeMs) >= 0) {
            // Mark inactive before callback (allows re-scheduling)
            _timers[i].active = false;

            // Store callback info (callback might modify timer)
            SchedulerCallback cb = _timers[i].callback;
            void* ctx = _timers[i].context;
            uint32_t key = _timers[i].key;

            // Clear slot
            _timers[i].callback = nullptr;
            _timers[i].context = nullptr;

            if (cb) {
                cb(key, ctx);
            }
        }
    }
}

uint8_t TimerScheduler::getPendingCount() const {
    uint8_t count = 0;
    for (uint8_t i = 0; i < MAX_TIMERS; i++) {
        if (_timers[i].active) {
            count++;
        }
    }
    return count;
}

bool TimerScheduler::isActive(uint8_t id) const {
    if (id >= MAX_TIMERS) {
        return false;
    }
    return _timers[id].active;
}

bool TimerScheduler::isKeyActive(uint32_t key) const {
    return findKey(key) >= 0;
}

int TimerScheduler::findKey(uint32_t key) const {
    for (uint8_t i = 0; i < MAX_TIMERS; i++) {
        if (_timers[i].active && _timers[i].key == key) {
            return i;
        }
    }
    return -1;
}
