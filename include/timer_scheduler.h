/**
 * @file timer_scheduler.h
 * @brief Keyed one-shot millisecond callback scheduler
 * @version 1.1.0
 *
 * Main-loop driven: call update() every loop() iteration. Callbacks run
 * in loop context, so they may touch protocol and registry state directly.
 *
 * Each timer carries a caller-chosen key. Scheduling a key that already
 * has a pending timer cancels and replaces it, so at most one timer per
 * key exists at any time.
 */

#ifndef TIMER_SCHEDULER_H
#define TIMER_SCHEDULER_H

#include <Arduino.h>
#include "config.h"

/**
 * @brief Scheduler callback
 * @param key Key the timer was scheduled with
 * @param context Opaque pointer given at schedule time
 */
typedef void (*SchedulerCallback)(uint32_t key, void* context);

/**
 * @class TimerScheduler
 * @brief Fixed-slot one-shot timers keyed by caller identifier
 *
 * Usage:
 *   scheduler.schedule(deviceKey, 500, onExpired, this);
 *   scheduler.schedule(deviceKey, 500, onExpired, this);  // replaces the first
 *
 *   // In loop():
 *   scheduler.update();
 */
class TimerScheduler {
public:
    static constexpr uint8_t MAX_TIMERS = MAX_SCHEDULED_TIMERS;
    static constexpr uint8_t INVALID_ID = 0xFF;

    TimerScheduler();

    /**
     * @brief Arm a one-shot timer relative to millis()
     * @return Slot id, or INVALID_ID if no callback or no free slot
     */
    uint8_t schedule(uint32_t key, uint32_t delayMs, SchedulerCallback callback, void* context);

    /**
     * @brief Arm a one-shot timer relative to an explicit time base
     */
    uint8_t scheduleAt(uint32_t key, uint32_t nowMs, uint32_t delayMs,
                       SchedulerCallback callback, void* context);

    /**
     * @brief Cancel by slot id
     */
    void cancel(uint8_t id);

    /**
     * @brief Cancel the pending timer for a key
     * @return true if a timer was pending
     */
    bool cancelKey(uint32_t key);

    void cancelAll();

    /**
     * @brief Fire every expired timer (uses millis())
     */
    void update();

    /**
     * @brief Fire every timer expired at nowMs
     */
    void update(uint32_t nowMs);

    uint8_t getPendingCount() const;
    bool isActive(uint8_t id) const;
    bool isKeyActive(uint32_t key) const;

private:
    struct Timer {
        uint32_t key;
        uint32_t fireTimeMs;
        SchedulerCallback callback;
        void* context;
        bool active;
    };

    Timer _timers[MAX_TIMERS];

    int findKey(uint32_t key) const;
};

// Global instance
extern TimerScheduler scheduler;

#endif // TIMER_SCHEDULER_H
