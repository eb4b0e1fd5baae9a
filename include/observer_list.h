/**
 * @file observer_list.h
 * @brief Fan-out of state-change notifications to registered observers
 * @version 1.0.0
 *
 * Decouples the protocol layer from whatever consumes its state
 * (serial console, display, host bridge). Observers receive only the
 * kind of change and read the new state through the owner's getters.
 */

#ifndef OBSERVER_LIST_H
#define OBSERVER_LIST_H

#include <Arduino.h>
#include "config.h"
#include "types.h"

/**
 * @brief Callback function type for state change notifications
 */
typedef void (*StateObserver)(ObservedChange change);

/**
 * @brief Fixed-capacity list of state observers
 *
 * Usage:
 *   ObserverList observers;
 *   observers.add([](ObservedChange c) {
 *       Serial.printf("Changed: %s\n", observedChangeToString(c));
 *   });
 *   observers.notify(ObservedChange::LISTING);
 */
class ObserverList {
public:
    ObserverList();

    /**
     * @brief Register an observer
     * @return true if registered (or already registered), false if full
     */
    bool add(StateObserver observer);

    /**
     * @brief Unregister an observer
     * @return true if it was registered
     */
    bool remove(StateObserver observer);

    /**
     * @brief Remove all observers
     */
    void clear();

    /**
     * @brief Call every observer with the change
     */
    void notify(ObservedChange change) const;

    uint8_t getCount() const { return _count; }

private:
    StateObserver _observers[MAX_OBSERVERS];
    uint8_t _count;
};

#endif // OBSERVER_LIST_H
