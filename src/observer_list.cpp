/**
 * @file observer_list.cpp
 * @brief Fan-out of state-change notifications - Implementation
 * @version 1.0.0
 */

#include "observer_list.h"

ObserverList::ObserverList() :
    _count(0)
{
    for (int i = 0; i < MAX_OBSERVERS; i++) {
        _observers[i] = nullptr;
    }
}

bool ObserverList::add(StateObserver observer) {
    if (!observer) {
        return false;
    }

    // Check if already registered
    for (int i = 0; i < _count; i++) {
        if (_observers[i] == observer) {
            return true;
        }
    }

    if (_count >= MAX_OBSERVERS) {
        Serial.println(F("[OBSERVER] WARNING: Max observers reached"));
        return false;
    }

    _observers[_count++] = observer;
    return true;
}

bool ObserverList::remove(StateObserver observer) {
    for (int i = 0; i < _count; i++) {
        if (_observers[i] == observer) {
            // Shift remaining observers down to keep registration order
            for (int j = i; j < _count - 1; j++) {
                _observers[j] = _observers[j + 1];
            }
            _observers[--_count] = nullptr;
            return true;
        }
    }
    return false;
}

void ObserverList::clear() {
    for (int i = 0; i < MAX_OBSERVERS; i++) {
        _observers[i] = nullptr;
    }
    _count = 0;
}

void ObserverList::notify(ObservedChange change) const {
    for (int i = 0; i < _count; i++) {
        if (_observers[i]) {
            _observers[i](change);
        }
    }
}
