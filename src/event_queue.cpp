/**
 * @file event_queue.cpp
 * @brief Transport event queue implementation
 */

#include "event_queue.h"
#include <string.h>

// Global instance
EventQueue eventQueue;

// =============================================================================
// TRANSPORT EVENT
// =============================================================================

const char* transportEventTypeToString(TransportEventType type) {
    switch (type) {
        case TransportEventType::POWERED_ON:                 return "POWERED_ON";
        case TransportEventType::DEVICE_DISCOVERED:          return "DEVICE_DISCOVERED";
        case TransportEventType::CONNECTED:                  return "CONNECTED";
        case TransportEventType::DISCONNECTED:               return "DISCONNECTED";
        case TransportEventType::SERVICES_DISCOVERED:        return "SERVICES_DISCOVERED";
        case TransportEventType::CHARACTERISTICS_DISCOVERED: return "CHARACTERISTICS_DISCOVERED";
        case TransportEventType::VALUE_UPDATED:              return "VALUE_UPDATED";
        default:                                             return "NONE";
    }
}

void TransportEvent::clear() {
    type = TransportEventType::NONE;
    identifier[0] = '\0';
    name[0] = '\0';
    rssi = 0;
    channel = Channel::NONE;
    serviceIndex = 0;
    status = 0;
    length = 0;
}

void TransportEvent::setIdentifier(const char* id) {
    if (!id) {
        identifier[0] = '\0';
        return;
    }
    strncpy(identifier, id, DEVICE_ID_LEN - 1);
    identifier[DEVICE_ID_LEN - 1] = '\0';
}

void TransportEvent::setName(const char* deviceName) {
    if (!deviceName) {
        name[0] = '\0';
        return;
    }
    strncpy(name, deviceName, DEVICE_NAME_LEN - 1);
    name[DEVICE_NAME_LEN - 1] = '\0';
}

bool TransportEvent::setData(const uint8_t* bytes, size_t len) {
    if (!bytes) {
        length = 0;
        return len == 0;
    }
    size_t copyLength = (len > EVENT_MAX_PAYLOAD) ? EVENT_MAX_PAYLOAD : len;
    memcpy(data, bytes, copyLength);
    length = static_cast<uint16_t>(copyLength);
    return copyLength == len;
}

// =============================================================================
// EVENT QUEUE
// =============================================================================

EventQueue::EventQueue()
    : _head(0)
    , _tail(0)
    , _dropped(0)
    , _executor(nullptr)
    , _executorContext(nullptr)
{
}

bool EventQueue::enqueue(const TransportEvent& event) {
    // Main loop and BLE task both produce; mask interrupts so neither can
    // preempt the other between reading _head and publishing it
    uint32_t primask = __get_PRIMASK();
    __disable_irq();

    uint8_t head = _head.load(std::memory_order_relaxed);
    uint8_t nextHead = static_cast<uint8_t>((head + 1) % MAX_EVENTS);

    // Acquire pairs with the consumer's release of _tail
    if (nextHead == _tail.load(std::memory_order_acquire)) {
        __set_PRIMASK(primask);
        _dropped.fetch_add(1, std::memory_order_relaxed);
        return false;  // Queue full
    }

    _queue[head] = event;

    // Release publishes the slot contents before the new head
    _head.store(nextHead, std::memory_order_release);

    __set_PRIMASK(primask);
    return true;
}

bool EventQueue::processOne() {
    uint8_t tail = _tail.load(std::memory_order_relaxed);

    if (tail == _head.load(std::memory_order_acquire)) {
        return false;  // Queue empty
    }

    // Copy out before freeing the slot
    TransportEvent event = _queue[tail];

    _tail.store(static_cast<uint8_t>((tail + 1) % MAX_EVENTS), std::memory_order_release);

    if (_executor && event.type != TransportEventType::NONE) {
        _executor(event, _executorContext);
    }

    return true;
}

uint8_t EventQueue::processAll() {
    uint8_t processed = 0;
    // At most one queue depth per call
    while (processed < MAX_EVENTS && processOne()) {
        processed++;
    }
    return processed;
}

bool EventQueue::hasPending() const {
    return _tail.load(std::memory_order_acquire) != _head.load(std::memory_order_acquire);
}

uint8_t EventQueue::getPendingCount() const {
    uint8_t head = _head.load(std::memory_order_acquire);
    uint8_t tail = _tail.load(std::memory_order_acquire);

    if (head >= tail) {
        return head - tail;
    } else {
        return static_cast<uint8_t>(MAX_EVENTS - tail + head);
    }
}

void EventQueue::clear() {
    _tail.store(_head.load(std::memory_order_acquire), std::memory_order_release);
}

void EventQueue::setExecutor(EventExecutor executor, void* context) {
    _executor = executor;
    _executorContext = context;
}
