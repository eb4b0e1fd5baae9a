/**
 * @file event_queue.h
 * @brief Transport event queue (BLE callback / main loop -> main loop)
 * @version 1.0.0
 *
 * Bluefruit invokes scan, connect, disconnect and notify callbacks from
 * the SoftDevice event task. None of them may touch registry or protocol
 * state directly. Callbacks stage a TransportEvent here; the main loop
 * drains the queue and hands each event to the executor (the connection
 * controller), so every state mutation happens in loop context.
 *
 * Synchronous discovery and read results are staged from the main loop
 * as well, so the queue has two producers.
 *
 * Design:
 * - Ring buffer, producers: BLE task and main loop, consumer: main loop
 * - Producers reserve, fill and publish a slot with interrupts masked
 * - Acquire/release ordering on head/tail publishes slot contents
 * - Full queue drops the event and counts it
 */

#ifndef EVENT_QUEUE_H
#define EVENT_QUEUE_H

#include <Arduino.h>
#include <atomic>
#include "config.h"
#include "types.h"

/**
 * @brief Asynchronous transport events
 */
enum class TransportEventType : uint8_t {
    NONE = 0,
    POWERED_ON,                 // Radio ready; scanning may start
    DEVICE_DISCOVERED,          // identifier, name, rssi, data = manufacturer data
    CONNECTED,                  // identifier
    DISCONNECTED,               // identifier, status = HCI reason
    SERVICES_DISCOVERED,        // data = discovered service indices, status = error
    CHARACTERISTICS_DISCOVERED, // serviceIndex, data = N x 16-byte UUIDs, status = error
    VALUE_UPDATED               // channel, data = value, status = error
};

const char* transportEventTypeToString(TransportEventType type);

/**
 * @brief One staged transport event
 */
struct TransportEvent {
    TransportEventType type;
    char identifier[DEVICE_ID_LEN];
    char name[DEVICE_NAME_LEN];
    int8_t rssi;
    Channel channel;
    uint8_t serviceIndex;
    uint8_t status;             // 0 = success, otherwise error / HCI reason
    uint16_t length;
    uint8_t data[EVENT_MAX_PAYLOAD];

    TransportEvent() { clear(); }

    void clear();

    /**
     * @brief Copy the device identifier (truncated to DEVICE_ID_LEN - 1)
     */
    void setIdentifier(const char* id);

    /**
     * @brief Copy the advertised name (truncated to DEVICE_NAME_LEN - 1)
     */
    void setName(const char* deviceName);

    /**
     * @brief Copy payload bytes
     * @return false if truncated to EVENT_MAX_PAYLOAD
     */
    bool setData(const uint8_t* bytes, size_t len);

    bool hasError() const { return status != 0; }
};

/**
 * @class EventQueue
 * @brief Queue for deferring transport events to the main loop
 *
 * Usage:
 *   // In BLE callback:
 *   TransportEvent event;
 *   event.type = TransportEventType::CONNECTED;
 *   event.setIdentifier(id);
 *   eventQueue.enqueue(event);
 *
 *   // In main loop:
 *   eventQueue.processAll();
 */
class EventQueue {
public:
    static constexpr uint8_t MAX_EVENTS = EVENT_QUEUE_DEPTH;

    /**
     * @brief Executor invoked for each dequeued event
     */
    typedef void (*EventExecutor)(const TransportEvent& event, void* context);

    EventQueue();

    /**
     * @brief Stage an event (producer side, BLE task and main loop safe)
     * @return true if enqueued, false if the queue is full
     */
    bool enqueue(const TransportEvent& event);

    /**
     * @brief Dispatch one queued event (consumer side, main loop only)
     * @return true if an event was processed
     */
    bool processOne();

    /**
     * @brief Dispatch every queued event
     * @return Number of events processed
     */
    uint8_t processAll();

    bool hasPending() const;
    uint8_t getPendingCount() const;

    /**
     * @brief Drop all pending events
     */
    void clear();

    void setExecutor(EventExecutor executor, void* context);

    /**
     * @brief Events lost because the queue was full
     */
    uint32_t getDroppedCount() const { return _dropped.load(std::memory_order_relaxed); }

private:
    TransportEvent _queue[MAX_EVENTS];
    std::atomic<uint8_t> _head;  // Write index (producer)
    std::atomic<uint8_t> _tail;  // Read index (consumer)
    std::atomic<uint32_t> _dropped;

    EventExecutor _executor;
    void* _executorContext;
};

// Global instance
extern EventQueue eventQueue;

#endif // EVENT_QUEUE_H
