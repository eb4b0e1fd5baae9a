/**
 * @file ble_transport.h
 * @brief Narrow BLE central transport interface consumed by the protocol layer
 * @version 1.0.0
 *
 * Requests flow down through this interface; results come back as
 * TransportEvents staged on the EventQueue. No method blocks waiting for
 * a remote response. A false return means the request was rejected
 * locally (not connected, channel not discovered, stack busy).
 *
 * Implementations:
 * - BluefruitTransport (bluefruit_transport.h) on nRF52 hardware
 * - FakeTransport (test/support) for unit tests
 */

#ifndef BLE_TRANSPORT_H
#define BLE_TRANSPORT_H

#include <Arduino.h>
#include "types.h"

class BleTransport {
public:
    virtual ~BleTransport() = default;

    /**
     * @brief Start scanning for advertisements
     * @param serviceFilter Service UUID string to filter on, or nullptr for all
     * @param allowDuplicates Report every advertisement, not just the first
     */
    virtual bool scan(const char* serviceFilter, bool allowDuplicates) = 0;

    virtual bool connect(const char* identifier) = 0;
    virtual bool cancelConnection(const char* identifier) = 0;

    /**
     * @brief Discover services; completes with SERVICES_DISCOVERED
     */
    virtual bool discoverServices(const char* identifier) = 0;

    /**
     * @brief Discover characteristics of one service; completes with
     *        CHARACTERISTICS_DISCOVERED
     */
    virtual bool discoverCharacteristics(uint8_t serviceIndex) = 0;

    /**
     * @brief Write a value
     * @param requireAck true for write-with-response, false for write command
     */
    virtual bool write(const uint8_t* data, size_t length, Channel channel, bool requireAck) = 0;

    virtual bool setNotify(bool enabled, Channel channel) = 0;

    /**
     * @brief Read a value; completes with VALUE_UPDATED
     */
    virtual bool read(Channel channel) = 0;
};

#endif // BLE_TRANSPORT_H
