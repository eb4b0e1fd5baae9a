/**
 * @file bluefruit_transport.h
 * @brief BleTransport over the Adafruit Bluefruit nRF52 central API
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * Bluefruit callbacks run in the SoftDevice event task. Every callback
 * here only packs a TransportEvent and stages it on the EventQueue.
 *
 * Discovery is synchronous in Bluefruit; discoverServices() and
 * discoverCharacteristics() run it from the main loop and report the
 * result as an event, matching the asynchronous contract.
 *
 * Service layout (index used in SERVICES_DISCOVERED):
 *   0  CRS    CRS_TX (notify), CRS_RX (write)
 *   1  GNSS   GNSS_PV
 *   2  START  START_CONTROL (write), START_RESULT (notify)
 */

#ifndef BLUEFRUIT_TRANSPORT_H
#define BLUEFRUIT_TRANSPORT_H

#include <Arduino.h>
#include <bluefruit.h>
#include "ble_transport.h"
#include "config.h"
#include "event_queue.h"

class BluefruitTransport : public BleTransport {
public:
    static constexpr uint8_t SERVICE_COUNT = 3;
    static constexpr uint8_t MAX_KNOWN_ADDRESSES = MAX_REGISTRY_DEVICES;

    BluefruitTransport();

    /**
     * @brief Configure and start the Bluefruit stack as a central
     *
     * Stages POWERED_ON when the stack is up.
     *
     * @param queue Queue receiving transport events
     * @return true if initialization succeeded
     */
    bool begin(EventQueue* queue);

    bool scan(const char* serviceFilter, bool allowDuplicates) override;
    bool connect(const char* identifier) override;
    bool cancelConnection(const char* identifier) override;
    bool discoverServices(const char* identifier) override;
    bool discoverCharacteristics(uint8_t serviceIndex) override;
    bool write(const uint8_t* data, size_t length, Channel channel, bool requireAck) override;
    bool setNotify(bool enabled, Channel channel) override;
    bool read(Channel channel) override;

    bool isConnected() const { return _connHandle != BLE_CONN_HANDLE_INVALID; }

    /**
     * @brief Format a little-endian peer address as "AA:BB:CC:DD:EE:FF"
     */
    static void formatAddress(const uint8_t* addr, char* out);

private:
    struct KnownAddress {
        char identifier[DEVICE_ID_LEN];
        ble_gap_addr_t address;
        bool used;
    };

    EventQueue* _queue;
    uint16_t _connHandle;
    char _connectedId[DEVICE_ID_LEN];

    // BLEUuid keeps a pointer to its bytes; storage must outlive the objects
    uint8_t _serviceUuids[SERVICE_COUNT][16];
    uint8_t _charUuids[CHANNEL_COUNT][16];      // little-endian, by channel
    uint8_t _scanFilterUuid[16];

    BLEClientService _services[SERVICE_COUNT];
    BLEClientCharacteristic _crsTx;
    BLEClientCharacteristic _crsRx;
    BLEClientCharacteristic _gnssPv;
    BLEClientCharacteristic _startControl;
    BLEClientCharacteristic _startResult;

    KnownAddress _addresses[MAX_KNOWN_ADDRESSES];
    uint8_t _nextAddressSlot;

    BLEClientCharacteristic* characteristicFor(Channel channel);
    Channel channelFor(const BLEClientCharacteristic* chr) const;
    void rememberAddress(const char* identifier, const ble_gap_addr_t& address);
    const ble_gap_addr_t* lookupAddress(const char* identifier) const;
    void stage(const TransportEvent& event);

    static bool loadUuid(const char* text, uint8_t* littleEndian);

    // Static callbacks for Bluefruit
    static void _onScan(ble_gap_evt_adv_report_t* report);
    static void _onConnect(uint16_t connHandle);
    static void _onDisconnect(uint16_t connHandle, uint8_t reason);
    static void _onNotify(BLEClientCharacteristic* chr, uint8_t* data, uint16_t length);
};

#endif // BLUEFRUIT_TRANSPORT_H
