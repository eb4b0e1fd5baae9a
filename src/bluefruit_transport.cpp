/**
 * @file bluefruit_transport.cpp
 * @brief BleTransport over the Adafruit Bluefruit nRF52 central API - Implementation
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#include "bluefruit_transport.h"
#include "wire_codec.h"
#include <string.h>

// =============================================================================
// GLOBAL INSTANCE (needed for static callbacks)
// =============================================================================

BluefruitTransport* g_bluefruitTransport = nullptr;

// Connection tuning (event length in 1.25ms units)
static constexpr uint16_t BLE_EVENT_LEN = 6;
static constexpr uint8_t BLE_HVN_QSIZE = 8;
static constexpr uint8_t BLE_WRCMD_QSIZE = 8;

static constexpr uint8_t SERVICE_CRS = 0;
static constexpr uint8_t SERVICE_GNSS = 1;
static constexpr uint8_t SERVICE_START = 2;

// =============================================================================
// CONSTRUCTOR
// =============================================================================

BluefruitTransport::BluefruitTransport() :
    _queue(nullptr),
    _connHandle(BLE_CONN_HANDLE_INVALID),
    _nextAddressSlot(0)
{
    _connectedId[0] = '\0';
    memset(_serviceUuids, 0, sizeof(_serviceUuids));
    memset(_charUuids, 0, sizeof(_charUuids));
    memset(_scanFilterUuid, 0, sizeof(_scanFilterUuid));

    for (uint8_t i = 0; i < MAX_KNOWN_ADDRESSES; i++) {
        _addresses[i].identifier[0] = '\0';
        _addresses[i].used = false;
    }

    // Set global instance for static callbacks
    g_bluefruitTransport = this;
}

// =============================================================================
// INITIALIZATION
// =============================================================================

bool BluefruitTransport::loadUuid(const char* text, uint8_t* littleEndian) {
    uint8_t bytes[16];
    if (!parseUuid(text, bytes)) {
        Serial.printf("[BLE] ERROR: Bad UUID %s\n", text);
        return false;
    }
    for (uint8_t i = 0; i < 16; i++) {
        littleEndian[i] = bytes[15 - i];
    }
    return true;
}

bool BluefruitTransport::begin(EventQueue* queue) {
    _queue = queue;

    Serial.println(F("[BLE] Initializing central..."));

    bool ok = loadUuid(FLYSIGHT_CRS_SERVICE_UUID, _serviceUuids[SERVICE_CRS]);
    ok = loadUuid(FLYSIGHT_GNSS_SERVICE_UUID, _serviceUuids[SERVICE_GNSS]) && ok;
    ok = loadUuid(FLYSIGHT_START_SERVICE_UUID, _serviceUuids[SERVICE_START]) && ok;
    ok = loadUuid(FLYSIGHT_CRS_TX_UUID, _charUuids[channelIndex(Channel::NOTIFY)]) && ok;
    ok = loadUuid(FLYSIGHT_CRS_RX_UUID, _charUuids[channelIndex(Channel::WRITE)]) && ok;
    ok = loadUuid(FLYSIGHT_GNSS_PV_UUID, _charUuids[channelIndex(Channel::POSITION)]) && ok;
    ok = loadUuid(FLYSIGHT_START_CONTROL_UUID, _charUuids[channelIndex(Channel::TIMING_CONTROL)]) && ok;
    ok = loadUuid(FLYSIGHT_START_RESULT_UUID, _charUuids[channelIndex(Channel::TIMING_RESULT)]) && ok;
    if (!ok) {
        return false;
    }

    // Must precede Bluefruit.begin()
    Bluefruit.configCentralConn(BLE_MTU, BLE_EVENT_LEN, BLE_HVN_QSIZE, BLE_WRCMD_QSIZE);

    // 0 peripheral, 1 central connection
    if (!Bluefruit.begin(0, 1)) {
        Serial.println(F("[BLE] ERROR: Bluefruit.begin failed"));
        return false;
    }
    Bluefruit.setName(BLE_NAME);
    Bluefruit.setTxPower(0);

    // Client characteristics attach to the last begin()ed service
    for (uint8_t i = 0; i < SERVICE_COUNT; i++) {
        _services[i].uuid = BLEUuid(_serviceUuids[i]);
    }
    _crsTx.uuid = BLEUuid(_charUuids[channelIndex(Channel::NOTIFY)]);
    _crsRx.uuid = BLEUuid(_charUuids[channelIndex(Channel::WRITE)]);
    _gnssPv.uuid = BLEUuid(_charUuids[channelIndex(Channel::POSITION)]);
    _startControl.uuid = BLEUuid(_charUuids[channelIndex(Channel::TIMING_CONTROL)]);
    _startResult.uuid = BLEUuid(_charUuids[channelIndex(Channel::TIMING_RESULT)]);

    _services[SERVICE_CRS].begin();
    _crsTx.setNotifyCallback(_onNotify);
    _crsTx.begin();
    _crsRx.begin();

    _services[SERVICE_GNSS].begin();
    _gnssPv.begin();

    _services[SERVICE_START].begin();
    _startControl.begin();
    _startResult.setNotifyCallback(_onNotify);
    _startResult.begin();

    Bluefruit.Central.setConnectCallback(_onConnect);
    Bluefruit.Central.setDisconnectCallback(_onDisconnect);

    Bluefruit.Scanner.setRxCallback(_onScan);
    Bluefruit.Scanner.restartOnDisconnect(true);
    Bluefruit.Scanner.setInterval(160, 80);  // 100ms interval, 50ms window
    Bluefruit.Scanner.useActiveScan(true);   // Scan response carries the name

    Serial.printf("[BLE] Central ready, MTU=%d\n", BLE_MTU);

    TransportEvent event;
    event.type = TransportEventType::POWERED_ON;
    stage(event);
    return true;
}

// =============================================================================
// SCANNING / CONNECTION
// =============================================================================

bool BluefruitTransport::scan(const char* serviceFilter, bool allowDuplicates) {
    // Bluefruit reports every advertisement; duplicates are never filtered
    (void)allowDuplicates;

    Bluefruit.Scanner.stop();
    Bluefruit.Scanner.clearFilters();

    if (serviceFilter) {
        if (!loadUuid(serviceFilter, _scanFilterUuid)) {
            return false;
        }
        Bluefruit.Scanner.filterUuid(BLEUuid(_scanFilterUuid));
    }

    return Bluefruit.Scanner.start(0);  // 0 = Don't stop
}

bool BluefruitTransport::connect(const char* identifier) {
    const ble_gap_addr_t* address = lookupAddress(identifier);
    if (!address) {
        Serial.printf("[BLE] No advertised address for %s\n", identifier);
        return false;
    }

    Bluefruit.Scanner.stop();
    if (!Bluefruit.Central.connect(address)) {
        Bluefruit.Scanner.start(0);
        return false;
    }
    return true;
}

bool BluefruitTransport::cancelConnection(const char* identifier) {
    if (_connHandle == BLE_CONN_HANDLE_INVALID || strcmp(identifier, _connectedId) != 0) {
        // Nothing to tear down
        return true;
    }
    return Bluefruit.disconnect(_connHandle);
}

// =============================================================================
// DISCOVERY
// =============================================================================

bool BluefruitTransport::discoverServices(const char* identifier) {
    if (_connHandle == BLE_CONN_HANDLE_INVALID || strcmp(identifier, _connectedId) != 0) {
        return false;
    }

    BLEConnection* connection = Bluefruit.Connection(_connHandle);
    if (connection) {
        connection->requestMtuExchange(BLE_MTU);
    }

    TransportEvent event;
    event.type = TransportEventType::SERVICES_DISCOVERED;
    event.setIdentifier(identifier);

    uint8_t found[SERVICE_COUNT];
    uint8_t foundCount = 0;
    for (uint8_t i = 0; i < SERVICE_COUNT; i++) {
        if (_services[i].discover(_connHandle)) {
            found[foundCount++] = i;
        }
    }

    Serial.printf("[BLE] %u of %u services found\n", (unsigned)foundCount, (unsigned)SERVICE_COUNT);
    if (foundCount == 0) {
        event.status = 1;
    }
    event.setData(found, foundCount);
    stage(event);
    return true;
}

bool BluefruitTransport::discoverCharacteristics(uint8_t serviceIndex) {
    if (_connHandle == BLE_CONN_HANDLE_INVALID || serviceIndex >= SERVICE_COUNT) {
        return false;
    }

    BLEClientCharacteristic* members[2] = {nullptr, nullptr};
    switch (serviceIndex) {
        case SERVICE_CRS:
            members[0] = &_crsTx;
            members[1] = &_crsRx;
            break;
        case SERVICE_GNSS:
            members[0] = &_gnssPv;
            break;
        case SERVICE_START:
            members[0] = &_startControl;
            members[1] = &_startResult;
            break;
        default:
            return false;
    }

    TransportEvent event;
    event.type = TransportEventType::CHARACTERISTICS_DISCOVERED;
    event.serviceIndex = serviceIndex;
    event.setIdentifier(_connectedId);

    // Discovered UUIDs in string byte order
    uint8_t uuids[2 * 16];
    size_t length = 0;
    for (BLEClientCharacteristic* chr : members) {
        if (!chr || !chr->discover()) {
            continue;
        }
        const uint8_t* le = _charUuids[channelIndex(channelFor(chr))];
        for (uint8_t i = 0; i < 16; i++) {
            uuids[length + i] = le[15 - i];
        }
        length += 16;
    }

    event.setData(uuids, length);
    stage(event);
    return true;
}

// =============================================================================
// DATA
// =============================================================================

bool BluefruitTransport::write(const uint8_t* data, size_t length, Channel channel, bool requireAck) {
    BLEClientCharacteristic* chr = characteristicFor(channel);
    if (!chr || !chr->discovered() || _connHandle == BLE_CONN_HANDLE_INVALID) {
        return false;
    }

    uint16_t written = requireAck
        ? chr->write_resp(data, static_cast<uint16_t>(length))
        : chr->write(data, static_cast<uint16_t>(length));
    return written == length;
}

bool BluefruitTransport::setNotify(bool enabled, Channel channel) {
    BLEClientCharacteristic* chr = characteristicFor(channel);
    if (!chr || !chr->discovered()) {
        return false;
    }
    return enabled ? chr->enableNotify() : chr->disableNotify();
}

bool BluefruitTransport::read(Channel channel) {
    BLEClientCharacteristic* chr = characteristicFor(channel);
    if (!chr || !chr->discovered()) {
        return false;
    }

    uint8_t buffer[EVENT_MAX_PAYLOAD];
    uint16_t length = chr->read(buffer, sizeof(buffer));

    TransportEvent event;
    event.type = TransportEventType::VALUE_UPDATED;
    event.channel = channel;
    event.setIdentifier(_connectedId);
    event.setData(buffer, length);
    stage(event);
    return true;
}

// =============================================================================
// HELPERS
// =============================================================================

BLEClientCharacteristic* BluefruitTransport::characteristicFor(Channel channel) {
    switch (channel) {
        case Channel::WRITE:          return &_crsRx;
        case Channel::NOTIFY:         return &_crsTx;
        case Channel::POSITION:       return &_gnssPv;
        case Channel::TIMING_CONTROL: return &_startControl;
        case Channel::TIMING_RESULT:  return &_startResult;
        default:                      return nullptr;
    }
}

Channel BluefruitTransport::channelFor(const BLEClientCharacteristic* chr) const {
    if (chr == &_crsRx)        return Channel::WRITE;
    if (chr == &_crsTx)        return Channel::NOTIFY;
    if (chr == &_gnssPv)       return Channel::POSITION;
    if (chr == &_startControl) return Channel::TIMING_CONTROL;
    if (chr == &_startResult)  return Channel::TIMING_RESULT;
    return Channel::NONE;
}

void BluefruitTransport::formatAddress(const uint8_t* addr, char* out) {
    // Address bytes are little-endian; print most significant first
    snprintf(out, DEVICE_ID_LEN, "%02X:%02X:%02X:%02X:%02X:%02X",
             addr[5], addr[4], addr[3], addr[2], addr[1], addr[0]);
}

void BluefruitTransport::rememberAddress(const char* identifier, const ble_gap_addr_t& address) {
    for (uint8_t i = 0; i < MAX_KNOWN_ADDRESSES; i++) {
        if (_addresses[i].used && strcmp(_addresses[i].identifier, identifier) == 0) {
            _addresses[i].address = address;
            return;
        }
    }

    // Round-robin replacement of the oldest slot
    KnownAddress& slot = _addresses[_nextAddressSlot];
    strncpy(slot.identifier, identifier, DEVICE_ID_LEN - 1);
    slot.identifier[DEVICE_ID_LEN - 1] = '\0';
    slot.address = address;
    slot.used = true;
    _nextAddressSlot = (_nextAddressSlot + 1) % MAX_KNOWN_ADDRESSES;
}

const ble_gap_addr_t* BluefruitTransport::lookupAddress(const char* identifier) const {
    if (!identifier) {
        return nullptr;
    }
    for (uint8_t i = 0; i < MAX_KNOWN_ADDRESSES; i++) {
        if (_addresses[i].used && strcmp(_addresses[i].identifier, identifier) == 0) {
            return &_addresses[i].address;
        }
    }
    return nullptr;
}

void BluefruitTransport::stage(const TransportEvent& event) {
    if (!_queue || !_queue->enqueue(event)) {
        Serial.printf("[EVENT] WARNING: Dropped %s\n", transportEventTypeToString(event.type));
    }
}

// =============================================================================
// STATIC CALLBACKS (SoftDevice event task)
// =============================================================================

void BluefruitTransport::_onScan(ble_gap_evt_adv_report_t* report) {
    if (!g_bluefruitTransport) return;

    TransportEvent event;
    event.type = TransportEventType::DEVICE_DISCOVERED;
    event.rssi = report->rssi;

    char identifier[DEVICE_ID_LEN];
    formatAddress(report->peer_addr.addr, identifier);
    event.setIdentifier(identifier);

    char name[DEVICE_NAME_LEN] = {0};
    uint8_t nameLen = Bluefruit.Scanner.parseReportByType(report, BLE_GAP_AD_TYPE_COMPLETE_LOCAL_NAME,
                                                           (uint8_t*)name, sizeof(name) - 1);
    if (nameLen == 0) {
        Bluefruit.Scanner.parseReportByType(report, BLE_GAP_AD_TYPE_SHORT_LOCAL_NAME,
                                            (uint8_t*)name, sizeof(name) - 1);
    }
    event.setName(name);

    uint8_t manufacturer[32];
    uint8_t manufacturerLen = Bluefruit.Scanner.parseReportByType(
        report, BLE_GAP_AD_TYPE_MANUFACTURER_SPECIFIC_DATA, manufacturer, sizeof(manufacturer));
    event.setData(manufacturer, manufacturerLen);

    g_bluefruitTransport->rememberAddress(identifier, report->peer_addr);
    g_bluefruitTransport->stage(event);

    // Must resume scanner to receive more results
    Bluefruit.Scanner.resume();
}

void BluefruitTransport::_onConnect(uint16_t connHandle) {
    if (!g_bluefruitTransport) return;

    BLEConnection* connection = Bluefruit.Connection(connHandle);
    if (!connection) {
        return;
    }

    ble_gap_addr_t peer = connection->getPeerAddr();
    char identifier[DEVICE_ID_LEN];
    formatAddress(peer.addr, identifier);

    g_bluefruitTransport->_connHandle = connHandle;
    strncpy(g_bluefruitTransport->_connectedId, identifier, DEVICE_ID_LEN);

    TransportEvent event;
    event.type = TransportEventType::CONNECTED;
    event.setIdentifier(identifier);

    char name[DEVICE_NAME_LEN] = {0};
    connection->getPeerName(name, sizeof(name));
    event.setName(name);

    g_bluefruitTransport->stage(event);
}

void BluefruitTransport::_onDisconnect(uint16_t connHandle, uint8_t reason) {
    if (!g_bluefruitTransport) return;
    if (connHandle != g_bluefruitTransport->_connHandle) return;

    TransportEvent event;
    event.type = TransportEventType::DISCONNECTED;
    event.setIdentifier(g_bluefruitTransport->_connectedId);
    event.status = reason;

    g_bluefruitTransport->_connHandle = BLE_CONN_HANDLE_INVALID;
    g_bluefruitTransport->_connectedId[0] = '\0';

    g_bluefruitTransport->stage(event);
}

void BluefruitTransport::_onNotify(BLEClientCharacteristic* chr, uint8_t* data, uint16_t length) {
    if (!g_bluefruitTransport) return;

    TransportEvent event;
    event.type = TransportEventType::VALUE_UPDATED;
    event.channel = g_bluefruitTransport->channelFor(chr);
    event.setIdentifier(g_bluefruitTransport->_connectedId);
    if (!event.setData(data, length)) {
        // Truncated value is reported as an error on the channel
        event.status = 1;
    }
    g_bluefruitTransport->stage(event);
}
