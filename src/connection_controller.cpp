/**
 * @file connection_controller.cpp
 * @brief Connection and discovery lifecycle - Implementation
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#include "connection_controller.h"
#include <string.h>

// 16-byte UUIDs per CHARACTERISTICS_DISCOVERED event
static constexpr size_t UUID_LEN = 16;

// =============================================================================
// CONSTRUCTOR / INIT
// =============================================================================

ConnectionController::ConnectionController() :
    _transport(nullptr),
    _bondStore(nullptr),
    _timers(nullptr),
    _rootListingIssued(false),
    _disappearanceMs(DISAPPEARANCE_TIMEOUT_MS)
{
    for (uint8_t i = 0; i < CHANNEL_COUNT; i++) {
        _bound[i] = false;
    }
    _connectedId[0] = '\0';
}

bool ConnectionController::begin(BleTransport* transport, BondStore* bondStore, TimerScheduler* timers) {
    _transport = transport;
    _bondStore = bondStore;
    _timers = timers;

    _registry.clear();
    clearBindings();
    _connectedId[0] = '\0';
    _rootListingIssued = false;

    _listing.begin(transport, &_observers);
    _transfer.begin(transport, timers, &_observers);
    _timing.begin(transport, &_observers);

    _bonds.clear();
    bool loaded = true;
    if (_bondStore) {
        loaded = _bondStore->loadIdentifiers(_bonds);
        if (!loaded) {
            Serial.println(F("[BOND] WARNING: Bond set unavailable - starting empty"));
            _bonds.clear();
        }
    }

    Serial.printf("[BLE] Controller ready, %u bonded device(s)\n", (unsigned)_bonds.size());
    return loaded;
}

// =============================================================================
// EVENT DISPATCH
// =============================================================================

void ConnectionController::dispatchEvent(const TransportEvent& event, void* context) {
    ConnectionController* self = static_cast<ConnectionController*>(context);
    if (self) {
        self->handleEvent(event);
    }
}

void ConnectionController::handleEvent(const TransportEvent& event) {
    switch (event.type) {
        case TransportEventType::POWERED_ON:
            onPoweredOn();
            break;
        case TransportEventType::DEVICE_DISCOVERED:
            onDeviceDiscovered(event);
            break;
        case TransportEventType::CONNECTED:
            onConnected(event);
            break;
        case TransportEventType::DISCONNECTED:
            onDisconnected(event);
            break;
        case TransportEventType::SERVICES_DISCOVERED:
            onServicesDiscovered(event);
            break;
        case TransportEventType::CHARACTERISTICS_DISCOVERED:
            onCharacteristicsDiscovered(event);
            break;
        case TransportEventType::VALUE_UPDATED:
            onValueUpdated(event);
            break;
        default:
            break;
    }
}

// =============================================================================
// TRANSPORT EVENTS
// =============================================================================

void ConnectionController::onPoweredOn() {
    Serial.println(F("[BLE] Powered on"));
    startScan();
}

bool ConnectionController::qualifies(const TransportEvent& event, bool bonded) const {
    if (bonded) {
        return true;
    }
    if (event.length < 2) {
        return false;
    }
    return readU16LE(event.data) == FLYSIGHT_MANUFACTURER_ID;
}

void ConnectionController::onDeviceDiscovered(const TransportEvent& event) {
    bool bonded = isBonded(event.identifier);
    if (!qualifies(event, bonded)) {
        return;
    }

    DeviceRecord* record = _registry.find(event.identifier);
    if (record) {
        record->rssi = event.rssi;
        if (event.name[0] != '\0') {
            record->setName(event.name);
        }
    } else {
        record = _registry.add(event.identifier, event.name, event.rssi);
        if (!record) {
            return;
        }
        record->bonded = bonded;
        Serial.printf("[SCAN] Found %s (%s) %d dBm%s\n",
            record->identifier, record->name, (int)record->rssi,
            bonded ? " [bonded]" : "");
    }

    if (!record->bonded) {
        armDisappearanceTimer(*record);
    }

    _observers.notify(ObservedChange::REGISTRY);
}

void ConnectionController::onConnected(const TransportEvent& event) {
    Serial.printf("[BLE] Connected to %s\n", event.identifier);

    strncpy(_connectedId, event.identifier, DEVICE_ID_LEN - 1);
    _connectedId[DEVICE_ID_LEN - 1] = '\0';

    // Reconnection may precede a fresh sighting
    DeviceRecord* record = _registry.find(event.identifier);
    if (!record) {
        record = _registry.add(event.identifier, event.name, event.rssi);
        if (record) {
            record->bonded = isBonded(event.identifier);
        }
    }
    if (record) {
        record->connected = true;
        cancelDisappearanceTimer(*record);
        _observers.notify(ObservedChange::REGISTRY);
    }

    clearBindings();
    _rootListingIssued = false;
    updateLinkState();

    if (!_transport->discoverServices(event.identifier)) {
        Serial.println(F("[BLE] ERROR: Service discovery request failed"));
    }

    _observers.notify(ObservedChange::CONNECTION);
}

void ConnectionController::onDisconnected(const TransportEvent& event) {
    Serial.printf("[BLE] Disconnected from %s (reason 0x%02X)\n",
        event.identifier, (unsigned)event.status);

    bool wasSession = strcmp(_connectedId, event.identifier) == 0;
    if (wasSession) {
        _connectedId[0] = '\0';
        clearBindings();
        _rootListingIssued = false;
        updateLinkState();
        _listing.reset();
        _transfer.fail(TransferOutcome::DISCONNECTED);
    }

    DeviceRecord* record = _registry.find(event.identifier);
    if (record) {
        record->connected = false;
        if (!record->bonded) {
            armDisappearanceTimer(*record);
        }
        _observers.notify(ObservedChange::REGISTRY);
    }

    _observers.notify(ObservedChange::CONNECTION);
}

void ConnectionController::onServicesDiscovered(const TransportEvent& event) {
    if (event.hasError()) {
        Serial.printf("[BLE] ERROR: Service discovery failed (0x%02X)\n", (unsigned)event.status);
        return;
    }

    for (uint16_t i = 0; i < event.length; i++) {
        if (!_transport->discoverCharacteristics(event.data[i])) {
            Serial.printf("[BLE] ERROR: Characteristic discovery failed for service %u\n",
                (unsigned)event.data[i]);
        }
    }
}

void ConnectionController::onCharacteristicsDiscovered(const TransportEvent& event) {
    if (event.hasError()) {
        Serial.printf("[BLE] ERROR: Characteristic discovery failed (0x%02X)\n", (unsigned)event.status);
        return;
    }

    bool resultWasBound = _bound[channelIndex(Channel::TIMING_RESULT)];

    for (uint16_t offset = 0; offset + UUID_LEN <= event.length; offset += UUID_LEN) {
        Channel channel = channelForUuid(event.data + offset);
        if (channel == Channel::NONE) {
            continue;
        }
        _bound[channelIndex(channel)] = true;
        Serial.printf("[BLE] Bound %s\n", channelToString(channel));
    }

    updateLinkState();
    _observers.notify(ObservedChange::CONNECTION);

    if (!resultWasBound && _bound[channelIndex(Channel::TIMING_RESULT)]) {
        enableNotify(Channel::TIMING_RESULT);
    }

    if (isLinkReady() && !_rootListingIssued) {
        _rootListingIssued = true;
        enableNotify(Channel::NOTIFY);

        // Reply is not interpreted
        if (!_transport->read(Channel::WRITE)) {
            Serial.println(F("[BLE] WARNING: Initial CRS_RX read failed"));
        }

        _listing.requestListing();
    }
}

void ConnectionController::onValueUpdated(const TransportEvent& event) {
    switch (event.channel) {
        case Channel::NOTIFY:
            if (event.hasError()) {
                Serial.printf("[BLE] ERROR: CRS_TX update failed (0x%02X)\n", (unsigned)event.status);
                _listing.onTransportError();
                _transfer.fail(TransferOutcome::TRANSPORT_ERROR);
                return;
            }
            // Decode outcome does not stop delivery to the transfer
            _listing.onNotification(event.data, event.length);
            _transfer.onNotification(event.data, event.length);
            break;

        case Channel::TIMING_RESULT:
            if (event.hasError()) {
                Serial.printf("[BLE] ERROR: START_RESULT update failed (0x%02X)\n", (unsigned)event.status);
                return;
            }
            _timing.onResultNotification(event.data, event.length);
            break;

        default:
            break;
    }
}

// =============================================================================
// CONNECTION OPERATIONS
// =============================================================================

bool ConnectionController::startScan() {
    if (!_transport) {
        return false;
    }
    if (!_transport->scan(nullptr, true)) {
        Serial.println(F("[SCAN] ERROR: Scan request failed"));
        return false;
    }
    Serial.println(F("[SCAN] Scanning"));
    return true;
}

bool ConnectionController::connect(const char* identifier) {
    DeviceRecord* record = _registry.find(identifier);
    if (!record) {
        Serial.printf("[BLE] Unknown device %s\n", identifier ? identifier : "(null)");
        return false;
    }

    if (isConnected() && strcmp(_connectedId, identifier) != 0) {
        Serial.printf("[BLE] Already connected to %s\n", _connectedId);
        return false;
    }

    if (!_transport->connect(identifier)) {
        Serial.printf("[BLE] ERROR: Connect request to %s failed\n", identifier);
        return false;
    }

    record->connected = true;
    cancelDisappearanceTimer(*record);

    if (_bonds.insert(record->identifier).second) {
        saveBonds();
    }
    record->bonded = true;

    Serial.printf("[BOND] Bonded %s\n", record->identifier);
    _observers.notify(ObservedChange::REGISTRY);
    return true;
}

bool ConnectionController::disconnect(const char* identifier) {
    DeviceRecord* record = _registry.find(identifier);
    if (!record) {
        return false;
    }

    // identifier may point into the registry, which remove() shifts
    char id[DEVICE_ID_LEN];
    strncpy(id, record->identifier, DEVICE_ID_LEN);

    if (!_transport->cancelConnection(id)) {
        Serial.printf("[BLE] ERROR: Disconnect request to %s failed\n", id);
        return false;
    }

    if (!record->bonded) {
        cancelDisappearanceTimer(*record);
        _registry.remove(id);
        Serial.printf("[REGISTRY] Removed %s\n", id);
    } else {
        record->connected = false;
        armDisappearanceTimer(*record);
    }

    _observers.notify(ObservedChange::REGISTRY);
    return true;
}

bool ConnectionController::unbond(const char* identifier) {
    if (!identifier || _bonds.erase(identifier) == 0) {
        return false;
    }
    saveBonds();
    Serial.printf("[BOND] Unbonded %s\n", identifier);

    DeviceRecord* record = _registry.find(identifier);
    if (record) {
        record->bonded = false;
        if (!record->connected) {
            armDisappearanceTimer(*record);
        }
        _observers.notify(ObservedChange::REGISTRY);
    }
    return true;
}

bool ConnectionController::isBonded(const char* identifier) const {
    return identifier && _bonds.count(identifier) > 0;
}

void ConnectionController::sortDevicesBySignal() {
    _registry.sortBySignal();
    _observers.notify(ObservedChange::REGISTRY);
}

// =============================================================================
// DIRECTORY OPERATIONS
// =============================================================================

bool ConnectionController::changeDirectory(const char* segment) {
    if (_transfer.isActive()) {
        Serial.println(F("[DIR] Request rejected - transfer active"));
        return false;
    }
    return _listing.changeDirectory(segment);
}

bool ConnectionController::goUp() {
    if (_transfer.isActive()) {
        Serial.println(F("[DIR] Request rejected - transfer active"));
        return false;
    }
    return _listing.goUp();
}

bool ConnectionController::refreshListing() {
    if (_transfer.isActive()) {
        Serial.println(F("[DIR] Request rejected - transfer active"));
        return false;
    }
    return _listing.requestListing();
}

// =============================================================================
// FILE TRANSFER OPERATIONS
// =============================================================================

bool ConnectionController::downloadFile(const char* name, TransferCompleteCallback callback, void* context) {
    static const std::vector<uint8_t> NO_DATA;

    if (!name || name[0] == '\0') {
        Serial.println(F("[XFER] No file name given"));
        if (callback) {
            callback(TransferOutcome::TRANSPORT_ERROR, NO_DATA, context);
        }
        return false;
    }

    // Listing still owns the notify channel
    if (_listing.isAwaitingResponse() && !_transfer.isActive()) {
        Serial.println(F("[XFER] Busy - listing in progress"));
        if (callback) {
            callback(TransferOutcome::BUSY, NO_DATA, context);
        }
        return false;
    }

    std::string path;
    if (name[0] == '/') {
        path = name;
    } else {
        path = _listing.getPathString();
        if (path.back() != '/') {
            path += '/';
        }
        path += name;
    }

    const char* leaf = strrchr(path.c_str(), '/');
    leaf = leaf ? leaf + 1 : path.c_str();
    const DirectoryEntry* entry = _listing.findEntry(leaf);
    uint32_t expectedSize = entry ? entry->size : 0;

    if (!_transfer.start(path.c_str(), expectedSize, callback, context)) {
        return false;
    }

    _listing.detach();
    return true;
}

bool ConnectionController::cancelDownload() {
    return _transfer.cancel();
}

// =============================================================================
// TIMING OPERATIONS
// =============================================================================

bool ConnectionController::sendStartCommand() {
    return _timing.sendStart();
}

bool ConnectionController::sendCancelCommand() {
    return _timing.sendCancel();
}

// =============================================================================
// STATE
// =============================================================================

bool ConnectionController::isChannelBound(Channel channel) const {
    uint8_t index = channelIndex(channel);
    return index < CHANNEL_COUNT && _bound[index];
}

bool ConnectionController::isLinkReady() const {
    return isChannelBound(Channel::WRITE) && isChannelBound(Channel::NOTIFY);
}

void ConnectionController::printStatus() const {
    Serial.println(F("[BLE] ---- STATUS ----"));
    Serial.printf("  Connected:  %s\n", isConnected() ? _connectedId : "no");
    Serial.printf("  Channels:  ");
    for (uint8_t i = 1; i < CHANNEL_COUNT; i++) {
        Channel channel = static_cast<Channel>(i);
        Serial.printf(" %s=%s", channelToString(channel), isChannelBound(channel) ? "Y" : "n");
    }
    Serial.println();
    Serial.printf("  Path:       %s%s\n", _listing.getPathString().c_str(),
        _listing.isAwaitingResponse() ? " [awaiting]" : "");
    Serial.printf("  Transfer:   %s", _transfer.isActive() ? _transfer.getPath() : "idle");
    if (_transfer.isActive()) {
        Serial.printf(" %u bytes (%d%%)", (unsigned)_transfer.getBytesReceived(),
            (int)(_transfer.getProgress() * 100.0f));
    }
    Serial.println();
    Serial.printf("  Timing:     %s\n", timingStateToString(_timing.getState()));
    if (_timing.hasResult()) {
        char stamp[32];
        _timing.getLastResult().format(stamp, sizeof(stamp));
        Serial.printf("  Last start: %s\n", stamp);
    }
    Serial.printf("  Devices:    %u, bonded %u\n", (unsigned)_registry.count(), (unsigned)_bonds.size());
}

// =============================================================================
// HELPERS
// =============================================================================

void ConnectionController::armDisappearanceTimer(DeviceRecord& record) {
    // Bonded devices are never pruned
    if (record.bonded || !_timers) {
        return;
    }
    _timers->schedule(record.timerKey, _disappearanceMs, onDisappearanceTimer, this);
}

void ConnectionController::cancelDisappearanceTimer(const DeviceRecord& record) {
    if (_timers) {
        _timers->cancelKey(record.timerKey);
    }
}

void ConnectionController::onDisappearanceTimer(uint32_t key, void* context) {
    ConnectionController* self = static_cast<ConnectionController*>(context);
    if (!self) {
        return;
    }

    DeviceRecord* record = self->_registry.findByTimerKey(key);
    if (!record || record->connected || record->bonded) {
        return;
    }

    Serial.printf("[REGISTRY] %s disappeared\n", record->identifier);
    char identifier[DEVICE_ID_LEN];
    strncpy(identifier, record->identifier, DEVICE_ID_LEN);
    self->_registry.remove(identifier);
    self->_observers.notify(ObservedChange::REGISTRY);
}

void ConnectionController::clearBindings() {
    for (uint8_t i = 0; i < CHANNEL_COUNT; i++) {
        _bound[i] = false;
    }
}

void ConnectionController::updateLinkState() {
    bool ready = isLinkReady();
    _listing.setLinkReady(ready);
    _transfer.setLinkReady(ready);
    _timing.setLinkReady(isChannelBound(Channel::TIMING_CONTROL));
}

bool ConnectionController::saveBonds() {
    if (!_bondStore) {
        return false;
    }
    if (!_bondStore->saveIdentifiers(_bonds)) {
        Serial.println(F("[BOND] ERROR: Bond set not saved"));
        return false;
    }
    return true;
}

void ConnectionController::enableNotify(Channel channel) {
    if (!_transport->setNotify(true, channel)) {
        Serial.printf("[BLE] WARNING: Cannot enable notify on %s\n", channelToString(channel));
    }
}
