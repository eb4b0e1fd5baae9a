/**
 * @file device_registry.cpp
 * @brief Device registry - Implementation
 * @version 1.0.0
 */

#include "device_registry.h"
#include <string.h>

// =============================================================================
// DEVICE RECORD
// =============================================================================

void DeviceRecord::setIdentifier(const char* id) {
    if (!id) {
        identifier[0] = '\0';
        return;
    }
    strncpy(identifier, id, DEVICE_ID_LEN - 1);
    identifier[DEVICE_ID_LEN - 1] = '\0';
}

void DeviceRecord::setName(const char* deviceName) {
    if (!deviceName || deviceName[0] == '\0') {
        deviceName = DEFAULT_DEVICE_NAME;
    }
    strncpy(name, deviceName, DEVICE_NAME_LEN - 1);
    name[DEVICE_NAME_LEN - 1] = '\0';
}

// =============================================================================
// REGISTRY
// =============================================================================

// Keys stay below 0x80000000; higher keys belong to other scheduler users
static constexpr uint32_t TIMER_KEY_MASK = 0x7FFFFFFF;

DeviceRegistry::DeviceRegistry() :
    _count(0),
    _nextTimerKey(1)
{
}

int DeviceRegistry::indexOf(const char* identifier) const {
    if (!identifier) {
        return -1;
    }
    for (uint8_t i = 0; i < _count; i++) {
        if (strcmp(_records[i].identifier, identifier) == 0) {
            return i;
        }
    }
    return -1;
}

DeviceRecord* DeviceRegistry::find(const char* identifier) {
    int index = indexOf(identifier);
    return (index >= 0) ? &_records[index] : nullptr;
}

const DeviceRecord* DeviceRegistry::find(const char* identifier) const {
    int index = indexOf(identifier);
    return (index >= 0) ? &_records[index] : nullptr;
}

DeviceRecord* DeviceRegistry::findByTimerKey(uint32_t key) {
    for (uint8_t i = 0; i < _count; i++) {
        if (_records[i].timerKey == key) {
            return &_records[i];
        }
    }
    return nullptr;
}

DeviceRecord* DeviceRegistry::add(const char* identifier, const char* name, int8_t rssi) {
    if (!identifier || identifier[0] == '\0') {
        return nullptr;
    }

    DeviceRecord* existing = find(identifier);
    if (existing) {
        return existing;
    }

    if (_count >= MAX_DEVICES) {
        Serial.printf("[REGISTRY] WARNING: Full, dropping %s\n", identifier);
        return nullptr;
    }

    DeviceRecord& record = _records[_count++];
    record = DeviceRecord();
    record.setIdentifier(identifier);
    record.setName(name);
    record.rssi = rssi;
    record.timerKey = _nextTimerKey;

    _nextTimerKey = (_nextTimerKey + 1) & TIMER_KEY_MASK;
    if (_nextTimerKey == 0) {
        _nextTimerKey = 1;
    }
    return &record;
}

bool DeviceRegistry::remove(const char* identifier) {
    int index = indexOf(identifier);
    if (index < 0) {
        return false;
    }

    for (uint8_t i = static_cast<uint8_t>(index); i + 1 < _count; i++) {
        _records[i] = _records[i + 1];
    }
    _count--;
    _records[_count] = DeviceRecord();
    return true;
}

void DeviceRegistry::sortBySignal() {
    // Stable insertion sort
    for (uint8_t i = 1; i < _count; i++) {
        DeviceRecord current = _records[i];
        int j = i - 1;
        while (j >= 0 && _records[j].rssi < current.rssi) {
            _records[j + 1] = _records[j];
            j--;
        }
        _records[j + 1] = current;
    }
}

void DeviceRegistry::clear() {
    for (uint8_t i = 0; i < MAX_DEVICES; i++) {
        _records[i] = DeviceRecord();
    }
    _count = 0;
}

void DeviceRegistry::printDevices() const {
    Serial.printf("[REGISTRY] %u device(s)\n", (unsigned)_count);
    for (uint8_t i = 0; i < _count; i++) {
        const DeviceRecord& r = _records[i];
        Serial.printf("  %u. %s  %-20s %4d dBm %s%s\n",
            (unsigned)(i + 1), r.identifier, r.name, (int)r.rssi,
            r.connected ? "[connected]" : "",
            r.bonded ? "[bonded]" : "");
    }
}
