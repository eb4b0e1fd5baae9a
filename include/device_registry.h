/**
 * @file device_registry.h
 * @brief Fixed-capacity registry of sighted and bonded FlySight devices
 * @version 1.0.0
 *
 * Records are unique by identifier. The registry holds no policy; the
 * connection controller decides when records are added, updated or pruned.
 */

#ifndef DEVICE_REGISTRY_H
#define DEVICE_REGISTRY_H

#include <Arduino.h>
#include "config.h"

/**
 * @brief One known device
 */
struct DeviceRecord {
    char identifier[DEVICE_ID_LEN];
    char name[DEVICE_NAME_LEN];
    int8_t rssi;
    bool connected;
    bool bonded;
    uint32_t timerKey;      // Disappearance timer key, unique per record

    DeviceRecord() : rssi(0), connected(false), bonded(false), timerKey(0) {
        identifier[0] = '\0';
        name[0] = '\0';
    }

    void setIdentifier(const char* id);

    /**
     * @brief Set display name, DEFAULT_DEVICE_NAME if null or empty
     */
    void setName(const char* deviceName);
};

/**
 * @class DeviceRegistry
 * @brief Unordered array of DeviceRecords, insertion order kept until sorted
 *
 * Usage:
 *   DeviceRecord* rec = registry.find("AA:BB:CC:DD:EE:FF");
 *   if (!rec) rec = registry.add("AA:BB:CC:DD:EE:FF", "FlySight", -60);
 */
class DeviceRegistry {
public:
    static constexpr uint8_t MAX_DEVICES = MAX_REGISTRY_DEVICES;

    DeviceRegistry();

    /**
     * @brief Find a record by identifier
     * @return Record, or nullptr if unknown
     */
    DeviceRecord* find(const char* identifier);
    const DeviceRecord* find(const char* identifier) const;

    /**
     * @brief Find a record by its disappearance timer key
     */
    DeviceRecord* findByTimerKey(uint32_t key);

    /**
     * @brief Insert a new record
     * @return The existing record if the identifier is known, the new
     *         record otherwise, nullptr if the registry is full
     */
    DeviceRecord* add(const char* identifier, const char* name, int8_t rssi);

    /**
     * @brief Remove a record, preserving the order of the rest
     * @return true if a record was removed
     */
    bool remove(const char* identifier);

    /**
     * @brief Order records by signal strength, strongest first
     *
     * Records with equal strength keep their relative order.
     */
    void sortBySignal();

    void clear();

    uint8_t count() const { return _count; }

    /**
     * @brief Record at index (0 <= index < count())
     */
    const DeviceRecord& at(uint8_t index) const { return _records[index]; }
    DeviceRecord& at(uint8_t index) { return _records[index]; }

    /**
     * @brief Print all records to Serial
     */
    void printDevices() const;

private:
    DeviceRecord _records[MAX_DEVICES];
    uint8_t _count;
    uint32_t _nextTimerKey;

    int indexOf(const char* identifier) const;
};

#endif // DEVICE_REGISTRY_H
