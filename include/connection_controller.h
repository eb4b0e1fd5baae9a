/**
 * @file connection_controller.h
 * @brief Device registry, bonding policy, characteristic binding and routing
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * Consumes TransportEvents (drained from the EventQueue on the main loop)
 * and owns the three protocol handlers:
 *
 *   CRS_TX       -> DirectoryListing (while attached) then FileTransfer
 *   START_RESULT -> TimingControl
 *
 * Discovery policy:
 *   - A sighting qualifies if the device is bonded or advertises the
 *     FlySight manufacturer id.
 *   - Unbonded records get a one-shot disappearance timer, re-armed on
 *     every sighting; on expiry a still-disconnected record is removed.
 *   - Bonded records are never pruned; only unbond() makes them
 *     eligible again.
 */

#ifndef CONNECTION_CONTROLLER_H
#define CONNECTION_CONTROLLER_H

#include <Arduino.h>
#include "ble_transport.h"
#include "bond_store.h"
#include "device_registry.h"
#include "directory_listing.h"
#include "event_queue.h"
#include "file_transfer.h"
#include "observer_list.h"
#include "timer_scheduler.h"
#include "timing_control.h"

/**
 * @class ConnectionController
 * @brief Connection and discovery lifecycle for one FlySight session
 *
 * Usage:
 *   controller.begin(&transport, &bondStore, &scheduler);
 *   eventQueue.setExecutor(ConnectionController::dispatchEvent, &controller);
 *
 *   // In loop():
 *   eventQueue.processAll();
 *   scheduler.update();
 */
class ConnectionController {
public:
    ConnectionController();

    /**
     * @brief Wire collaborators and load the bond set
     * @return false if the bond set could not be loaded (starts empty)
     */
    bool begin(BleTransport* transport, BondStore* bondStore, TimerScheduler* timers);

    // =========================================================================
    // EVENTS
    // =========================================================================

    /**
     * @brief Apply one transport event (main loop context only)
     */
    void handleEvent(const TransportEvent& event);

    /**
     * @brief EventQueue executor; context is the controller
     */
    static void dispatchEvent(const TransportEvent& event, void* context);

    // =========================================================================
    // CONNECTION
    // =========================================================================

    /**
     * @brief Connect to a registry device; connecting bonds it
     * @return false if unknown, another device is connected, or the
     *         transport rejected the request
     */
    bool connect(const char* identifier);

    /**
     * @brief Disconnect; an unbonded record is dropped immediately
     */
    bool disconnect(const char* identifier);

    /**
     * @brief Remove a device from the bond set
     * @return false if it was not bonded
     */
    bool unbond(const char* identifier);

    bool isBonded(const char* identifier) const;

    /**
     * @brief Restart scanning (no service filter, duplicates reported)
     */
    bool startScan();

    /**
     * @brief Order the registry by signal strength, strongest first
     */
    void sortDevicesBySignal();

    // =========================================================================
    // DIRECTORY
    // =========================================================================

    bool changeDirectory(const char* segment);
    bool goUp();
    bool refreshListing();

    // =========================================================================
    // FILE TRANSFER
    // =========================================================================

    /**
     * @brief Download a file
     *
     * A name without a leading '/' is relative to the current directory.
     * The expected size is taken from the current listing (0 if absent).
     * The callback is invoked exactly once, immediately on rejection.
     *
     * @return true if the request was written
     */
    bool downloadFile(const char* name, TransferCompleteCallback callback, void* context);

    bool cancelDownload();

    // =========================================================================
    // TIMING
    // =========================================================================

    bool sendStartCommand();
    bool sendCancelCommand();

    // =========================================================================
    // OBSERVABLE STATE
    // =========================================================================

    bool addObserver(StateObserver observer) { return _observers.add(observer); }
    bool removeObserver(StateObserver observer) { return _observers.remove(observer); }

    const DeviceRegistry& getRegistry() const { return _registry; }
    const BondSet& getBonds() const { return _bonds; }
    const DirectoryListing& getListing() const { return _listing; }
    const FileTransfer& getTransfer() const { return _transfer; }
    const TimingControl& getTiming() const { return _timing; }

    FileTransfer& transfer() { return _transfer; }
    TimingControl& timing() { return _timing; }

    bool isConnected() const { return _connectedId[0] != '\0'; }
    const char* getConnectedIdentifier() const { return _connectedId; }
    bool isChannelBound(Channel channel) const;

    /**
     * @brief Write and notify channels both bound
     */
    bool isLinkReady() const;

    void setDisappearanceDelay(uint32_t delayMs) { _disappearanceMs = delayMs; }
    uint32_t getDisappearanceDelay() const { return _disappearanceMs; }

    /**
     * @brief Print connection summary to Serial
     */
    void printStatus() const;

private:
    BleTransport* _transport;
    BondStore* _bondStore;
    TimerScheduler* _timers;

    DeviceRegistry _registry;
    BondSet _bonds;
    ObserverList _observers;

    DirectoryListing _listing;
    FileTransfer _transfer;
    TimingControl _timing;

    bool _bound[CHANNEL_COUNT];
    bool _rootListingIssued;
    char _connectedId[DEVICE_ID_LEN];
    uint32_t _disappearanceMs;

    // Event handlers
    void onPoweredOn();
    void onDeviceDiscovered(const TransportEvent& event);
    void onConnected(const TransportEvent& event);
    void onDisconnected(const TransportEvent& event);
    void onServicesDiscovered(const TransportEvent& event);
    void onCharacteristicsDiscovered(const TransportEvent& event);
    void onValueUpdated(const TransportEvent& event);

    // Helpers
    bool qualifies(const TransportEvent& event, bool bonded) const;
    void armDisappearanceTimer(DeviceRecord& record);
    void cancelDisappearanceTimer(const DeviceRecord& record);
    void clearBindings();
    void updateLinkState();
    bool saveBonds();
    void enableNotify(Channel channel);

    static void onDisappearanceTimer(uint32_t key, void* context);
};

#endif // CONNECTION_CONTROLLER_H
