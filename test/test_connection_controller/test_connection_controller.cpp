/**
 * @file test_connection_controller.cpp
 * @brief Unit tests for connection_controller.h/cpp - Discovery, bonding, routing
 */

#include <unity.h>
#include <string.h>
#include "connection_controller.h"
#include "fake_transport.h"

// =============================================================================
// TEST FIXTURES
// =============================================================================

static const char* DEVICE_A = "C4:11:22:33:44:55";
static const char* DEVICE_B = "D9:AA:BB:CC:DD:EE";

static FakeTransport transport;
static MemoryBondStore bondStore;
static ConnectionController controller;

static uint8_t downloadCount = 0;
static TransferOutcome downloadOutcome = TransferOutcome::SUCCESS;
static std::vector<uint8_t> downloadData;

static void onDownload(TransferOutcome outcome, const std::vector<uint8_t>& data, void* context) {
    (void)context;
    downloadCount++;
    downloadOutcome = outcome;
    downloadData = data;
}

void setUp(void) {
    transport.reset();
    scheduler.cancelAll();
    bondStore = MemoryBondStore();
    controller.begin(&transport, &bondStore, &scheduler);
    downloadCount = 0;
    downloadOutcome = TransferOutcome::SUCCESS;
    downloadData.clear();
}

void tearDown(void) {
    scheduler.cancelAll();
}

// =============================================================================
// EVENT HELPERS
// =============================================================================

static void advertise(const char* id, int8_t rssi, bool flysight) {
    TransportEvent event;
    event.type = TransportEventType::DEVICE_DISCOVERED;
    event.setIdentifier(id);
    event.setName("FlySight");
    event.rssi = rssi;
    if (flysight) {
        const uint8_t manufacturer[] = {0xDB, 0x09, 0x01};
        event.setData(manufacturer, sizeof(manufacturer));
    } else {
        const uint8_t manufacturer[] = {0x4C, 0x00, 0x02};
        event.setData(manufacturer, sizeof(manufacturer));
    }
    controller.handleEvent(event);
}

static void connected(const char* id) {
    TransportEvent event;
    event.type = TransportEventType::CONNECTED;
    event.setIdentifier(id);
    controller.handleEvent(event);
}

static void disconnected(const char* id) {
    TransportEvent event;
    event.type = TransportEventType::DISCONNECTED;
    event.setIdentifier(id);
    event.status = 0x13;
    controller.handleEvent(event);
}

static void characteristics(const char* const* uuids, uint8_t count) {
    TransportEvent event;
    event.type = TransportEventType::CHARACTERISTICS_DISCOVERED;
    uint8_t bytes[5 * 16];
    for (uint8_t i = 0; i < count; i++) {
        TEST_ASSERT_TRUE(parseUuid(uuids[i], bytes + i * 16));
    }
    event.setData(bytes, count * 16);
    controller.handleEvent(event);
}

static void bindAll() {
    const char* uuids[] = {
        FLYSIGHT_CRS_TX_UUID, FLYSIGHT_CRS_RX_UUID, FLYSIGHT_GNSS_PV_UUID,
        FLYSIGHT_START_CONTROL_UUID, FLYSIGHT_START_RESULT_UUID
    };
    characteristics(uuids, 5);
}

static void notifyValue(Channel channel, const uint8_t* data, size_t length, uint8_t status = 0) {
    TransportEvent event;
    event.type = TransportEventType::VALUE_UPDATED;
    event.channel = channel;
    event.status = status;
    event.setData(data, length);
    controller.handleEvent(event);
}

static void deliverEntry(const char* name, uint32_t size, bool directory) {
    DirectoryEntry entry;
    strncpy(entry.name, name, DIR_ENTRY_NAME_LEN);
    entry.name[DIR_ENTRY_NAME_LEN] = '\0';
    entry.size = size;
    entry.modified = UtcTimestamp(2024, 5, 25, 10, 0, 0);
    entry.attributes = directory ? ATTR_DIRECTORY : ATTR_ARCHIVE;

    uint8_t frame[DIR_ENTRY_FRAME_LEN];
    TEST_ASSERT_TRUE(encodeDirectoryEntry(entry, frame, sizeof(frame)));
    notifyValue(Channel::NOTIFY, frame, sizeof(frame));
}

static void deliverData(uint8_t sequence, const char* payload) {
    uint8_t frame[32];
    size_t payloadLength = payload ? strlen(payload) : 0;
    frame[0] = OP_FILE_DATA;
    frame[1] = sequence;
    if (payloadLength > 0) {
        memcpy(frame + 2, payload, payloadLength);
    }
    notifyValue(Channel::NOTIFY, frame, 2 + payloadLength);
}

static void expireTimers() {
    scheduler.update(millis() + DISAPPEARANCE_TIMEOUT_MS + 10);
}

/**
 * @brief Discover, connect and bind every channel, answering the root listing
 */
static void establishSession(const char* id) {
    advertise(id, -60, true);
    TEST_ASSERT_TRUE(controller.connect(id));
    connected(id);
    bindAll();
    deliverEntry("TRACKS", 0, true);
}

// =============================================================================
// DISCOVERY
// =============================================================================

void test_flysight_advertisement_adds_record(void) {
    advertise(DEVICE_A, -55, true);

    TEST_ASSERT_EQUAL_UINT8(1, controller.getRegistry().count());
    const DeviceRecord* record = controller.getRegistry().find(DEVICE_A);
    TEST_ASSERT_NOT_NULL(record);
    TEST_ASSERT_EQUAL_INT8(-55, record->rssi);
    TEST_ASSERT_FALSE(record->bonded);
}

void test_other_manufacturer_ignored(void) {
    advertise(DEVICE_A, -55, false);
    TEST_ASSERT_EQUAL_UINT8(0, controller.getRegistry().count());
}

void test_weak_signal_still_registered(void) {
    advertise(DEVICE_A, -105, true);

    const DeviceRecord* record = controller.getRegistry().find(DEVICE_A);
    TEST_ASSERT_NOT_NULL(record);
    TEST_ASSERT_EQUAL_INT8(-105, record->rssi);
}

void test_readvertisement_updates_rssi(void) {
    advertise(DEVICE_A, -80, true);
    advertise(DEVICE_A, -40, true);

    TEST_ASSERT_EQUAL_UINT8(1, controller.getRegistry().count());
    TEST_ASSERT_EQUAL_INT8(-40, controller.getRegistry().find(DEVICE_A)->rssi);
}

void test_unbonded_device_pruned_after_silence(void) {
    advertise(DEVICE_A, -55, true);
    expireTimers();
    TEST_ASSERT_EQUAL_UINT8(0, controller.getRegistry().count());
}

void test_bonded_device_never_pruned(void) {
    advertise(DEVICE_A, -55, true);
    TEST_ASSERT_TRUE(controller.connect(DEVICE_A));
    connected(DEVICE_A);
    disconnected(DEVICE_A);

    expireTimers();

    const DeviceRecord* record = controller.getRegistry().find(DEVICE_A);
    TEST_ASSERT_NOT_NULL(record);
    TEST_ASSERT_FALSE(record->connected);
    TEST_ASSERT_TRUE(record->bonded);
}

void test_bonded_device_qualifies_without_manufacturer_data(void) {
    BondSet bonds;
    bonds.insert(DEVICE_B);
    bondStore.saveIdentifiers(bonds);
    controller.begin(&transport, &bondStore, &scheduler);

    advertise(DEVICE_B, -70, false);

    const DeviceRecord* record = controller.getRegistry().find(DEVICE_B);
    TEST_ASSERT_NOT_NULL(record);
    TEST_ASSERT_TRUE(record->bonded);
}

void test_powered_on_starts_scan(void) {
    TransportEvent event;
    event.type = TransportEventType::POWERED_ON;
    controller.handleEvent(event);
    TEST_ASSERT_EQUAL_UINT8(1, transport.scanCount);
}

void test_sort_by_signal_strongest_first(void) {
    advertise(DEVICE_A, -80, true);
    advertise(DEVICE_B, -40, true);

    controller.sortDevicesBySignal();

    TEST_ASSERT_EQUAL_STRING(DEVICE_B, controller.getRegistry().at(0).identifier);
    TEST_ASSERT_EQUAL_STRING(DEVICE_A, controller.getRegistry().at(1).identifier);
}

// =============================================================================
// BONDING
// =============================================================================

void test_connect_bonds_and_persists(void) {
    advertise(DEVICE_A, -55, true);
    TEST_ASSERT_TRUE(controller.connect(DEVICE_A));

    TEST_ASSERT_EQUAL_size_t(1, transport.connects.size());
    TEST_ASSERT_TRUE(controller.isBonded(DEVICE_A));
    TEST_ASSERT_TRUE(controller.getRegistry().find(DEVICE_A)->bonded);

    BondSet stored;
    TEST_ASSERT_TRUE(bondStore.loadIdentifiers(stored));
    TEST_ASSERT_EQUAL_size_t(1, stored.count(DEVICE_A));
}

void test_connect_unknown_device_rejected(void) {
    TEST_ASSERT_FALSE(controller.connect(DEVICE_A));
    TEST_ASSERT_EQUAL_size_t(0, transport.connects.size());
}

void test_bonds_reloaded_on_begin(void) {
    advertise(DEVICE_A, -55, true);
    controller.connect(DEVICE_A);

    controller.begin(&transport, &bondStore, &scheduler);

    TEST_ASSERT_TRUE(controller.isBonded(DEVICE_A));
    TEST_ASSERT_EQUAL_UINT8(0, controller.getRegistry().count());
}

void test_disconnect_removes_unbonded_record(void) {
    advertise(DEVICE_A, -55, true);
    TEST_ASSERT_TRUE(controller.disconnect(DEVICE_A));

    TEST_ASSERT_EQUAL_size_t(1, transport.cancels.size());
    TEST_ASSERT_NULL(controller.getRegistry().find(DEVICE_A));
}

void test_disconnect_with_identifier_from_registry(void) {
    advertise(DEVICE_A, -55, true);
    advertise(DEVICE_B, -65, true);

    // Identifier storage is shifted by the removal
    const char* first = controller.getRegistry().at(0).identifier;
    TEST_ASSERT_TRUE(controller.disconnect(first));

    TEST_ASSERT_EQUAL_size_t(1, transport.cancels.size());
    TEST_ASSERT_EQUAL_STRING(DEVICE_A, transport.cancels[0].c_str());
    TEST_ASSERT_EQUAL_UINT8(1, controller.getRegistry().count());
    TEST_ASSERT_NULL(controller.getRegistry().find(DEVICE_A));
    TEST_ASSERT_NOT_NULL(controller.getRegistry().find(DEVICE_B));
}

void test_disconnect_keeps_bonded_record(void) {
    advertise(DEVICE_A, -55, true);
    controller.connect(DEVICE_A);
    TEST_ASSERT_TRUE(controller.disconnect(DEVICE_A));

    const DeviceRecord* record = controller.getRegistry().find(DEVICE_A);
    TEST_ASSERT_NOT_NULL(record);
    TEST_ASSERT_FALSE(record->connected);
}

void test_unbond_forgets_and_allows_pruning(void) {
    advertise(DEVICE_A, -55, true);
    controller.connect(DEVICE_A);
    controller.disconnect(DEVICE_A);

    TEST_ASSERT_TRUE(controller.unbond(DEVICE_A));
    TEST_ASSERT_FALSE(controller.isBonded(DEVICE_A));

    BondSet stored;
    bondStore.loadIdentifiers(stored);
    TEST_ASSERT_EQUAL_size_t(0, stored.size());

    expireTimers();
    TEST_ASSERT_NULL(controller.getRegistry().find(DEVICE_A));
}

void test_unbond_unknown_identifier_rejected(void) {
    TEST_ASSERT_FALSE(controller.unbond(DEVICE_A));
}

// =============================================================================
// SESSION SETUP
// =============================================================================

void test_connected_event_starts_service_discovery(void) {
    advertise(DEVICE_A, -55, true);
    connected(DEVICE_A);

    TEST_ASSERT_TRUE(controller.isConnected());
    TEST_ASSERT_EQUAL_STRING(DEVICE_A, controller.getConnectedIdentifier());
    TEST_ASSERT_EQUAL_size_t(1, transport.serviceDiscoveries.size());
    TEST_ASSERT_TRUE(controller.getRegistry().find(DEVICE_A)->connected);
}

void test_services_discovered_requests_characteristics(void) {
    connected(DEVICE_A);

    TransportEvent event;
    event.type = TransportEventType::SERVICES_DISCOVERED;
    const uint8_t indices[] = {0, 1, 2};
    event.setData(indices, sizeof(indices));
    controller.handleEvent(event);

    TEST_ASSERT_EQUAL_size_t(3, transport.characteristicDiscoveries.size());
}

void test_binding_issues_root_listing(void) {
    advertise(DEVICE_A, -55, true);
    connected(DEVICE_A);
    bindAll();

    TEST_ASSERT_TRUE(controller.isLinkReady());
    TEST_ASSERT_TRUE(transport.notifyEnabled[channelIndex(Channel::NOTIFY)]);
    TEST_ASSERT_TRUE(transport.notifyEnabled[channelIndex(Channel::TIMING_RESULT)]);

    TEST_ASSERT_EQUAL_size_t(1, transport.reads.size());
    TEST_ASSERT_EQUAL(Channel::WRITE, transport.reads[0]);

    std::vector<FakeTransport::Write> requests = transport.writesWithOpcode(OP_LIST_DIR);
    TEST_ASSERT_EQUAL_size_t(1, requests.size());
    TEST_ASSERT_EQUAL(Channel::WRITE, requests[0].channel);
    TEST_ASSERT_TRUE(controller.getListing().isAwaitingResponse());
}

void test_partial_binding_waits_for_both_channels(void) {
    connected(DEVICE_A);
    const char* txOnly[] = {FLYSIGHT_CRS_TX_UUID};
    characteristics(txOnly, 1);

    TEST_ASSERT_FALSE(controller.isLinkReady());
    TEST_ASSERT_EQUAL_size_t(0, transport.writesWithOpcode(OP_LIST_DIR).size());

    const char* rxOnly[] = {FLYSIGHT_CRS_RX_UUID};
    characteristics(rxOnly, 1);
    TEST_ASSERT_EQUAL_size_t(1, transport.writesWithOpcode(OP_LIST_DIR).size());
}

void test_disconnect_event_resets_session(void) {
    establishSession(DEVICE_A);
    TEST_ASSERT_TRUE(controller.changeDirectory("TRACKS"));
    deliverEntry("A.CSV", 10, false);

    disconnected(DEVICE_A);

    TEST_ASSERT_FALSE(controller.isConnected());
    TEST_ASSERT_FALSE(controller.isLinkReady());
    TEST_ASSERT_EQUAL_STRING("/", controller.getListing().getPathString().c_str());
    TEST_ASSERT_EQUAL_size_t(0, controller.getListing().getEntries().size());
}

// =============================================================================
// ROUTING
// =============================================================================

void test_notify_values_reach_listing(void) {
    establishSession(DEVICE_A);

    TEST_ASSERT_FALSE(controller.getListing().isAwaitingResponse());
    TEST_ASSERT_EQUAL_size_t(1, controller.getListing().getEntries().size());
    TEST_ASSERT_EQUAL_STRING("TRACKS", controller.getListing().getEntries()[0].name);
}

void test_timing_result_reaches_timing_control(void) {
    establishSession(DEVICE_A);
    TEST_ASSERT_TRUE(controller.sendStartCommand());

    const uint8_t result[] = {0xE8, 0x07, 5, 25, 14, 30, 59, 0xE7, 0x03};
    notifyValue(Channel::TIMING_RESULT, result, sizeof(result));

    TEST_ASSERT_TRUE(controller.getTiming().hasResult());
    TEST_ASSERT_EQUAL(TimingState::IDLE, controller.getTiming().getState());
}

void test_timing_rejected_before_binding(void) {
    TEST_ASSERT_FALSE(controller.sendStartCommand());
    TEST_ASSERT_FALSE(controller.sendCancelCommand());
    TEST_ASSERT_EQUAL_size_t(0, transport.writes.size());
}

// =============================================================================
// DOWNLOADS
// =============================================================================

void test_download_resolves_path_and_size(void) {
    establishSession(DEVICE_A);
    TEST_ASSERT_TRUE(controller.changeDirectory("TRACKS"));
    deliverEntry("A.CSV", 6, false);

    TEST_ASSERT_TRUE(controller.downloadFile("A.CSV", onDownload, nullptr));

    std::vector<FakeTransport::Write> requests = transport.writesWithOpcode(OP_GET_FILE);
    TEST_ASSERT_EQUAL_size_t(1, requests.size());
    std::string path(requests[0].data.begin() + 9, requests[0].data.end());
    TEST_ASSERT_EQUAL_STRING("/TRACKS/A.CSV", path.c_str());
    TEST_ASSERT_EQUAL_UINT32(6, controller.getTransfer().getExpectedSize());
    TEST_ASSERT_FALSE(controller.getListing().isAttached());

    deliverData(0, "abc");
    deliverData(1, "def");
    deliverData(2, nullptr);

    TEST_ASSERT_EQUAL_UINT8(1, downloadCount);
    TEST_ASSERT_EQUAL(TransferOutcome::SUCCESS, downloadOutcome);
    TEST_ASSERT_EQUAL_MEMORY("abcdef", downloadData.data(), 6);
    TEST_ASSERT_EQUAL_size_t(1, controller.getListing().getEntries().size());
}

void test_download_busy_while_listing_awaited(void) {
    advertise(DEVICE_A, -55, true);
    connected(DEVICE_A);
    bindAll();

    TEST_ASSERT_FALSE(controller.downloadFile("A.CSV", onDownload, nullptr));
    TEST_ASSERT_EQUAL(TransferOutcome::BUSY, downloadOutcome);
    TEST_ASSERT_EQUAL_size_t(0, transport.writesWithOpcode(OP_GET_FILE).size());
}

void test_download_without_connection_not_connected(void) {
    TEST_ASSERT_FALSE(controller.downloadFile("/A.CSV", onDownload, nullptr));
    TEST_ASSERT_EQUAL_UINT8(1, downloadCount);
    TEST_ASSERT_EQUAL(TransferOutcome::NOT_CONNECTED, downloadOutcome);
}

void test_directory_operations_rejected_during_transfer(void) {
    establishSession(DEVICE_A);
    TEST_ASSERT_TRUE(controller.downloadFile("/A.CSV", onDownload, nullptr));

    TEST_ASSERT_FALSE(controller.changeDirectory("TRACKS"));
    TEST_ASSERT_FALSE(controller.goUp());
    TEST_ASSERT_FALSE(controller.refreshListing());
}

void test_disconnect_fails_active_download(void) {
    establishSession(DEVICE_A);
    controller.downloadFile("/A.CSV", onDownload, nullptr);
    deliverData(0, "abc");

    disconnected(DEVICE_A);

    TEST_ASSERT_EQUAL_UINT8(1, downloadCount);
    TEST_ASSERT_EQUAL(TransferOutcome::DISCONNECTED, downloadOutcome);
    TEST_ASSERT_FALSE(controller.getTransfer().isActive());
}

void test_notify_error_fails_download(void) {
    establishSession(DEVICE_A);
    controller.downloadFile("/A.CSV", onDownload, nullptr);

    notifyValue(Channel::NOTIFY, nullptr, 0, 0x0E);

    TEST_ASSERT_EQUAL(TransferOutcome::TRANSPORT_ERROR, downloadOutcome);
}

void test_cancel_download(void) {
    establishSession(DEVICE_A);
    controller.downloadFile("/A.CSV", onDownload, nullptr);

    TEST_ASSERT_TRUE(controller.cancelDownload());
    TEST_ASSERT_EQUAL(TransferOutcome::CANCELLED, downloadOutcome);
    TEST_ASSERT_EQUAL_size_t(1, transport.writesWithOpcode(OP_CANCEL_TRANSFER).size());
    TEST_ASSERT_FALSE(controller.cancelDownload());
}

// =============================================================================
// TEST RUNNER
// =============================================================================

int main(int argc, char **argv) {
    UNITY_BEGIN();

    // Discovery
    RUN_TEST(test_flysight_advertisement_adds_record);
    RUN_TEST(test_other_manufacturer_ignored);
    RUN_TEST(test_weak_signal_still_registered);
    RUN_TEST(test_readvertisement_updates_rssi);
    RUN_TEST(test_unbonded_device_pruned_after_silence);
    RUN_TEST(test_bonded_device_never_pruned);
    RUN_TEST(test_bonded_device_qualifies_without_manufacturer_data);
    RUN_TEST(test_powered_on_starts_scan);
    RUN_TEST(test_sort_by_signal_strongest_first);

    // Bonding
    RUN_TEST(test_connect_bonds_and_persists);
    RUN_TEST(test_connect_unknown_device_rejected);
    RUN_TEST(test_bonds_reloaded_on_begin);
    RUN_TEST(test_disconnect_removes_unbonded_record);
    RUN_TEST(test_disconnect_with_identifier_from_registry);
    RUN_TEST(test_disconnect_keeps_bonded_record);
    RUN_TEST(test_unbond_forgets_and_allows_pruning);
    RUN_TEST(test_unbond_unknown_identifier_rejected);

    // Session setup
    RUN_TEST(test_connected_event_starts_service_discovery);
    RUN_TEST(test_services_discovered_requests_characteristics);
    RUN_TEST(test_binding_issues_root_listing);
    RUN_TEST(test_partial_binding_waits_for_both_channels);
    RUN_TEST(test_disconnect_event_resets_session);

    // Routing
    RUN_TEST(test_notify_values_reach_listing);
    RUN_TEST(test_timing_result_reaches_timing_control);
    RUN_TEST(test_timing_rejected_before_binding);

    // Downloads
    RUN_TEST(test_download_resolves_path_and_size);
    RUN_TEST(test_download_busy_while_listing_awaited);
    RUN_TEST(test_download_without_connection_not_connected);
    RUN_TEST(test_directory_operations_rejected_during_transfer);
    RUN_TEST(test_disconnect_fails_active_download);
    RUN_TEST(test_notify_error_fails_download);
    RUN_TEST(test_cancel_download);

    return UNITY_END();
}
