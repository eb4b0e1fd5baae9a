/**
 * @file test_directory_listing.cpp
 * @brief Unit tests for directory_listing.h/cpp - Path state, requests, sorting
 */

#include <unity.h>
#include <string.h>
#include "directory_listing.h"
#include "fake_transport.h"

// =============================================================================
// TEST FIXTURES
// =============================================================================

static FakeTransport transport;
static ObserverList observers;
static DirectoryListing listing;

static uint8_t completeCount = 0;
static ListingOutcome lastOutcome = ListingOutcome::COMPLETE;

static void onComplete(ListingOutcome outcome, void* context) {
    (void)context;
    completeCount++;
    lastOutcome = outcome;
}

void setUp(void) {
    transport.reset();
    observers.clear();
    listing.begin(&transport, &observers);
    listing.setLinkReady(true);
    listing.setCompleteCallback(onComplete, nullptr);
    completeCount = 0;
    lastOutcome = ListingOutcome::COMPLETE;
}

void tearDown(void) {
    listing.setCompleteCallback(nullptr, nullptr);
}

static DirectoryEntry makeEntry(const char* name, bool directory) {
    DirectoryEntry entry;
    strncpy(entry.name, name, DIR_ENTRY_NAME_LEN);
    entry.name[DIR_ENTRY_NAME_LEN] = '\0';
    entry.size = directory ? 0 : 100;
    entry.modified = UtcTimestamp(2024, 5, 25, 10, 0, 0);
    entry.attributes = directory ? ATTR_DIRECTORY : ATTR_ARCHIVE;
    return entry;
}

static void deliverEntry(const char* name, bool directory) {
    uint8_t frame[DIR_ENTRY_FRAME_LEN];
    DirectoryEntry entry = makeEntry(name, directory);
    TEST_ASSERT_TRUE(encodeDirectoryEntry(entry, frame, sizeof(frame)));
    listing.onNotification(frame, sizeof(frame));
}

static std::string lastRequestPath() {
    std::vector<FakeTransport::Write> requests = transport.writesWithOpcode(OP_LIST_DIR);
    TEST_ASSERT_TRUE(requests.size() > 0);
    const std::vector<uint8_t>& data = requests.back().data;
    return std::string(data.begin() + 1, data.end());
}

// =============================================================================
// SORTING
// =============================================================================

void test_sort_directories_first_then_case_insensitive(void) {
    std::vector<DirectoryEntry> entries;
    entries.push_back(makeEntry("b.txt", false));
    entries.push_back(makeEntry("A", true));
    entries.push_back(makeEntry("a.txt", false));

    DirectoryListing::sortEntries(entries);

    TEST_ASSERT_EQUAL_STRING("A", entries[0].name);
    TEST_ASSERT_EQUAL_STRING("a.txt", entries[1].name);
    TEST_ASSERT_EQUAL_STRING("b.txt", entries[2].name);
}

void test_sort_prefix_orders_first(void) {
    TEST_ASSERT_TRUE(DirectoryListing::entryLess(makeEntry("LOG", false), makeEntry("log1", false)));
    TEST_ASSERT_FALSE(DirectoryListing::entryLess(makeEntry("log1", false), makeEntry("LOG", false)));
}

void test_listing_stays_sorted_after_each_insertion(void) {
    TEST_ASSERT_TRUE(listing.requestListing());
    deliverEntry("b.txt", false);
    deliverEntry("A", true);
    deliverEntry("a.txt", false);
    deliverEntry("Z", true);

    const std::vector<DirectoryEntry>& entries = listing.getEntries();
    TEST_ASSERT_EQUAL_size_t(4, entries.size());
    TEST_ASSERT_EQUAL_STRING("A", entries[0].name);
    TEST_ASSERT_EQUAL_STRING("Z", entries[1].name);
    TEST_ASSERT_EQUAL_STRING("a.txt", entries[2].name);
    TEST_ASSERT_EQUAL_STRING("b.txt", entries[3].name);
}

// =============================================================================
// REQUESTS
// =============================================================================

void test_request_writes_root_path_without_ack(void) {
    TEST_ASSERT_TRUE(listing.requestListing());

    TEST_ASSERT_EQUAL_size_t(1, transport.writes.size());
    TEST_ASSERT_EQUAL(Channel::WRITE, transport.writes[0].channel);
    TEST_ASSERT_FALSE(transport.writes[0].requireAck);
    TEST_ASSERT_EQUAL_STRING("/", lastRequestPath().c_str());
    TEST_ASSERT_TRUE(listing.isAwaitingResponse());
    TEST_ASSERT_TRUE(transport.notifyEnabled[channelIndex(Channel::NOTIFY)]);
}

void test_request_clears_previous_entries(void) {
    TEST_ASSERT_TRUE(listing.requestListing());
    deliverEntry("OLD.TXT", false);
    TEST_ASSERT_EQUAL_size_t(1, listing.getEntries().size());

    TEST_ASSERT_TRUE(listing.requestListing());
    TEST_ASSERT_EQUAL_size_t(0, listing.getEntries().size());
}

void test_change_directory_appends_segment(void) {
    TEST_ASSERT_TRUE(listing.changeDirectory("TRACKS"));
    TEST_ASSERT_EQUAL_STRING("/TRACKS", lastRequestPath().c_str());

    deliverEntry("24-05-25", true);
    TEST_ASSERT_TRUE(listing.changeDirectory("24-05-25"));
    TEST_ASSERT_EQUAL_STRING("/TRACKS/24-05-25", lastRequestPath().c_str());
    TEST_ASSERT_EQUAL_STRING("/TRACKS/24-05-25", listing.getPathString().c_str());
    TEST_ASSERT_EQUAL_size_t(2, listing.getPath().size());
}

void test_change_directory_rejected_while_awaiting(void) {
    TEST_ASSERT_TRUE(listing.requestListing());
    TEST_ASSERT_FALSE(listing.changeDirectory("TRACKS"));

    TEST_ASSERT_EQUAL_size_t(0, listing.getPath().size());
    TEST_ASSERT_EQUAL_size_t(1, transport.writes.size());
}

void test_go_up_rejected_while_awaiting(void) {
    TEST_ASSERT_TRUE(listing.changeDirectory("TRACKS"));
    TEST_ASSERT_FALSE(listing.goUp());
    TEST_ASSERT_EQUAL_size_t(1, listing.getPath().size());
}

void test_go_up_pops_segment(void) {
    TEST_ASSERT_TRUE(listing.changeDirectory("TRACKS"));
    deliverEntry("X", true);
    TEST_ASSERT_TRUE(listing.goUp());
    TEST_ASSERT_EQUAL_STRING("/", lastRequestPath().c_str());
    TEST_ASSERT_EQUAL_size_t(0, listing.getPath().size());
}

void test_go_up_at_root_sends_nothing(void) {
    TEST_ASSERT_FALSE(listing.goUp());
    TEST_ASSERT_EQUAL_size_t(0, transport.writes.size());
    TEST_ASSERT_FALSE(listing.isAwaitingResponse());
    TEST_ASSERT_EQUAL_size_t(0, listing.getPath().size());
}

void test_oversized_segment_leaves_path_and_entries(void) {
    TEST_ASSERT_TRUE(listing.requestListing());
    deliverEntry("TRACKS", true);
    size_t writesBefore = transport.writes.size();

    std::string longName(300, 'X');
    TEST_ASSERT_FALSE(listing.changeDirectory(longName.c_str()));

    TEST_ASSERT_EQUAL_size_t(writesBefore, transport.writes.size());
    TEST_ASSERT_EQUAL_size_t(0, listing.getPath().size());
    TEST_ASSERT_EQUAL_STRING("/", listing.getPathString().c_str());
    TEST_ASSERT_EQUAL_size_t(1, listing.getEntries().size());
    TEST_ASSERT_FALSE(listing.isAwaitingResponse());
}

void test_failed_change_directory_restores_path(void) {
    transport.failWrites = true;
    TEST_ASSERT_FALSE(listing.changeDirectory("TRACKS"));
    TEST_ASSERT_EQUAL_size_t(0, listing.getPath().size());
    TEST_ASSERT_EQUAL(ListingOutcome::TRANSPORT_ERROR, lastOutcome);
}

void test_change_directory_rejects_bad_segment(void) {
    TEST_ASSERT_FALSE(listing.changeDirectory(""));
    TEST_ASSERT_FALSE(listing.changeDirectory("A/B"));
    TEST_ASSERT_EQUAL_size_t(0, transport.writes.size());
}

void test_request_rejected_when_link_down(void) {
    listing.setLinkReady(false);
    TEST_ASSERT_FALSE(listing.requestListing());
    TEST_ASSERT_FALSE(listing.isAwaitingResponse());
    TEST_ASSERT_EQUAL_size_t(0, transport.writes.size());
}

void test_write_failure_resolves_transport_error(void) {
    transport.failWrites = true;
    TEST_ASSERT_FALSE(listing.requestListing());

    TEST_ASSERT_FALSE(listing.isAwaitingResponse());
    TEST_ASSERT_EQUAL_UINT8(1, completeCount);
    TEST_ASSERT_EQUAL(ListingOutcome::TRANSPORT_ERROR, lastOutcome);
}

// =============================================================================
// INBOUND
// =============================================================================

void test_first_value_clears_awaiting_flag(void) {
    TEST_ASSERT_TRUE(listing.requestListing());
    deliverEntry("A.TXT", false);

    TEST_ASSERT_FALSE(listing.isAwaitingResponse());
    TEST_ASSERT_EQUAL_UINT8(1, completeCount);
    TEST_ASSERT_EQUAL(ListingOutcome::COMPLETE, lastOutcome);
}

void test_undecodable_value_clears_flag_without_entry(void) {
    TEST_ASSERT_TRUE(listing.requestListing());
    const uint8_t junk[] = {0x10, 0x00, 'x'};
    TEST_ASSERT_FALSE(listing.onNotification(junk, sizeof(junk)));

    TEST_ASSERT_FALSE(listing.isAwaitingResponse());
    TEST_ASSERT_EQUAL_size_t(0, listing.getEntries().size());
}

void test_late_entries_still_decoded_after_flag_clears(void) {
    TEST_ASSERT_TRUE(listing.requestListing());
    deliverEntry("A.TXT", false);
    deliverEntry("B.TXT", false);

    TEST_ASSERT_EQUAL_size_t(2, listing.getEntries().size());
    TEST_ASSERT_EQUAL_UINT8(1, completeCount);
}

void test_detached_listing_ignores_values(void) {
    TEST_ASSERT_TRUE(listing.requestListing());
    deliverEntry("A.TXT", false);
    listing.detach();
    deliverEntry("B.TXT", false);

    TEST_ASSERT_FALSE(listing.isAttached());
    TEST_ASSERT_EQUAL_size_t(1, listing.getEntries().size());
}

void test_find_entry_by_name(void) {
    TEST_ASSERT_TRUE(listing.requestListing());
    deliverEntry("TRACK.CSV", false);

    const DirectoryEntry* entry = listing.findEntry("TRACK.CSV");
    TEST_ASSERT_NOT_NULL(entry);
    TEST_ASSERT_EQUAL_UINT32(100, entry->size);
    TEST_ASSERT_NULL(listing.findEntry("track.csv"));
}

void test_transport_error_resolves_outstanding_request(void) {
    TEST_ASSERT_TRUE(listing.requestListing());
    listing.onTransportError();

    TEST_ASSERT_FALSE(listing.isAwaitingResponse());
    TEST_ASSERT_EQUAL(ListingOutcome::TRANSPORT_ERROR, lastOutcome);
}

void test_reset_returns_to_root_and_reports_disconnect(void) {
    TEST_ASSERT_TRUE(listing.changeDirectory("TRACKS"));
    listing.reset();

    TEST_ASSERT_EQUAL_size_t(0, listing.getPath().size());
    TEST_ASSERT_EQUAL_size_t(0, listing.getEntries().size());
    TEST_ASSERT_FALSE(listing.isAwaitingResponse());
    TEST_ASSERT_EQUAL(ListingOutcome::DISCONNECTED, lastOutcome);
}

// =============================================================================
// TEST RUNNER
// =============================================================================

int main(int argc, char **argv) {
    UNITY_BEGIN();

    // Sorting
    RUN_TEST(test_sort_directories_first_then_case_insensitive);
    RUN_TEST(test_sort_prefix_orders_first);
    RUN_TEST(test_listing_stays_sorted_after_each_insertion);

    // Requests
    RUN_TEST(test_request_writes_root_path_without_ack);
    RUN_TEST(test_request_clears_previous_entries);
    RUN_TEST(test_change_directory_appends_segment);
    RUN_TEST(test_change_directory_rejected_while_awaiting);
    RUN_TEST(test_go_up_rejected_while_awaiting);
    RUN_TEST(test_go_up_pops_segment);
    RUN_TEST(test_go_up_at_root_sends_nothing);
    RUN_TEST(test_oversized_segment_leaves_path_and_entries);
    RUN_TEST(test_failed_change_directory_restores_path);
    RUN_TEST(test_change_directory_rejects_bad_segment);
    RUN_TEST(test_request_rejected_when_link_down);
    RUN_TEST(test_write_failure_resolves_transport_error);

    // Inbound
    RUN_TEST(test_first_value_clears_awaiting_flag);
    RUN_TEST(test_undecodable_value_clears_flag_without_entry);
    RUN_TEST(test_late_entries_still_decoded_after_flag_clears);
    RUN_TEST(test_detached_listing_ignores_values);
    RUN_TEST(test_find_entry_by_name);
    RUN_TEST(test_transport_error_resolves_outstanding_request);
    RUN_TEST(test_reset_returns_to_root_and_reports_disconnect);

    return UNITY_END();
}
