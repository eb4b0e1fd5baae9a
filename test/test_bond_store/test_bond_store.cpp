/**
 * @file test_bond_store.cpp
 * @brief Unit tests for bond_store.h and internal_fs_bond_store.h/cpp
 */

#include <unity.h>
#include "bond_store.h"
#include "internal_fs_bond_store.h"

// =============================================================================
// TEST FIXTURES
// =============================================================================

static const char* TEST_BOND_FILE = "/test_bonds.txt";

static InternalFsBondStore flashStore(TEST_BOND_FILE);
static bool flashMounted = false;

void setUp(void) {
    if (flashMounted) {
        flashStore.erase();
    }
}

void tearDown(void) {
    if (flashMounted) {
        flashStore.erase();
    }
}

static BondSet sampleBonds() {
    BondSet bonds;
    bonds.insert("C4:11:22:33:44:55");
    bonds.insert("D9:AA:BB:CC:DD:EE");
    return bonds;
}

// =============================================================================
// MEMORY STORE
// =============================================================================

void test_memory_store_starts_empty(void) {
    MemoryBondStore store;
    BondSet loaded = sampleBonds();
    TEST_ASSERT_TRUE(store.loadIdentifiers(loaded));
    TEST_ASSERT_EQUAL_size_t(0, loaded.size());
}

void test_memory_store_replaces_set(void) {
    MemoryBondStore store;
    store.saveIdentifiers(sampleBonds());

    BondSet single;
    single.insert("E0:00:00:00:00:01");
    store.saveIdentifiers(single);

    BondSet loaded;
    store.loadIdentifiers(loaded);
    TEST_ASSERT_EQUAL_size_t(1, loaded.size());
    TEST_ASSERT_EQUAL_size_t(1, loaded.count("E0:00:00:00:00:01"));
}

// =============================================================================
// FLASH STORE
// =============================================================================

void test_flash_store_mounts(void) {
    flashMounted = flashStore.begin();
    TEST_ASSERT_TRUE(flashMounted);
    flashStore.erase();
}

void test_flash_store_missing_file_loads_empty(void) {
    TEST_ASSERT_TRUE(flashMounted);
    BondSet loaded = sampleBonds();
    TEST_ASSERT_TRUE(flashStore.loadIdentifiers(loaded));
    TEST_ASSERT_EQUAL_size_t(0, loaded.size());
}

void test_flash_store_persists_set(void) {
    TEST_ASSERT_TRUE(flashMounted);
    TEST_ASSERT_TRUE(flashStore.saveIdentifiers(sampleBonds()));

    BondSet loaded;
    TEST_ASSERT_TRUE(flashStore.loadIdentifiers(loaded));
    TEST_ASSERT_TRUE(loaded == sampleBonds());
}

void test_flash_store_save_truncates_previous(void) {
    TEST_ASSERT_TRUE(flashMounted);
    flashStore.saveIdentifiers(sampleBonds());

    BondSet single;
    single.insert("E0:00:00:00:00:01");
    TEST_ASSERT_TRUE(flashStore.saveIdentifiers(single));

    BondSet loaded;
    flashStore.loadIdentifiers(loaded);
    TEST_ASSERT_TRUE(loaded == single);
}

void test_unmounted_store_reports_failure(void) {
    InternalFsBondStore unmounted("/never_mounted.txt");
    BondSet loaded;
    TEST_ASSERT_FALSE(unmounted.loadIdentifiers(loaded));
    TEST_ASSERT_FALSE(unmounted.saveIdentifiers(sampleBonds()));
}

// =============================================================================
// TEST RUNNER
// =============================================================================

int main(int argc, char **argv) {
    UNITY_BEGIN();

    // Memory store
    RUN_TEST(test_memory_store_starts_empty);
    RUN_TEST(test_memory_store_replaces_set);

    // Flash store
    RUN_TEST(test_flash_store_mounts);
    RUN_TEST(test_flash_store_missing_file_loads_empty);
    RUN_TEST(test_flash_store_persists_set);
    RUN_TEST(test_flash_store_save_truncates_previous);
    RUN_TEST(test_unmounted_store_reports_failure);

    return UNITY_END();
}
