/**
 * @file config.h
 * @brief FlyLink configuration - compile-time constants
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * Every value here is a default; override with a -D build flag.
 */

#ifndef CONFIG_H
#define CONFIG_H

// =============================================================================
// FIRMWARE
// =============================================================================

#ifndef FIRMWARE_VERSION
#define FIRMWARE_VERSION "1.0.0"
#endif

#ifndef BLE_NAME
#define BLE_NAME "FlyLink"
#endif

#ifndef SERIAL_BAUD
#define SERIAL_BAUD 115200
#endif

// =============================================================================
// DEVICE DISCOVERY
// =============================================================================

// Manufacturer identifier advertised by FlySight devices (little-endian in ADV)
#ifndef FLYSIGHT_MANUFACTURER_ID
#define FLYSIGHT_MANUFACTURER_ID 0x09DB
#endif

// Unbonded devices not re-sighted within this window are dropped
#ifndef DISAPPEARANCE_TIMEOUT_MS
#define DISAPPEARANCE_TIMEOUT_MS 500
#endif

#ifndef MAX_REGISTRY_DEVICES
#define MAX_REGISTRY_DEVICES 16
#endif

// "AA:BB:CC:DD:EE:FF" + NUL
#define DEVICE_ID_LEN 18

#ifndef DEVICE_NAME_LEN
#define DEVICE_NAME_LEN 32
#endif

#define DEFAULT_DEVICE_NAME "Unnamed Device"

// =============================================================================
// GATT IDENTIFIERS
// =============================================================================

// Characteristics share the vendor base xxxxxxxx-8e22-4541-9d4c-21edae82ed19
#define FLYSIGHT_GNSS_PV_UUID       "00000000-8e22-4541-9d4c-21edae82ed19"
#define FLYSIGHT_CRS_TX_UUID        "00000001-8e22-4541-9d4c-21edae82ed19"
#define FLYSIGHT_CRS_RX_UUID        "00000002-8e22-4541-9d4c-21edae82ed19"
#define FLYSIGHT_START_CONTROL_UUID "00000003-8e22-4541-9d4c-21edae82ed19"
#define FLYSIGHT_START_RESULT_UUID  "00000004-8e22-4541-9d4c-21edae82ed19"

// Services hosting the characteristics (Bluefruit adapter only)
#ifndef FLYSIGHT_CRS_SERVICE_UUID
#define FLYSIGHT_CRS_SERVICE_UUID   "00000000-cc7a-482a-984a-7f2ed5b3e58f"
#endif
#ifndef FLYSIGHT_GNSS_SERVICE_UUID
#define FLYSIGHT_GNSS_SERVICE_UUID  "00000001-cc7a-482a-984a-7f2ed5b3e58f"
#endif
#ifndef FLYSIGHT_START_SERVICE_UUID
#define FLYSIGHT_START_SERVICE_UUID "00000002-cc7a-482a-984a-7f2ed5b3e58f"
#endif

// =============================================================================
// BLE LINK
// =============================================================================

#ifndef BLE_MTU
#define BLE_MTU 247
#endif

// Largest ATT payload for a single write or notification (MTU - 3)
#define BLE_MAX_ATT_PAYLOAD (BLE_MTU - 3)

// =============================================================================
// EVENT QUEUE
// =============================================================================

#ifndef EVENT_QUEUE_DEPTH
#define EVENT_QUEUE_DEPTH 16
#endif

#ifndef EVENT_MAX_PAYLOAD
#define EVENT_MAX_PAYLOAD BLE_MAX_ATT_PAYLOAD
#endif

// =============================================================================
// TIMERS
// =============================================================================

#ifndef MAX_SCHEDULED_TIMERS
#define MAX_SCHEDULED_TIMERS 20
#endif

// =============================================================================
// FILE TRANSFER
// =============================================================================

// Receiver-side stall timeout; 0 disables it (device retransmission only)
#ifndef XFER_RECEIVE_TIMEOUT_MS
#define XFER_RECEIVE_TIMEOUT_MS 0
#endif

// Per-packet transfer logs and discarded timing results
#ifndef XFER_VERBOSE_DEFAULT
#define XFER_VERBOSE_DEFAULT false
#endif

// =============================================================================
// PERSISTENCE
// =============================================================================

#ifndef BOND_STORE_FILE
#define BOND_STORE_FILE "/bonds.txt"
#endif

// =============================================================================
// OBSERVERS
// =============================================================================

#ifndef MAX_OBSERVERS
#define MAX_OBSERVERS 4
#endif

#endif // CONFIG_H
