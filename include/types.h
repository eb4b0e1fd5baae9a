/**
 * @file types.h
 * @brief FlyLink shared types - channels, states, outcomes, timestamps
 * @version 1.0.0
 */

#ifndef TYPES_H
#define TYPES_H

#include <Arduino.h>
#include <stdint.h>

// =============================================================================
// GATT CHANNELS
// =============================================================================

/**
 * @brief Characteristic references used by the protocol layer
 *
 * WRITE is the device's CRS_RX (client writes requests),
 * NOTIFY is the device's CRS_TX (device pushes responses).
 */
enum class Channel : uint8_t {
    NONE = 0,
    WRITE,              // CRS_RX - directory / download / ack / cancel frames
    NOTIFY,             // CRS_TX - directory entries and file data
    POSITION,           // GNSS_PV - bound, unused
    TIMING_CONTROL,     // START_CONTROL - start / cancel
    TIMING_RESULT       // START_RESULT - 9-byte result
};

constexpr uint8_t CHANNEL_COUNT = 6;

inline uint8_t channelIndex(Channel channel) {
    return static_cast<uint8_t>(channel);
}

const char* channelToString(Channel channel);

// =============================================================================
// TIMING
// =============================================================================

enum class TimingState : uint8_t {
    IDLE = 0,
    COUNTING
};

enum class TimingTrigger : uint8_t {
    START_SENT = 0,
    CANCEL_SENT,
    RESULT_ACCEPTED,
    RESET
};

const char* timingStateToString(TimingState state);
const char* timingTriggerToString(TimingTrigger trigger);

// =============================================================================
// EXCHANGE OUTCOMES
// =============================================================================

enum class TransferOutcome : uint8_t {
    SUCCESS = 0,
    CANCELLED,
    NOT_CONNECTED,      // No connection or required channels unbound
    BUSY,               // Another transfer holds the notify channel
    TRANSPORT_ERROR,    // Write rejected or notification carried an error
    TIMEOUT,            // Receiver timeout elapsed without an in-order frame
    DISCONNECTED        // Link dropped mid-transfer
};

enum class ListingOutcome : uint8_t {
    COMPLETE = 0,
    TRANSPORT_ERROR,
    DISCONNECTED
};

const char* transferOutcomeToString(TransferOutcome outcome);
const char* listingOutcomeToString(ListingOutcome outcome);

// =============================================================================
// OBSERVABLE STATE
// =============================================================================

enum class ObservedChange : uint8_t {
    REGISTRY = 0,       // Device added, removed, re-sorted or RSSI update
    CONNECTION,         // Connected / disconnected / channels bound
    LISTING,            // Directory entries or awaiting flag
    PATH,               // Working directory changed
    TRANSFER_PROGRESS,  // Download progress advanced
    TRANSFER_STATE,     // Download started or resolved
    TIMING_STATE        // Timing state or result changed
};

const char* observedChangeToString(ObservedChange change);

// =============================================================================
// UTC TIMESTAMP
// =============================================================================

/**
 * @brief Broken-down UTC calendar time with millisecond precision
 */
struct UtcTimestamp {
    uint16_t year;
    uint8_t month;          // 1-12
    uint8_t day;            // 1-31
    uint8_t hour;           // 0-23
    uint8_t minute;         // 0-59
    uint8_t second;         // 0-59
    uint16_t millisecond;   // 0-999

    UtcTimestamp() :
        year(0), month(0), day(0),
        hour(0), minute(0), second(0),
        millisecond(0) {}

    UtcTimestamp(uint16_t y, uint8_t mo, uint8_t d,
                 uint8_t h = 0, uint8_t mi = 0, uint8_t s = 0, uint16_t ms = 0) :
        year(y), month(mo), day(d),
        hour(h), minute(mi), second(s),
        millisecond(ms) {}

    bool operator==(const UtcTimestamp& other) const {
        return year == other.year && month == other.month && day == other.day &&
               hour == other.hour && minute == other.minute && second == other.second &&
               millisecond == other.millisecond;
    }

    bool operator!=(const UtcTimestamp& other) const { return !(*this == other); }

    /**
     * @brief Milliseconds since 1970-01-01T00:00:00Z (proleptic Gregorian)
     */
    int64_t toUnixMillis() const;

    /**
     * @brief Format as "YYYY-MM-DDTHH:MM:SS.mmmZ"
     * @param buffer Output buffer (at least 25 bytes)
     */
    void format(char* buffer, size_t bufferSize) const;
};

#endif // TYPES_H
