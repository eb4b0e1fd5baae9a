/**
 * @file wire_codec.h
 * @brief FlySight wire formats - frame builders and fixed-layout decoders
 * @version 1.0.0
 *
 * Stateless encode/decode routines for the frames exchanged over the
 * CRS_RX / CRS_TX / START_CONTROL / START_RESULT characteristics.
 * All multi-byte integers are little-endian.
 *
 * Frames (client -> device):
 *   LIST_DIR       : 0x05 + UTF-8 path ("/" + segments joined by "/")
 *   GET_FILE       : 0x02 + offset u32 + stride u32 + UTF-8 path
 *   FILE_ACK       : 0x12 + seq u8
 *   CANCEL_XFER    : 0xFF
 *   START_TIMING   : 0x00   (START_CONTROL, write with response)
 *   CANCEL_TIMING  : 0x01   (START_CONTROL, write with response)
 *
 * Frames (device -> client):
 *   Directory entry (24 bytes):
 *     [0-2)   reserved
 *     [2-6)   size u32
 *     [6-8)   packed date u16  (year-1980:7 | month:4 | day:5)
 *     [8-10)  packed time u16  (hour:5 | minute:6 | second/2:5)
 *     [10]    attributes u8    (r h s a d, bit 0..4)
 *     [11-24) name, 13 bytes, NUL-padded UTF-8
 *   File data  : 0x10 + seq u8 + payload (no payload = end of file)
 *   Timing result (9 bytes):
 *     year u16, month u8, day u8, hour u8, minute u8, second u8, millisecond u16
 */

#ifndef WIRE_CODEC_H
#define WIRE_CODEC_H

#include <Arduino.h>
#include <stdint.h>
#include <stddef.h>
#include "types.h"

// =============================================================================
// OPCODES
// =============================================================================

constexpr uint8_t OP_START_TIMING    = 0x00;
constexpr uint8_t OP_CANCEL_TIMING   = 0x01;
constexpr uint8_t OP_GET_FILE        = 0x02;
constexpr uint8_t OP_LIST_DIR        = 0x05;
constexpr uint8_t OP_FILE_DATA       = 0x10;
constexpr uint8_t OP_FILE_ACK        = 0x12;
constexpr uint8_t OP_CANCEL_TRANSFER = 0xFF;

// =============================================================================
// LAYOUT CONSTANTS
// =============================================================================

constexpr size_t DIR_ENTRY_FRAME_LEN     = 24;
constexpr size_t DIR_ENTRY_SIZE_OFFSET   = 2;
constexpr size_t DIR_ENTRY_DATE_OFFSET   = 6;
constexpr size_t DIR_ENTRY_TIME_OFFSET   = 8;
constexpr size_t DIR_ENTRY_ATTR_OFFSET   = 10;
constexpr size_t DIR_ENTRY_NAME_OFFSET   = 11;
constexpr size_t DIR_ENTRY_NAME_LEN      = 13;

constexpr size_t TIMING_RESULT_FRAME_LEN = 9;
constexpr size_t DATA_FRAME_HEADER_LEN   = 2;
constexpr size_t GET_FILE_HEADER_LEN     = 9;   // opcode + offset + stride

constexpr uint16_t PACKED_EPOCH_YEAR     = 1980;
constexpr uint16_t PACKED_MAX_YEAR       = PACKED_EPOCH_YEAR + 127;

// =============================================================================
// ATTRIBUTES
// =============================================================================

constexpr uint8_t ATTR_READ_ONLY = 0x01;
constexpr uint8_t ATTR_HIDDEN    = 0x02;
constexpr uint8_t ATTR_SYSTEM    = 0x04;
constexpr uint8_t ATTR_ARCHIVE   = 0x08;
constexpr uint8_t ATTR_DIRECTORY = 0x10;

// "rhsad" + NUL
constexpr size_t ATTR_LABEL_LEN = 6;

// =============================================================================
// DECODED STRUCTURES
// =============================================================================

/**
 * @brief One remote directory entry
 */
struct DirectoryEntry {
    char name[DIR_ENTRY_NAME_LEN + 1];
    uint32_t size;
    UtcTimestamp modified;
    uint8_t attributes;

    DirectoryEntry() : size(0), attributes(0) {
        name[0] = '\0';
    }

    /**
     * @brief Entry is a directory (ATTR_DIRECTORY set)
     */
    bool isDirectory() const { return (attributes & ATTR_DIRECTORY) != 0; }

    /**
     * @brief Attribute flags as "rhsad" with '-' for clear bits
     */
    void attributeLabel(char* out) const;
};

/**
 * @brief View over a received file data frame
 *
 * payload points into the caller's buffer; valid only while it lives.
 */
struct DataFrame {
    uint8_t sequence;
    const uint8_t* payload;
    size_t payloadLength;

    DataFrame() : sequence(0), payload(nullptr), payloadLength(0) {}

    bool isEndOfFile() const { return payloadLength == 0; }
};

// =============================================================================
// INTEGER HELPERS
// =============================================================================

inline uint16_t readU16LE(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

inline uint32_t readU32LE(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

inline void writeU16LE(uint8_t* p, uint16_t value) {
    p[0] = static_cast<uint8_t>(value & 0xFF);
    p[1] = static_cast<uint8_t>(value >> 8);
}

inline void writeU32LE(uint8_t* p, uint32_t value) {
    p[0] = static_cast<uint8_t>(value & 0xFF);
    p[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
    p[2] = static_cast<uint8_t>((value >> 16) & 0xFF);
    p[3] = static_cast<uint8_t>((value >> 24) & 0xFF);
}

// =============================================================================
// FIELD DECODERS
// =============================================================================

/**
 * @brief Check that the fields form a real calendar date and time of day
 *
 * Month 1-12, day within the month (leap years honored), hour < 24,
 * minute < 60, second < 60, millisecond < 1000, year >= 1.
 */
bool isValidDateTime(const UtcTimestamp& ts);

/**
 * @brief Decode packed (FAT-style) date and time words
 * @return false if the fields do not form a valid calendar date/time
 */
bool decodePackedDateTime(uint16_t date, uint16_t time, UtcTimestamp& out);

/**
 * @brief Encode a timestamp into packed date and time words
 *
 * Seconds are truncated to 2-second resolution; milliseconds are dropped.
 * @return false if the timestamp is invalid or outside [1980, 2107]
 */
bool encodePackedDateTime(const UtcTimestamp& ts, uint16_t& date, uint16_t& time);

/**
 * @brief Strict UTF-8 validation (no overlongs, no surrogates, <= U+10FFFF)
 */
bool isValidUtf8(const uint8_t* data, size_t length);

/**
 * @brief Decode a fixed-length NUL-padded text field
 *
 * Text ends at the first NUL (or the field end). Fails on invalid UTF-8
 * or an empty result.
 *
 * @param out Output buffer, receives a NUL-terminated copy
 * @param outSize Must be at least fieldLength + 1
 */
bool decodeFixedText(const uint8_t* field, size_t fieldLength, char* out, size_t outSize);

/**
 * @brief Map attribute bits to "rhsad" labels ('-' where clear)
 * @param out Buffer of at least ATTR_LABEL_LEN bytes
 */
void formatAttributes(uint8_t attributes, char* out);

// =============================================================================
// FRAME DECODERS
// =============================================================================

/**
 * @brief Decode a 24-byte directory entry notification
 * @return false on wrong length, empty/invalid name, or invalid date/time
 */
bool decodeDirectoryEntry(const uint8_t* data, size_t length, DirectoryEntry& out);

/**
 * @brief Decode a 9-byte timing result notification
 * @return false on wrong length or invalid calendar fields
 */
bool decodeTimingResult(const uint8_t* data, size_t length, UtcTimestamp& out);

/**
 * @brief Parse a file data frame header
 * @return false if the tag is not OP_FILE_DATA or the frame is shorter than 2 bytes
 */
bool parseDataFrame(const uint8_t* data, size_t length, DataFrame& out);

// =============================================================================
// FRAME BUILDERS (return frame length, 0 if the buffer is too small)
// =============================================================================

size_t buildDirectoryRequest(const char* path, uint8_t* out, size_t outSize);
size_t buildDownloadRequest(const char* path, uint8_t* out, size_t outSize,
                            uint32_t offset = 0, uint32_t stride = 0);
size_t buildAck(uint8_t sequence, uint8_t* out, size_t outSize);
size_t buildCancelTransfer(uint8_t* out, size_t outSize);
size_t buildStartTiming(uint8_t* out, size_t outSize);
size_t buildCancelTiming(uint8_t* out, size_t outSize);

/**
 * @brief Encode a directory entry into its 24-byte wire form
 *
 * Used by the simulated peer in tests and by the serial console dump.
 * @return false if the name does not fit or the timestamp cannot be packed
 */
bool encodeDirectoryEntry(const DirectoryEntry& entry, uint8_t* out, size_t outSize);

// =============================================================================
// UUID HELPERS
// =============================================================================

/**
 * @brief Parse "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx" into 16 bytes (string order)
 */
bool parseUuid(const char* str, uint8_t* out);

/**
 * @brief Map a 16-byte UUID (string order) to the channel it identifies
 * @return Channel::NONE if the UUID is not one of the five FlySight characteristics
 */
Channel channelForUuid(const uint8_t* uuid);

#endif // WIRE_CODEC_H
