/**
 * @file wire_codec.cpp
 * @brief FlySight wire formats - Implementation
 * @version 1.0.0
 */

#include "wire_codec.h"
#include "config.h"
#include <string.h>

// =============================================================================
// CHANNEL UUID MAPPINGS
// =============================================================================

struct ChannelUuidMapping {
    Channel channel;
    const char* uuid;
};

static const ChannelUuidMapping CHANNEL_MAPPINGS[] = {
    { Channel::WRITE,          FLYSIGHT_CRS_RX_UUID },
    { Channel::NOTIFY,         FLYSIGHT_CRS_TX_UUID },
    { Channel::POSITION,       FLYSIGHT_GNSS_PV_UUID },
    { Channel::TIMING_CONTROL, FLYSIGHT_START_CONTROL_UUID },
    { Channel::TIMING_RESULT,  FLYSIGHT_START_RESULT_UUID }
};

static const size_t CHANNEL_MAPPINGS_COUNT = sizeof(CHANNEL_MAPPINGS) / sizeof(CHANNEL_MAPPINGS[0]);

static const char ATTRIBUTE_LETTERS[] = "rhsad";

// =============================================================================
// CALENDAR VALIDATION
// =============================================================================

static bool isLeapYear(uint16_t year) {
    return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

static uint8_t daysInMonth(uint16_t year, uint8_t month) {
    static const uint8_t DAYS[12] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return DAYS[month - 1];
}

bool isValidDateTime(const UtcTimestamp& ts) {
    if (ts.year < 1) return false;
    if (ts.month < 1 || ts.month > 12) return false;
    if (ts.day < 1 || ts.day > daysInMonth(ts.year, ts.month)) return false;
    if (ts.hour > 23) return false;
    if (ts.minute > 59) return false;
    if (ts.second > 59) return false;
    if (ts.millisecond > 999) return false;
    return true;
}

// =============================================================================
// PACKED DATE/TIME
// =============================================================================

bool decodePackedDateTime(uint16_t date, uint16_t time, UtcTimestamp& out) {
    UtcTimestamp ts;
    ts.year = static_cast<uint16_t>(((date >> 9) & 0x7F) + PACKED_EPOCH_YEAR);
    ts.month = static_cast<uint8_t>((date >> 5) & 0x0F);
    ts.day = static_cast<uint8_t>(date & 0x1F);
    ts.hour = static_cast<uint8_t>((time >> 11) & 0x1F);
    ts.minute = static_cast<uint8_t>((time >> 5) & 0x3F);
    ts.second = static_cast<uint8_t>((time & 0x1F) * 2);
    ts.millisecond = 0;

    if (!isValidDateTime(ts)) {
        return false;
    }

    out = ts;
    return true;
}

bool encodePackedDateTime(const UtcTimestamp& ts, uint16_t& date, uint16_t& time) {
    if (!isValidDateTime(ts)) {
        return false;
    }
    if (ts.year < PACKED_EPOCH_YEAR || ts.year > PACKED_MAX_YEAR) {
        return false;
    }

    date = static_cast<uint16_t>(((ts.year - PACKED_EPOCH_YEAR) << 9) |
                                 (ts.month << 5) |
                                 ts.day);
    time = static_cast<uint16_t>((ts.hour << 11) |
                                 (ts.minute << 5) |
                                 (ts.second / 2));
    return true;
}

// =============================================================================
// TEXT
// =============================================================================

bool isValidUtf8(const uint8_t* data, size_t length) {
    size_t i = 0;
    while (i < length) {
        uint8_t c = data[i];

        if (c < 0x80) {
            i++;
            continue;
        }

        size_t extra;
        uint32_t codepoint;
        uint32_t minimum;
        if ((c & 0xE0) == 0xC0) {
            extra = 1; codepoint = c & 0x1F; minimum = 0x80;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2; codepoint = c & 0x0F; minimum = 0x800;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3; codepoint = c & 0x07; minimum = 0x10000;
        } else {
            return false;  // Stray continuation byte or 0xF8..0xFF
        }

        if (i + extra >= length) {
            return false;  // Truncated sequence
        }

        for (size_t k = 1; k <= extra; k++) {
            uint8_t cc = data[i + k];
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            codepoint = (codepoint << 6) | (cc & 0x3F);
        }

        if (codepoint < minimum) return false;                          // Overlong
        if (codepoint > 0x10FFFF) return false;
        if (codepoint >= 0xD800 && codepoint <= 0xDFFF) return false;   // Surrogate

        i += extra + 1;
    }
    return true;
}

bool decodeFixedText(const uint8_t* field, size_t fieldLength, char* out, size_t outSize) {
    if (!field || !out || outSize < fieldLength + 1) {
        return false;
    }

    size_t textLength = 0;
    while (textLength < fieldLength && field[textLength] != 0) {
        textLength++;
    }

    if (textLength == 0) {
        return false;
    }
    if (!isValidUtf8(field, textLength)) {
        return false;
    }

    memcpy(out, field, textLength);
    out[textLength] = '\0';
    return true;
}

void formatAttributes(uint8_t attributes, char* out) {
    for (uint8_t i = 0; i < ATTR_LABEL_LEN - 1; i++) {
        out[i] = (attributes & (1 << i)) ? ATTRIBUTE_LETTERS[i] : '-';
    }
    out[ATTR_LABEL_LEN - 1] = '\0';
}

void DirectoryEntry::attributeLabel(char* out) const {
    formatAttributes(attributes, out);
}

// =============================================================================
// FRAME DECODERS
// =============================================================================

bool decodeDirectoryEntry(const uint8_t* data, size_t length, DirectoryEntry& out) {
    if (!data || length != DIR_ENTRY_FRAME_LEN) {
        return false;
    }

    DirectoryEntry entry;
    if (!decodeFixedText(data + DIR_ENTRY_NAME_OFFSET, DIR_ENTRY_NAME_LEN,
                         entry.name, sizeof(entry.name))) {
        return false;
    }

    uint16_t packedDate = readU16LE(data + DIR_ENTRY_DATE_OFFSET);
    uint16_t packedTime = readU16LE(data + DIR_ENTRY_TIME_OFFSET);
    if (!decodePackedDateTime(packedDate, packedTime, entry.modified)) {
        return false;
    }

    entry.size = readU32LE(data + DIR_ENTRY_SIZE_OFFSET);
    entry.attributes = data[DIR_ENTRY_ATTR_OFFSET];

    out = entry;
    return true;
}

bool decodeTimingResult(const uint8_t* data, size_t length, UtcTimestamp& out) {
    if (!data || length != TIMING_RESULT_FRAME_LEN) {
        return false;
    }

    UtcTimestamp ts;
    ts.year = readU16LE(data);
    ts.month = data[2];
    ts.day = data[3];
    ts.hour = data[4];
    ts.minute = data[5];
    ts.second = data[6];
    ts.millisecond = readU16LE(data + 7);

    if (!isValidDateTime(ts)) {
        return false;
    }

    out = ts;
    return true;
}

bool parseDataFrame(const uint8_t* data, size_t length, DataFrame& out) {
    if (!data || length < DATA_FRAME_HEADER_LEN || data[0] != OP_FILE_DATA) {
        return false;
    }

    out.sequence = data[1];
    out.payloadLength = length - DATA_FRAME_HEADER_LEN;
    out.payload = (out.payloadLength > 0) ? data + DATA_FRAME_HEADER_LEN : nullptr;
    return true;
}

// =============================================================================
// FRAME BUILDERS
// =============================================================================

size_t buildDirectoryRequest(const char* path, uint8_t* out, size_t outSize) {
    if (!path || !out) {
        return 0;
    }
    size_t pathLength = strlen(path);
    if (outSize < 1 + pathLength) {
        return 0;
    }

    out[0] = OP_LIST_DIR;
    memcpy(out + 1, path, pathLength);
    return 1 + pathLength;
}

size_t buildDownloadRequest(const char* path, uint8_t* out, size_t outSize,
                            uint32_t offset, uint32_t stride) {
    if (!path || !out) {
        return 0;
    }
    size_t pathLength = strlen(path);
    if (outSize < GET_FILE_HEADER_LEN + pathLength) {
        return 0;
    }

    out[0] = OP_GET_FILE;
    writeU32LE(out + 1, offset);
    writeU32LE(out + 5, stride);
    memcpy(out + GET_FILE_HEADER_LEN, path, pathLength);
    return GET_FILE_HEADER_LEN + pathLength;
}

size_t buildAck(uint8_t sequence, uint8_t* out, size_t outSize) {
    if (!out || outSize < 2) {
        return 0;
    }
    out[0] = OP_FILE_ACK;
    out[1] = sequence;
    return 2;
}

static size_t buildSingleByte(uint8_t opcode, uint8_t* out, size_t outSize) {
    if (!out || outSize < 1) {
        return 0;
    }
    out[0] = opcode;
    return 1;
}

size_t buildCancelTransfer(uint8_t* out, size_t outSize) {
    return buildSingleByte(OP_CANCEL_TRANSFER, out, outSize);
}

size_t buildStartTiming(uint8_t* out, size_t outSize) {
    return buildSingleByte(OP_START_TIMING, out, outSize);
}

size_t buildCancelTiming(uint8_t* out, size_t outSize) {
    return buildSingleByte(OP_CANCEL_TIMING, out, outSize);
}

bool encodeDirectoryEntry(const DirectoryEntry& entry, uint8_t* out, size_t outSize) {
    if (!out || outSize < DIR_ENTRY_FRAME_LEN) {
        return false;
    }

    size_t nameLength = strlen(entry.name);
    if (nameLength == 0 || nameLength > DIR_ENTRY_NAME_LEN) {
        return false;
    }

    uint16_t packedDate;
    uint16_t packedTime;
    if (!encodePackedDateTime(entry.modified, packedDate, packedTime)) {
        return false;
    }

    memset(out, 0, DIR_ENTRY_FRAME_LEN);
    writeU32LE(out + DIR_ENTRY_SIZE_OFFSET, entry.size);
    writeU16LE(out + DIR_ENTRY_DATE_OFFSET, packedDate);
    writeU16LE(out + DIR_ENTRY_TIME_OFFSET, packedTime);
    out[DIR_ENTRY_ATTR_OFFSET] = entry.attributes;
    memcpy(out + DIR_ENTRY_NAME_OFFSET, entry.name, nameLength);
    return true;
}

// =============================================================================
// UUID HELPERS
// =============================================================================

static int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool parseUuid(const char* str, uint8_t* out) {
    if (!str || !out) {
        return false;
    }

    size_t byteIndex = 0;
    size_t pos = 0;
    while (str[pos] != '\0' && byteIndex < 16) {
        if (str[pos] == '-') {
            if (pos != 8 && pos != 13 && pos != 18 && pos != 23) {
                return false;
            }
            pos++;
            continue;
        }
        int hi = hexValue(str[pos]);
        int lo = (str[pos + 1] != '\0') ? hexValue(str[pos + 1]) : -1;
        if (hi < 0 || lo < 0) {
            return false;
        }
        out[byteIndex++] = static_cast<uint8_t>((hi << 4) | lo);
        pos += 2;
    }

    return byteIndex == 16 && str[pos] == '\0';
}

Channel channelForUuid(const uint8_t* uuid) {
    if (!uuid) {
        return Channel::NONE;
    }

    uint8_t candidate[16];
    for (size_t i = 0; i < CHANNEL_MAPPINGS_COUNT; i++) {
        if (parseUuid(CHANNEL_MAPPINGS[i].uuid, candidate) &&
            memcmp(candidate, uuid, sizeof(candidate)) == 0) {
            return CHANNEL_MAPPINGS[i].channel;
        }
    }
    return Channel::NONE;
}
