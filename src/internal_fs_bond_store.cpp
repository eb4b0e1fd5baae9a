/**
 * @file internal_fs_bond_store.cpp
 * @brief Bond set persisted to nRF52 internal flash - Implementation
 * @version 1.0.0
 */

#include "internal_fs_bond_store.h"
#include <Adafruit_LittleFS.h>
#include <InternalFileSystem.h>

using namespace Adafruit_LittleFS_Namespace;

// Longest accepted line; longer lines are skipped
static constexpr size_t MAX_LINE_LEN = 64;

InternalFsBondStore::InternalFsBondStore(const char* path) :
    _path(path),
    _mounted(false)
{
}

bool InternalFsBondStore::begin() {
    _mounted = InternalFS.begin();
    if (!_mounted) {
        Serial.println(F("[BOND] ERROR: Internal filesystem mount failed"));
    }
    return _mounted;
}

bool InternalFsBondStore::loadIdentifiers(BondSet& out) {
    out.clear();

    if (!_mounted) {
        return false;
    }

    if (!InternalFS.exists(_path)) {
        Serial.println(F("[BOND] No bond file - starting with empty set"));
        return true;
    }

    File file = InternalFS.open(_path, FILE_O_READ);
    if (!file) {
        Serial.printf("[BOND] ERROR: Cannot open %s\n", _path);
        return false;
    }

    char line[MAX_LINE_LEN + 1];
    size_t lineLength = 0;
    bool overflow = false;

    while (file.available()) {
        int c = file.read();
        if (c < 0) {
            break;
        }

        if (c == '\n' || c == '\r') {
            if (lineLength > 0 && !overflow) {
                line[lineLength] = '\0';
                out.insert(std::string(line));
            }
            lineLength = 0;
            overflow = false;
            continue;
        }

        if (lineLength < MAX_LINE_LEN) {
            line[lineLength++] = static_cast<char>(c);
        } else {
            overflow = true;
        }
    }

    // Final line without trailing newline
    if (lineLength > 0 && !overflow) {
        line[lineLength] = '\0';
        out.insert(std::string(line));
    }

    file.close();
    Serial.printf("[BOND] Loaded %u bonded device(s)\n", (unsigned)out.size());
    return true;
}

bool InternalFsBondStore::saveIdentifiers(const BondSet& identifiers) {
    if (!_mounted) {
        return false;
    }

    // FILE_O_WRITE appends on LittleFS; remove first to truncate
    if (InternalFS.exists(_path)) {
        InternalFS.remove(_path);
    }

    File file = InternalFS.open(_path, FILE_O_WRITE);
    if (!file) {
        Serial.printf("[BOND] ERROR: Cannot write %s\n", _path);
        return false;
    }

    bool ok = true;
    for (const std::string& id : identifiers) {
        size_t written = file.write(reinterpret_cast<const uint8_t*>(id.c_str()), id.size());
        written += file.write(static_cast<uint8_t>('\n'));
        if (written != id.size() + 1) {
            ok = false;
            break;
        }
    }

    file.close();

    if (!ok) {
        Serial.println(F("[BOND] ERROR: Short write - bond file incomplete"));
        return false;
    }

    Serial.printf("[BOND] Saved %u bonded device(s)\n", (unsigned)identifiers.size());
    return true;
}

bool InternalFsBondStore::erase() {
    if (!_mounted) {
        return false;
    }
    if (!InternalFS.exists(_path)) {
        return true;
    }
    return InternalFS.remove(_path);
}
