/**
 * @file directory_listing.cpp
 * @brief Remote directory enumeration - Implementation
 * @version 1.0.0
 */

#include "directory_listing.h"
#include <algorithm>
#include <string.h>

// Opcode + longest path accepted in one ATT write
static constexpr size_t MAX_REQUEST_LEN = BLE_MAX_ATT_PAYLOAD;

// =============================================================================
// CONSTRUCTOR / INIT
// =============================================================================

DirectoryListing::DirectoryListing() :
    _transport(nullptr),
    _observers(nullptr),
    _linkReady(false),
    _awaiting(false),
    _attached(false),
    _completeCallback(nullptr),
    _completeContext(nullptr)
{
}

void DirectoryListing::begin(BleTransport* transport, ObserverList* observers) {
    _transport = transport;
    _observers = observers;
    _path.clear();
    _entries.clear();
    _awaiting = false;
    _attached = false;
}

void DirectoryListing::setCompleteCallback(ListingCompleteCallback callback, void* context) {
    _completeCallback = callback;
    _completeContext = context;
}

// =============================================================================
// REQUESTS
// =============================================================================

bool DirectoryListing::canRequest() const {
    if (_awaiting) {
        Serial.println(F("[DIR] Request rejected - awaiting response"));
        return false;
    }
    if (!_linkReady || !_transport) {
        Serial.println(F("[DIR] Request rejected - not connected"));
        return false;
    }
    return true;
}

bool DirectoryListing::changeDirectory(const char* segment) {
    if (!segment || segment[0] == '\0' || strchr(segment, '/') != nullptr) {
        Serial.println(F("[DIR] Invalid directory name"));
        return false;
    }
    if (!canRequest()) {
        return false;
    }

    _path.push_back(segment);
    if (!requestListing()) {
        // Path stays on the directory the entries belong to
        _path.pop_back();
        return false;
    }
    notifyObservers(ObservedChange::PATH);
    return true;
}

bool DirectoryListing::goUp() {
    if (_path.empty()) {
        return false;
    }
    if (!canRequest()) {
        return false;
    }

    _path.pop_back();
    notifyObservers(ObservedChange::PATH);
    return requestListing();
}

bool DirectoryListing::requestListing() {
    if (!canRequest()) {
        return false;
    }

    std::string path = getPathString();
    uint8_t frame[MAX_REQUEST_LEN];
    size_t frameLength = buildDirectoryRequest(path.c_str(), frame, sizeof(frame));
    if (frameLength == 0) {
        Serial.printf("[DIR] Path too long: %s\n", path.c_str());
        return false;
    }

    _entries.clear();
    _awaiting = true;
    _attached = true;
    notifyObservers(ObservedChange::LISTING);

    // Notify may have been turned off by a completed transfer
    if (!_transport->setNotify(true, Channel::NOTIFY)) {
        Serial.println(F("[DIR] ERROR: Cannot enable notifications"));
        resolve(ListingOutcome::TRANSPORT_ERROR);
        return false;
    }

    if (!_transport->write(frame, frameLength, Channel::WRITE, false)) {
        Serial.println(F("[DIR] ERROR: Listing request write failed"));
        resolve(ListingOutcome::TRANSPORT_ERROR);
        return false;
    }

    Serial.printf("[DIR] Listing %s\n", path.c_str());
    return true;
}

// =============================================================================
// INBOUND
// =============================================================================

bool DirectoryListing::onNotification(const uint8_t* data, size_t length) {
    if (!_attached) {
        return false;
    }

    DirectoryEntry entry;
    bool decoded = decodeDirectoryEntry(data, length, entry);

    if (decoded) {
        _entries.push_back(entry);
        sortEntries(_entries);
        notifyObservers(ObservedChange::LISTING);
    }

    // Cleared by any inbound value, decoded or not
    if (_awaiting) {
        resolve(ListingOutcome::COMPLETE);
    }

    return decoded;
}

void DirectoryListing::onTransportError() {
    if (_awaiting) {
        Serial.println(F("[DIR] Transport error - listing aborted"));
        resolve(ListingOutcome::TRANSPORT_ERROR);
    }
}

void DirectoryListing::detach() {
    _attached = false;
}

void DirectoryListing::reset() {
    _attached = false;

    bool pathChanged = !_path.empty();
    _path.clear();
    _entries.clear();

    if (_awaiting) {
        resolve(ListingOutcome::DISCONNECTED);
    } else {
        notifyObservers(ObservedChange::LISTING);
    }

    if (pathChanged) {
        notifyObservers(ObservedChange::PATH);
    }
}

void DirectoryListing::resolve(ListingOutcome outcome) {
    _awaiting = false;
    if (outcome != ListingOutcome::COMPLETE) {
        _attached = false;
    }

    notifyObservers(ObservedChange::LISTING);

    if (_completeCallback) {
        _completeCallback(outcome, _completeContext);
    }
}

// =============================================================================
// STATE
// =============================================================================

std::string DirectoryListing::getPathString() const {
    std::string result = "/";
    for (size_t i = 0; i < _path.size(); i++) {
        if (i > 0) {
            result += '/';
        }
        result += _path[i];
    }
    return result;
}

const DirectoryEntry* DirectoryListing::findEntry(const char* name) const {
    if (!name) {
        return nullptr;
    }
    for (const DirectoryEntry& entry : _entries) {
        if (strcmp(entry.name, name) == 0) {
            return &entry;
        }
    }
    return nullptr;
}

void DirectoryListing::printListing() const {
    std::string path = getPathString();
    Serial.printf("[DIR] %s (%u entries)%s\n", path.c_str(), (unsigned)_entries.size(),
                  _awaiting ? " [awaiting]" : "");

    char attrs[ATTR_LABEL_LEN];
    char stamp[32];
    for (const DirectoryEntry& entry : _entries) {
        entry.attributeLabel(attrs);
        entry.modified.format(stamp, sizeof(stamp));
        Serial.printf("  %s %10lu  %s  %s%s\n",
            attrs, (unsigned long)entry.size, stamp, entry.name,
            entry.isDirectory() ? "/" : "");
    }
}

void DirectoryListing::notifyObservers(ObservedChange change) {
    if (_observers) {
        _observers->notify(change);
    }
}

// =============================================================================
// ORDERING
// =============================================================================

static char foldCase(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

bool DirectoryListing::entryLess(const DirectoryEntry& a, const DirectoryEntry& b) {
    if (a.isDirectory() != b.isDirectory()) {
        return a.isDirectory();
    }

    const char* pa = a.name;
    const char* pb = b.name;
    while (*pa && *pb) {
        char ca = foldCase(*pa);
        char cb = foldCase(*pb);
        if (ca != cb) {
            return static_cast<uint8_t>(ca) < static_cast<uint8_t>(cb);
        }
        pa++;
        pb++;
    }
    return *pa == '\0' && *pb != '\0';
}

void DirectoryListing::sortEntries(std::vector<DirectoryEntry>& entries) {
    std::stable_sort(entries.begin(), entries.end(), entryLess);
}
