/**
 * @file directory_listing.h
 * @brief Remote directory enumeration over CRS_RX / CRS_TX
 * @version 1.0.0
 *
 * One request (0x05 + path) yields one 24-byte entry notification per
 * remote entry. The device sends no end-of-listing marker: the awaiting
 * flag clears after the first inbound value following a request, and
 * later entries of the same listing are still decoded while the decoder
 * stays attached. The decoder detaches when a file transfer takes over
 * the notify channel and re-attaches on the next request.
 */

#ifndef DIRECTORY_LISTING_H
#define DIRECTORY_LISTING_H

#include <Arduino.h>
#include <string>
#include <vector>
#include "ble_transport.h"
#include "observer_list.h"
#include "wire_codec.h"

/**
 * @brief Called when an outstanding listing request is resolved
 */
typedef void (*ListingCompleteCallback)(ListingOutcome outcome, void* context);

/**
 * @class DirectoryListing
 * @brief Working directory, current entries, and the listing exchange
 *
 * Usage:
 *   listing.begin(&transport, &observers);
 *   listing.setLinkReady(true);
 *   listing.requestListing();            // lists "/"
 *   listing.changeDirectory("TRACKS");   // lists "/TRACKS"
 *
 *   // For each CRS_TX notification:
 *   listing.onNotification(data, length);
 */
class DirectoryListing {
public:
    DirectoryListing();

    void begin(BleTransport* transport, ObserverList* observers);

    /**
     * @brief Write and notify channels bound (requests allowed)
     */
    void setLinkReady(bool ready) { _linkReady = ready; }

    // =========================================================================
    // REQUESTS
    // =========================================================================

    /**
     * @brief Append a segment to the path and list it
     *
     * The path is unchanged when the request is not sent.
     *
     * @return false if a request is outstanding, the link is down, the
     *         segment is empty or contains '/', or the path is too long
     */
    bool changeDirectory(const char* segment);

    /**
     * @brief Drop the last path segment and list
     * @return false at root (nothing sent), if a request is outstanding,
     *         or if the link is down
     */
    bool goUp();

    /**
     * @brief List the current path
     * @return false if a request is outstanding, the link is down, or the write failed
     */
    bool requestListing();

    // =========================================================================
    // INBOUND
    // =========================================================================

    /**
     * @brief Handle a CRS_TX value while attached
     * @return true if a directory entry was decoded and inserted
     */
    bool onNotification(const uint8_t* data, size_t length);

    /**
     * @brief Transport reported an error on the notify channel
     */
    void onTransportError();

    /**
     * @brief Stop decoding notifications (a transfer owns the channel)
     */
    void detach();

    /**
     * @brief Link lost: path to root, entries cleared, outstanding request
     *        resolved with DISCONNECTED
     */
    void reset();

    // =========================================================================
    // STATE
    // =========================================================================

    bool isAwaitingResponse() const { return _awaiting; }
    bool isAttached() const { return _attached; }

    const std::vector<DirectoryEntry>& getEntries() const { return _entries; }
    const std::vector<std::string>& getPath() const { return _path; }

    /**
     * @brief Wire form of the path: "/" + segments joined by "/"
     */
    std::string getPathString() const;

    /**
     * @brief Find an entry of the current listing by exact name
     * @return Entry, or nullptr if absent
     */
    const DirectoryEntry* findEntry(const char* name) const;

    void setCompleteCallback(ListingCompleteCallback callback, void* context);

    /**
     * @brief Print the current listing to Serial
     */
    void printListing() const;

    // =========================================================================
    // ORDERING
    // =========================================================================

    /**
     * @brief Directories first, then ASCII case-insensitive name ascending
     */
    static bool entryLess(const DirectoryEntry& a, const DirectoryEntry& b);

    static void sortEntries(std::vector<DirectoryEntry>& entries);

private:
    BleTransport* _transport;
    ObserverList* _observers;

    std::vector<std::string> _path;
    std::vector<DirectoryEntry> _entries;

    bool _linkReady;
    bool _awaiting;
    bool _attached;

    ListingCompleteCallback _completeCallback;
    void* _completeContext;

    bool canRequest() const;
    void resolve(ListingOutcome outcome);
    void notifyObservers(ObservedChange change);
};

#endif // DIRECTORY_LISTING_H
