/**
 * @file file_transfer.h
 * @brief Stop-and-wait file download over CRS_RX / CRS_TX
 * @version 1.0.0
 *
 * Protocol:
 *   client -> 0x02 + offset(0) + stride(0) + path
 *   device -> 0x10 + seq + payload      (payload empty = end of file)
 *   client -> 0x12 + seq                (for every in-order frame)
 *
 * The expected sequence starts at 0 and wraps modulo 256. A frame whose
 * sequence differs from the expected one is dropped without an ack and
 * without touching session state; the device is relied upon to resend.
 * No NACK is sent. An optional receive timeout (0 = disabled) fails the
 * session when no in-order frame arrives within the window.
 *
 * Exactly one session exists at a time. Its completion callback runs
 * exactly once: on end of file, cancel, transport error, timeout, or
 * disconnection.
 */

#ifndef FILE_TRANSFER_H
#define FILE_TRANSFER_H

#include <Arduino.h>
#include <string>
#include <vector>
#include "ble_transport.h"
#include "observer_list.h"
#include "timer_scheduler.h"
#include "transfer_stats.h"
#include "wire_codec.h"

/**
 * @brief Transfer completion callback
 * @param outcome SUCCESS or the failure reason
 * @param data Bytes accumulated before completion (whole file on SUCCESS)
 * @param context Opaque pointer given to start()
 */
typedef void (*TransferCompleteCallback)(TransferOutcome outcome,
                                         const std::vector<uint8_t>& data,
                                         void* context);

/**
 * @class FileTransfer
 * @brief Single-flight reliable download session
 *
 * Usage:
 *   transfer.begin(&transport, &scheduler, &observers);
 *   transfer.setLinkReady(true);
 *   transfer.start("/TRACKS/24-05-25/TRACK.CSV", 4096, onDone, nullptr);
 *
 *   // For each CRS_TX notification:
 *   transfer.onNotification(data, length);
 */
class FileTransfer {
public:
    // Scheduler key of the receive timeout (outside the registry key range)
    static constexpr uint32_t TIMEOUT_TIMER_KEY = 0xFFFF0001;

    FileTransfer();

    void begin(BleTransport* transport, TimerScheduler* timers, ObserverList* observers);

    /**
     * @brief Write and notify channels bound (downloads allowed)
     */
    void setLinkReady(bool ready) { _linkReady = ready; }

    /**
     * @brief Start a download
     *
     * On failure the callback is invoked immediately with NOT_CONNECTED,
     * BUSY or TRANSPORT_ERROR.
     *
     * @param path Absolute remote path
     * @param expectedSize Size from the directory listing, 0 if unknown
     * @return true if the request was written
     */
    bool start(const char* path, uint32_t expectedSize,
               TransferCompleteCallback callback, void* context);

    /**
     * @brief Handle a CRS_TX value
     * @return true if the frame was accepted in order
     */
    bool onNotification(const uint8_t* data, size_t length);

    /**
     * @brief Send the cancel frame and resolve the session as CANCELLED
     * @return false if no session is active
     */
    bool cancel();

    /**
     * @brief Resolve the active session with a failure outcome
     * @return false if no session is active
     */
    bool fail(TransferOutcome outcome);

    // =========================================================================
    // STATE
    // =========================================================================

    bool isActive() const { return _active; }

    /**
     * @brief Fraction received in [0, 1]
     *
     * 0 while the expected size is unknown, 1 after a successful session.
     */
    float getProgress() const { return _progress; }

    uint8_t getExpectedSequence() const { return _expectedSequence; }
    uint32_t getExpectedSize() const { return _expectedSize; }
    size_t getBytesReceived() const { return _buffer.size(); }
    const char* getPath() const { return _path.c_str(); }
    const TransferStats& getStats() const { return _stats; }

    // =========================================================================
    // CONFIGURATION
    // =========================================================================

    /**
     * @brief Receive timeout between in-order frames, 0 disables
     */
    void setReceiveTimeout(uint32_t timeoutMs) { _receiveTimeoutMs = timeoutMs; }
    uint32_t getReceiveTimeout() const { return _receiveTimeoutMs; }

    /**
     * @brief Per-packet logging
     */
    void setVerbose(bool verbose) { _verbose = verbose; }
    bool isVerbose() const { return _verbose; }

private:
    BleTransport* _transport;
    TimerScheduler* _timers;
    ObserverList* _observers;

    bool _linkReady;
    bool _active;
    std::string _path;
    uint32_t _expectedSize;
    std::vector<uint8_t> _buffer;
    uint8_t _expectedSequence;
    float _progress;

    TransferCompleteCallback _callback;
    void* _callbackContext;

    uint32_t _receiveTimeoutMs;
    bool _verbose;
    TransferStats _stats;

    void finish(TransferOutcome outcome);
    void armTimeout();
    void updateProgress();
    void notifyObservers(ObservedChange change);

    static void onReceiveTimeout(uint32_t key, void* context);
};

#endif // FILE_TRANSFER_H
