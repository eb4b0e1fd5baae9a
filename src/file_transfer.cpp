/**
 * @file file_transfer.cpp
 * @brief Stop-and-wait file download - Implementation
 * @version 1.0.0
 */

#include "file_transfer.h"

static constexpr size_t MAX_REQUEST_LEN = BLE_MAX_ATT_PAYLOAD;

// =============================================================================
// CONSTRUCTOR / INIT
// =============================================================================

FileTransfer::FileTransfer() :
    _transport(nullptr),
    _timers(nullptr),
    _observers(nullptr),
    _linkReady(false),
    _active(false),
    _expectedSize(0),
    _expectedSequence(0),
    _progress(0.0f),
    _callback(nullptr),
    _callbackContext(nullptr),
    _receiveTimeoutMs(XFER_RECEIVE_TIMEOUT_MS),
    _verbose(XFER_VERBOSE_DEFAULT)
{
}

void FileTransfer::begin(BleTransport* transport, TimerScheduler* timers, ObserverList* observers) {
    _transport = transport;
    _timers = timers;
    _observers = observers;
    _active = false;
    _buffer.clear();
    _expectedSequence = 0;
    _progress = 0.0f;
}

// =============================================================================
// SESSION CONTROL
// =============================================================================

bool FileTransfer::start(const char* path, uint32_t expectedSize,
                         TransferCompleteCallback callback, void* context) {
    static const std::vector<uint8_t> NO_DATA;

    if (_active) {
        Serial.printf("[XFER] Busy with %s - request rejected\n", _path.c_str());
        if (callback) {
            callback(TransferOutcome::BUSY, NO_DATA, context);
        }
        return false;
    }

    if (!_linkReady || !_transport || !path) {
        Serial.println(F("[XFER] Not connected - request rejected"));
        if (callback) {
            callback(TransferOutcome::NOT_CONNECTED, NO_DATA, context);
        }
        return false;
    }

    uint8_t frame[MAX_REQUEST_LEN];
    size_t frameLength = buildDownloadRequest(path, frame, sizeof(frame));
    if (frameLength == 0) {
        Serial.printf("[XFER] Path too long: %s\n", path);
        if (callback) {
            callback(TransferOutcome::TRANSPORT_ERROR, NO_DATA, context);
        }
        return false;
    }

    _active = true;
    _path = path;
    _expectedSize = expectedSize;
    _buffer.clear();
    if (expectedSize > 0) {
        _buffer.reserve(expectedSize);
    }
    _expectedSequence = 0;
    _progress = 0.0f;
    _callback = callback;
    _callbackContext = context;
    _stats.reset(millis());

    Serial.printf("[XFER] Download %s (%lu bytes expected)\n", path, (unsigned long)expectedSize);
    notifyObservers(ObservedChange::TRANSFER_STATE);

    if (!_transport->setNotify(true, Channel::NOTIFY)) {
        Serial.println(F("[XFER] ERROR: Cannot enable notifications"));
        finish(TransferOutcome::TRANSPORT_ERROR);
        return false;
    }

    if (!_transport->write(frame, frameLength, Channel::WRITE, false)) {
        Serial.println(F("[XFER] ERROR: Download request write failed"));
        finish(TransferOutcome::TRANSPORT_ERROR);
        return false;
    }

    armTimeout();
    return true;
}

bool FileTransfer::cancel() {
    if (!_active) {
        return false;
    }

    uint8_t frame[1];
    size_t frameLength = buildCancelTransfer(frame, sizeof(frame));
    if (!_transport->write(frame, frameLength, Channel::WRITE, false)) {
        Serial.println(F("[XFER] WARNING: Cancel frame write failed"));
    }

    Serial.printf("[XFER] Cancelled %s after %u bytes\n", _path.c_str(), (unsigned)_buffer.size());
    finish(TransferOutcome::CANCELLED);
    return true;
}

bool FileTransfer::fail(TransferOutcome outcome) {
    if (!_active) {
        return false;
    }

    Serial.printf("[XFER] %s failed: %s\n", _path.c_str(), transferOutcomeToString(outcome));
    finish(outcome);
    return true;
}

void FileTransfer::finish(TransferOutcome outcome) {
    _active = false;

    if (_timers) {
        _timers->cancelKey(TIMEOUT_TIMER_KEY);
    }

    if (_transport && !_transport->setNotify(false, Channel::NOTIFY)) {
        Serial.println(F("[XFER] WARNING: Cannot disable notifications"));
    }

    if (outcome == TransferOutcome::SUCCESS) {
        _progress = 1.0f;
    }

    TransferCompleteCallback callback = _callback;
    void* context = _callbackContext;
    _callback = nullptr;
    _callbackContext = nullptr;

    // Callback may start the next session, which reuses _buffer
    std::vector<uint8_t> data;
    data.swap(_buffer);

    notifyObservers(ObservedChange::TRANSFER_STATE);

    if (_verbose) {
        _stats.printReport();
    }

    if (callback) {
        callback(outcome, data, context);
    }
}

// =============================================================================
// INBOUND
// =============================================================================

bool FileTransfer::onNotification(const uint8_t* data, size_t length) {
    if (!_active) {
        return false;
    }

    DataFrame frame;
    if (!parseDataFrame(data, length, frame)) {
        _stats.recordIgnored();
        return false;
    }

    if (frame.sequence != _expectedSequence) {
        _stats.recordOutOfOrder();
        if (_verbose) {
            Serial.printf("[XFER] Out of order packet %u (expected %u)\n",
                (unsigned)frame.sequence, (unsigned)_expectedSequence);
        }
        return false;
    }

    if (_verbose) {
        Serial.printf("[XFER] Received packet %u, length %u\n",
            (unsigned)frame.sequence, (unsigned)frame.payloadLength);
    }

    uint32_t now = millis();
    _stats.recordFrame(frame.payloadLength, now);

    if (!frame.isEndOfFile()) {
        _buffer.insert(_buffer.end(), frame.payload, frame.payload + frame.payloadLength);
        updateProgress();
    }

    _expectedSequence = static_cast<uint8_t>(_expectedSequence + 1);

    uint8_t ack[2];
    size_t ackLength = buildAck(frame.sequence, ack, sizeof(ack));
    bool ackAccepted = _transport->write(ack, ackLength, Channel::WRITE, false);
    _stats.recordAck(ackAccepted);

    if (!ackAccepted) {
        Serial.printf("[XFER] ERROR: Ack %u write failed\n", (unsigned)frame.sequence);
        finish(TransferOutcome::TRANSPORT_ERROR);
        return true;
    }

    if (frame.isEndOfFile()) {
        Serial.printf("[XFER] Complete: %s, %u bytes\n", _path.c_str(), (unsigned)_buffer.size());
        finish(TransferOutcome::SUCCESS);
    } else {
        armTimeout();
    }

    return true;
}

// =============================================================================
// HELPERS
// =============================================================================

void FileTransfer::updateProgress() {
    if (_expectedSize == 0) {
        return;
    }

    float progress = static_cast<float>(_buffer.size()) / static_cast<float>(_expectedSize);
    if (progress > 1.0f) {
        progress = 1.0f;
    }
    _progress = progress;
    notifyObservers(ObservedChange::TRANSFER_PROGRESS);
}

void FileTransfer::armTimeout() {
    if (_receiveTimeoutMs == 0 || !_timers) {
        return;
    }
    if (_timers->schedule(TIMEOUT_TIMER_KEY, _receiveTimeoutMs, onReceiveTimeout, this)
            == TimerScheduler::INVALID_ID) {
        Serial.println(F("[XFER] WARNING: No timer slot for receive timeout"));
    }
}

void FileTransfer::onReceiveTimeout(uint32_t key, void* context) {
    (void)key;
    FileTransfer* self = static_cast<FileTransfer*>(context);
    if (self) {
        self->fail(TransferOutcome::TIMEOUT);
    }
}

void FileTransfer::notifyObservers(ObservedChange change) {
    if (_observers) {
        _observers->notify(change);
    }
}
