/**
 * @file transfer_stats.h
 * @brief Per-download counters and reporting
 * @version 1.0.0
 *
 * Collected by FileTransfer for every session and printed on request
 * (STATS console command) or when verbose logging is on.
 */

#ifndef TRANSFER_STATS_H
#define TRANSFER_STATS_H

#include <Arduino.h>
#include <stdint.h>

/**
 * @brief Download statistics for the current (or last) session
 */
struct TransferStats {
    // ==========================================================================
    // FRAMES
    // ==========================================================================

    uint32_t framesAccepted;    ///< In-order data frames (including end-of-file)
    uint32_t bytesReceived;     ///< Payload bytes appended to the buffer
    uint32_t outOfOrderDrops;   ///< Data frames discarded for sequence mismatch
    uint32_t ignoredFrames;     ///< Notifications without the data tag

    // ==========================================================================
    // ACKNOWLEDGMENTS
    // ==========================================================================

    uint32_t acksSent;          ///< Ack frames accepted by the transport
    uint32_t ackFailures;       ///< Ack frames the transport rejected

    // ==========================================================================
    // TIMING (millis)
    // ==========================================================================

    uint32_t startMs;           ///< Download request time
    uint32_t lastFrameMs;       ///< Most recent in-order frame
    uint32_t maxGapMs;          ///< Longest gap between in-order frames

    // ==========================================================================
    // METHODS
    // ==========================================================================

    TransferStats() { reset(0); }

    /**
     * @brief Reset all counters, anchoring timing at nowMs
     */
    void reset(uint32_t nowMs);

    /**
     * @brief Record an in-order data frame
     * @param payloadLength Payload bytes (0 for end-of-file)
     */
    void recordFrame(size_t payloadLength, uint32_t nowMs);

    void recordOutOfOrder() { outOfOrderDrops++; }
    void recordIgnored() { ignoredFrames++; }

    /**
     * @brief Record an acknowledgment write
     * @param accepted Whether the transport accepted the write
     */
    void recordAck(bool accepted);

    /**
     * @brief Time from request to the last in-order frame
     */
    uint32_t getElapsedMs() const;

    /**
     * @brief Average payload throughput in bytes per second, 0 if unknown
     */
    uint32_t getThroughputBps() const;

    /**
     * @brief Print report to Serial
     */
    void printReport() const;
};

#endif // TRANSFER_STATS_H
