/**
 * @file transfer_stats.cpp
 * @brief Per-download counters and reporting implementation
 * @version 1.0.0
 */

#include "transfer_stats.h"

// =============================================================================
// RESET AND RECORDING
// =============================================================================

void TransferStats::reset(uint32_t nowMs) {
    framesAccepted = 0;
    bytesReceived = 0;
    outOfOrderDrops = 0;
    ignoredFrames = 0;

    acksSent = 0;
    ackFailures = 0;

    startMs = nowMs;
    lastFrameMs = nowMs;
    maxGapMs = 0;
}

void TransferStats::recordFrame(size_t payloadLength, uint32_t nowMs) {
    uint32_t gap = nowMs - lastFrameMs;
    if (gap > maxGapMs) {
        maxGapMs = gap;
    }
    lastFrameMs = nowMs;

    framesAccepted++;
    bytesReceived += static_cast<uint32_t>(payloadLength);
}

void TransferStats::recordAck(bool accepted) {
    if (accepted) {
        acksSent++;
    } else {
        ackFailures++;
    }
}

// =============================================================================
// COMPUTED METRICS
// =============================================================================

uint32_t TransferStats::getElapsedMs() const {
    return lastFrameMs - startMs;
}

uint32_t TransferStats::getThroughputBps() const {
    uint32_t elapsed = getElapsedMs();
    if (elapsed == 0) return 0;
    return static_cast<uint32_t>((static_cast<uint64_t>(bytesReceived) * 1000) / elapsed);
}

// =============================================================================
// REPORTING
// =============================================================================

void TransferStats::printReport() const {
    Serial.println(F(""));
    Serial.println(F("========== TRANSFER STATS =========="));
    Serial.printf("Frames:       %lu\n", (unsigned long)framesAccepted);
    Serial.printf("Bytes:        %lu\n", (unsigned long)bytesReceived);
    Serial.println(F("------------------------------------"));
    Serial.printf("Acks sent:    %lu\n", (unsigned long)acksSent);
    if (ackFailures > 0) {
        Serial.printf("Ack failures: %lu\n", (unsigned long)ackFailures);
    }
    Serial.printf("Out of order: %lu\n", (unsigned long)outOfOrderDrops);
    Serial.printf("Ignored:      %lu\n", (unsigned long)ignoredFrames);
    Serial.println(F("------------------------------------"));
    Serial.printf("Elapsed:      %lu ms\n", (unsigned long)getElapsedMs());
    Serial.printf("Max gap:      %lu ms\n", (unsigned long)maxGapMs);
    Serial.printf("Throughput:   %lu B/s\n", (unsigned long)getThroughputBps());
    Serial.println(F("===================================="));
    Serial.println(F(""));
}
