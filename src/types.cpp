/**
 * @file types.cpp
 * @brief FlyLink shared types - string mappings and timestamp helpers
 * @version 1.0.0
 */

#include "types.h"
#include <stdio.h>

// =============================================================================
// STRING MAPPINGS
// =============================================================================

const char* channelToString(Channel channel) {
    switch (channel) {
        case Channel::WRITE:          return "CRS_RX";
        case Channel::NOTIFY:         return "CRS_TX";
        case Channel::POSITION:       return "GNSS_PV";
        case Channel::TIMING_CONTROL: return "START_CONTROL";
        case Channel::TIMING_RESULT:  return "START_RESULT";
        default:                      return "NONE";
    }
}

const char* timingStateToString(TimingState state) {
    switch (state) {
        case TimingState::IDLE:     return "IDLE";
        case TimingState::COUNTING: return "COUNTING";
        default:                    return "UNKNOWN";
    }
}

const char* timingTriggerToString(TimingTrigger trigger) {
    switch (trigger) {
        case TimingTrigger::START_SENT:      return "START_SENT";
        case TimingTrigger::CANCEL_SENT:     return "CANCEL_SENT";
        case TimingTrigger::RESULT_ACCEPTED: return "RESULT_ACCEPTED";
        case TimingTrigger::RESET:           return "RESET";
        default:                             return "UNKNOWN";
    }
}

const char* transferOutcomeToString(TransferOutcome outcome) {
    switch (outcome) {
        case TransferOutcome::SUCCESS:         return "SUCCESS";
        case TransferOutcome::CANCELLED:       return "CANCELLED";
        case TransferOutcome::NOT_CONNECTED:   return "NOT_CONNECTED";
        case TransferOutcome::BUSY:            return "BUSY";
        case TransferOutcome::TRANSPORT_ERROR: return "TRANSPORT_ERROR";
        case TransferOutcome::TIMEOUT:         return "TIMEOUT";
        case TransferOutcome::DISCONNECTED:    return "DISCONNECTED";
        default:                               return "UNKNOWN";
    }
}

const char* listingOutcomeToString(ListingOutcome outcome) {
    switch (outcome) {
        case ListingOutcome::COMPLETE:        return "COMPLETE";
        case ListingOutcome::TRANSPORT_ERROR: return "TRANSPORT_ERROR";
        case ListingOutcome::DISCONNECTED:    return "DISCONNECTED";
        default:                              return "UNKNOWN";
    }
}

const char* observedChangeToString(ObservedChange change) {
    switch (change) {
        case ObservedChange::REGISTRY:          return "REGISTRY";
        case ObservedChange::CONNECTION:        return "CONNECTION";
        case ObservedChange::LISTING:           return "LISTING";
        case ObservedChange::PATH:              return "PATH";
        case ObservedChange::TRANSFER_PROGRESS: return "TRANSFER_PROGRESS";
        case ObservedChange::TRANSFER_STATE:    return "TRANSFER_STATE";
        case ObservedChange::TIMING_STATE:      return "TIMING_STATE";
        default:                                return "UNKNOWN";
    }
}

// =============================================================================
// UTC TIMESTAMP
// =============================================================================

// Days since 1970-01-01 for a proleptic Gregorian date (Howard Hinnant's algorithm)
static int64_t daysFromCivil(int32_t y, uint32_t m, uint32_t d) {
    y -= (m <= 2) ? 1 : 0;
    const int32_t era = (y >= 0 ? y : y - 399) / 400;
    const uint32_t yoe = static_cast<uint32_t>(y - era * 400);
    const uint32_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const uint32_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<int64_t>(era) * 146097 + static_cast<int64_t>(doe) - 719468;
}

int64_t UtcTimestamp::toUnixMillis() const {
    int64_t days = daysFromCivil(year, month, day);
    int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second;
    return seconds * 1000 + millisecond;
}

void UtcTimestamp::format(char* buffer, size_t bufferSize) const {
    if (!buffer || bufferSize == 0) {
        return;
    }
    snprintf(buffer, bufferSize, "%04u-%02u-%02uT%02u:%02u:%02u.%03uZ",
             (unsigned)year, (unsigned)month, (unsigned)day,
             (unsigned)hour, (unsigned)minute, (unsigned)second,
             (unsigned)millisecond);
}
