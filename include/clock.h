#ifndef CLOCK_H
#define CLOCK_H

#include <stdint.h>
#include <time.h>

// ============================================================================
// CLOCK
// Wall clock, monotonic clock and blocking sleep supplied by the platform.
// Local time conversions follow the process TZ rule (see local_time.h).
// ============================================================================

class Clock {
public:
    virtual ~Clock() {}

    // Seconds since the Unix epoch (UTC). 0 when the clock is not synced yet.
    virtual time_t nowUtc() const = 0;

    // Milliseconds since boot, wraps like millis()
    virtual uint32_t monotonicMs() const = 0;

    // Blocking sleep, only used for short retry backoffs
    virtual void sleepMs(uint32_t ms) = 0;
};

// Anything before 2024-01-01 means SNTP has not delivered a time yet
const time_t CLOCK_MIN_VALID_EPOCH = 1704067200;

inline bool isClockSynced(time_t utc) {
    return utc >= CLOCK_MIN_VALID_EPOCH;
}

#endif // CLOCK_H
