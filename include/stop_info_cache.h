#ifndef STOP_INFO_CACHE_H
#define STOP_INFO_CACHE_H

#include <stdint.h>
#include <time.h>
#include <string>
#include <vector>
#include "api_requester.h"
#include "clock.h"
#include "departure_model.h"

// ============================================================================
// STOP INFO CACHE
// Stop metadata (name, coordinates, street id) for one stop / post pair.
// It rarely changes: fetched once, refreshed only when a TTL is set.
// Failures back off (2h, then 6h) and give up for good after 3 attempts,
// until reset() is called.
// ============================================================================

class StopInfoCache {
public:
    static const char* const ENDPOINT;
    static const char* const DATASET_ID;
    static const int MAX_ATTEMPTS = 3;
    static const uint32_t STRING_RESULT_RETRY_MS = 800;

    // ttlSeconds == 0 disables automatic refresh
    StopInfoCache(ApiRequester& requester, Clock& clock,
                  const std::string& apiKey,
                  const std::string& stopId,
                  const std::string& stopNr,
                  uint32_t ttlSeconds = 0);

    // Cached value while fresh, otherwise one network attempt unless
    // backing off or given up. Returns false when nothing could be provided.
    bool fetchOrGetCached(StopMetadata& out);

    // Forget the value and all failure state
    void reset();

    bool hasValue() const;
    const StopMetadata& current() const;  // last good value, possibly expired

    bool isPermanentlyMissing() const;
    int attemptCount() const;
    time_t nextRetryAt() const;
    time_t lastFetchAt() const;
    const std::string& stopId() const;
    const std::string& stopNr() const;

    // Seconds to wait after failure n (1-based); the last entry repeats
    void setBackoffSchedule(const std::vector<uint32_t>& seconds);

private:
    ApiRequester& requester;
    Clock& clock;
    std::string apiKey;
    std::string cacheStopId;
    std::string cacheStopNr;
    uint32_t ttlSeconds;

    StopMetadata value;
    bool cached;
    time_t lastFetch;
    int attempts;
    time_t retryAt;
    bool permanentMissing;
    std::vector<uint32_t> backoffSeconds;

    bool isFresh(time_t now) const;
    bool requestStopList(JsonDocument& doc);
    bool matchStop(JsonArrayConst entries, StopMetadata& out) const;
    void recordSuccess(const StopMetadata& metadata, time_t now);
    void recordFailure(time_t now, const char* reason);
};

#endif // STOP_INFO_CACHE_H
