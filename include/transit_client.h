#ifndef TRANSIT_CLIENT_H
#define TRANSIT_CLIENT_H

#include <string>
#include "api_requester.h"
#include "clock.h"
#include "departure_model.h"
#include "stop_info_cache.h"
#include "timetable_codec.h"

// ============================================================================
// ZTM TIMETABLE CLIENT
// Fetches the scheduled departures of one line at one stop post from the
// City of Warsaw open-data API (api.um.warszawa.pl, dbtimetable_get).
// ============================================================================

class TransitClient {
public:
    static const char* const TIMETABLE_ENDPOINT;
    static const char* const TIMETABLE_DATASET_ID;

    TransitClient(ApiRequester& requester, StopInfoCache& stopInfo, Clock& clock,
                  const std::string& apiKey,
                  const std::string& stopId,
                  const std::string& stopNr,
                  const std::string& line);

    // Fill `snapshot` with the current timetable. The snapshot is always
    // valid (possibly empty) and carries whatever stop metadata is known.
    // Returns false when the API could not be reached or refused the
    // request; a "no departures" answer (result=null) is a success.
    bool fetchDepartures(DepartureSnapshot& snapshot);

    // Same, for callers that only need the snapshot
    DepartureSnapshot fetch();

    // Human-readable reason of the last failed fetch, empty after success
    const std::string& getLastError() const;

    // "stop_id=..., stop_nr=..., line=..." for log lines
    std::string context() const;

    const std::string& line() const;

private:
    ApiRequester& requester;
    StopInfoCache& stopInfo;
    Clock& clock;
    std::string apiKey;
    std::string stopId;
    std::string stopNr;
    std::string lineName;
    std::string lastError;

    QueryParams buildParams() const;
    void attachStopInfo(DepartureSnapshot& snapshot);
    bool decodeResult(JsonVariantConst result, DepartureSnapshot& snapshot, time_t now);
};

#endif // TRANSIT_CLIENT_H
