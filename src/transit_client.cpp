#include "transit_client.h"
#include "ztm_log.h"

#include <exception>

const char* const TransitClient::TIMETABLE_ENDPOINT = "https://api.um.warszawa.pl/api/action/dbtimetable_get/";
const char* const TransitClient::TIMETABLE_DATASET_ID = "e923fa0e-d96c-43f9-ae6e-60518c9f3238";

TransitClient::TransitClient(ApiRequester& requester, StopInfoCache& stopInfo, Clock& clock,
                             const std::string& apiKey,
                             const std::string& stopId,
                             const std::string& stopNr,
                             const std::string& line)
    : requester(requester),
      stopInfo(stopInfo),
      clock(clock),
      apiKey(apiKey),
      stopId(stopId),
      stopNr(stopNr),
      lineName(line) {
}

QueryParams TransitClient::buildParams() const {
    QueryParams params;
    params.push_back(std::make_pair(std::string("id"), std::string(TIMETABLE_DATASET_ID)));
    params.push_back(std::make_pair(std::string("apikey"), apiKey));
    params.push_back(std::make_pair(std::string("busstopId"), stopId));
    params.push_back(std::make_pair(std::string("busstopNr"), stopNr));
    params.push_back(std::make_pair(std::string("line"), lineName));
    return params;
}

std::string TransitClient::context() const {
    return ApiRequester::describeParams(buildParams());
}

const std::string& TransitClient::getLastError() const {
    return lastError;
}

const std::string& TransitClient::line() const {
    return lineName;
}

void TransitClient::attachStopInfo(DepartureSnapshot& snapshot) {
    if (stopInfo.hasValue()) {
        snapshot.stopInfo = stopInfo.current();
        snapshot.hasStopInfo = true;
    }
}

// ============================================================================
// FETCH
// ============================================================================

bool TransitClient::fetchDepartures(DepartureSnapshot& snapshot) {
    snapshot = DepartureSnapshot();
    lastError.clear();

    try {
        // Served from the cache while fresh; the cache decides about TTL and backoff
        StopMetadata ignored;
        stopInfo.fetchOrGetCached(ignored);

        time_t now = clock.nowUtc();
        snapshot.fetchedAtUtc = now;

        JsonDocument doc;
        if (!requester.getWithRetry(TIMETABLE_ENDPOINT, buildParams(), doc)) {
            lastError = ApiRequester::outcomeName(requester.lastOutcome());
            attachStopInfo(snapshot);
            return false;
        }

        if (!doc.is<JsonObjectConst>()) {
            ZTM_LOGW("Timetable response is not an object [%s]", context().c_str());
            lastError = "malformed response";
            attachStopInfo(snapshot);
            return false;
        }

        JsonVariantConst result = doc["result"].as<JsonVariantConst>();
        bool ok = decodeResult(result, snapshot, now);
        attachStopInfo(snapshot);
        return ok;
    } catch (const std::exception& e) {
        ZTM_LOGE("Unexpected error in timetable fetch [%s]: %s", context().c_str(), e.what());
        lastError = e.what();
        snapshot.departures.clear();
        attachStopInfo(snapshot);
        return false;
    }
}

bool TransitClient::decodeResult(JsonVariantConst result, DepartureSnapshot& snapshot, time_t now) {
    if (result.isNull()) {
        ZTM_LOGI("No departures listed [%s]", context().c_str());
        return true;
    }

    if (result.is<const char*>()) {
        // "false" is what the API answers to an unknown key
        ZTM_LOGW("Timetable API refused request [%s]: result=%s",
                 context().c_str(), result.as<const char*>());
        lastError = std::string("api error: ") + result.as<const char*>();
        return false;
    }

    if (!result.is<JsonArrayConst>()) {
        ZTM_LOGE("Unexpected 'result' type from timetable [%s]", context().c_str());
        lastError = "unexpected result type";
        return false;
    }

    std::vector<DepartureReading> readings;
    for (JsonVariantConst row : result.as<JsonArrayConst>()) {
        RawRow fields;
        if (!TimetableCodec::flattenRow(row, fields)) {
            ZTM_LOGW("Unexpected entry format in timetable result [%s]", context().c_str());
            continue;
        }
        DepartureReading reading;
        if (TimetableCodec::decodeRow(fields, reading)) {
            readings.push_back(reading);
        }
    }

    snapshot.departures = TimetableCodec::buildSchedule(readings, now, TimetableCodec::DROP_UNRESOLVED);
    ZTM_LOGD("Loaded %u departures from API [%s]",
             (unsigned)snapshot.departures.size(), context().c_str());
    return true;
}

DepartureSnapshot TransitClient::fetch() {
    DepartureSnapshot snapshot;
    fetchDepartures(snapshot);
    return snapshot;
}
