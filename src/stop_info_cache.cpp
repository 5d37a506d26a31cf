#include "stop_info_cache.h"
#include "timetable_codec.h"
#include "ztm_log.h"

// ============================================================================
// STOP INFO CACHE IMPLEMENTATION
// ============================================================================

const char* const StopInfoCache::ENDPOINT = "https://api.um.warszawa.pl/api/action/dbstore_get/";
const char* const StopInfoCache::DATASET_ID = "ab75c33d-3a26-4342-b36a-6e5fef0a3ac3";
const int StopInfoCache::MAX_ATTEMPTS;
const uint32_t StopInfoCache::STRING_RESULT_RETRY_MS;

StopInfoCache::StopInfoCache(ApiRequester& requester, Clock& clock,
                             const std::string& apiKey,
                             const std::string& stopId,
                             const std::string& stopNr,
                             uint32_t ttlSeconds)
    : requester(requester),
      clock(clock),
      apiKey(apiKey),
      cacheStopId(stopId),
      cacheStopNr(stopNr),
      ttlSeconds(ttlSeconds),
      cached(false),
      lastFetch(0),
      attempts(0),
      retryAt(0),
      permanentMissing(false) {
    backoffSeconds.push_back(2 * 3600);
    backoffSeconds.push_back(6 * 3600);
}

bool StopInfoCache::fetchOrGetCached(StopMetadata& out) {
    time_t now = clock.nowUtc();

    if (cached && isFresh(now)) {
        out = value;
        return true;
    }

    if (permanentMissing) {
        return false;
    }

    if (retryAt != 0 && now < retryAt) {
        return false;
    }

    JsonDocument doc;
    if (!requestStopList(doc)) {
        recordFailure(now, ApiRequester::outcomeName(requester.lastOutcome()));
        return false;
    }

    JsonVariantConst result = doc["result"].as<JsonVariantConst>();
    if (result.isNull()) {
        ZTM_LOGW("Stop info empty (result=null) for stop_id=%s stop_nr=%s",
                 cacheStopId.c_str(), cacheStopNr.c_str());
        recordFailure(now, "empty result");
        return false;
    }

    if (result.is<const char*>()) {
        // Upstream sometimes answers with a localized message while its
        // backend settles. One quick retry, then treat it as a failure.
        clock.sleepMs(STRING_RESULT_RETRY_MS);
        if (!requestStopList(doc)) {
            recordFailure(now, ApiRequester::outcomeName(requester.lastOutcome()));
            return false;
        }
        result = doc["result"].as<JsonVariantConst>();
        if (!result.is<JsonArrayConst>()) {
            ZTM_LOGD("Stop info string result persisted after retry (stop_id=%s stop_nr=%s)",
                     cacheStopId.c_str(), cacheStopNr.c_str());
            recordFailure(now, "string result");
            return false;
        }
    }

    if (!result.is<JsonArrayConst>()) {
        ZTM_LOGE("Unexpected 'result' type from stop info");
        recordFailure(now, "unexpected result type");
        return false;
    }

    StopMetadata metadata;
    if (!matchStop(result.as<JsonArrayConst>(), metadata)) {
        ZTM_LOGW("Stop name not found in stop info for stop_id=%s stop_nr=%s",
                 cacheStopId.c_str(), cacheStopNr.c_str());
        recordFailure(now, "no matching stop");
        return false;
    }

    recordSuccess(metadata, now);
    out = value;
    return true;
}

void StopInfoCache::reset() {
    value.clear();
    cached = false;
    lastFetch = 0;
    attempts = 0;
    retryAt = 0;
    permanentMissing = false;
    ZTM_LOGD("Stop info cache cleared for stop_id=%s stop_nr=%s",
             cacheStopId.c_str(), cacheStopNr.c_str());
}

bool StopInfoCache::isFresh(time_t now) const {
    if (ttlSeconds == 0) {
        return true;
    }
    return (now - lastFetch) < (time_t)ttlSeconds;
}

bool StopInfoCache::requestStopList(JsonDocument& doc) {
    QueryParams params;
    params.push_back(std::make_pair(std::string("id"), std::string(DATASET_ID)));
    params.push_back(std::make_pair(std::string("apikey"), apiKey));
    return requester.getWithRetry(ENDPOINT, params, doc);
}

bool StopInfoCache::matchStop(JsonArrayConst entries, StopMetadata& out) const {
    bool haveFallback = false;
    StopMetadata fallback;

    for (JsonVariantConst entry : entries) {
        if (!entry.is<JsonObjectConst>()) {
            continue;
        }
        RawRow kv;
        if (!TimetableCodec::flattenRow(entry["values"], kv)) {
            continue;
        }

        RawRow::const_iterator group = kv.find("zespol");
        if (group == kv.end() || group->second != cacheStopId) {
            continue;
        }

        RawRow::const_iterator post = kv.find("slupek");
        bool exact = (post != kv.end() && post->second == cacheStopNr);
        if (!exact && haveFallback) {
            continue;
        }

        StopMetadata attributes;
        for (RawRow::const_iterator it = kv.begin(); it != kv.end(); ++it) {
            if (it->first == "zespol" || it->first == "slupek") {
                continue;
            }
            attributes[it->first] = it->second;
        }
        StopMetadata::const_iterator name = attributes.find("nazwa_zespolu");
        if (name != attributes.end()) {
            attributes["stop_name"] = name->second;
        }

        if (exact) {
            out = attributes;
            return true;
        }
        // First entry of the stop group stands in if no post matches
        fallback = attributes;
        haveFallback = true;
    }

    if (haveFallback) {
        out = fallback;
        return true;
    }
    return false;
}

void StopInfoCache::recordSuccess(const StopMetadata& metadata, time_t now) {
    value = metadata;
    cached = true;
    lastFetch = now;
    attempts = 0;
    retryAt = 0;
    permanentMissing = false;

    StopMetadata::const_iterator name = value.find("stop_name");
    ZTM_LOGI("Stop info cached for stop_id=%s stop_nr=%s: %s",
             cacheStopId.c_str(), cacheStopNr.c_str(),
             name != value.end() ? name->second.c_str() : "(no name)");
}

void StopInfoCache::recordFailure(time_t now, const char* reason) {
    attempts++;

    if (attempts >= MAX_ATTEMPTS) {
        permanentMissing = true;
        retryAt = 0;
        ZTM_LOGW("Stop info unavailable after %d attempts (%s); giving up until reload",
                 attempts, reason);
        return;
    }

    size_t index = (size_t)(attempts - 1);
    if (index >= backoffSeconds.size()) {
        index = backoffSeconds.size() - 1;
    }
    retryAt = now + (time_t)backoffSeconds[index];
    ZTM_LOGW("Stop info fetch failed (%s), attempt %d/%d; next try in %lus",
             reason, attempts, MAX_ATTEMPTS, (unsigned long)backoffSeconds[index]);
}

bool StopInfoCache::hasValue() const {
    return cached;
}

const StopMetadata& StopInfoCache::current() const {
    return value;
}

bool StopInfoCache::isPermanentlyMissing() const {
    return permanentMissing;
}

int StopInfoCache::attemptCount() const {
    return attempts;
}

time_t StopInfoCache::nextRetryAt() const {
    return retryAt;
}

time_t StopInfoCache::lastFetchAt() const {
    return lastFetch;
}

const std::string& StopInfoCache::stopId() const {
    return cacheStopId;
}

const std::string& StopInfoCache::stopNr() const {
    return cacheStopNr;
}

void StopInfoCache::setBackoffSchedule(const std::vector<uint32_t>& seconds) {
    if (seconds.empty()) {
        return;
    }
    backoffSeconds = seconds;
}
