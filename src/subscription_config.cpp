#include "subscription_config.h"
#include "ztm_log.h"

#include <stdlib.h>

const uint32_t ClientOptions::DEFAULT_TIMEOUT_SECONDS;
const uint32_t ClientOptions::DEFAULT_REFRESH_INTERVAL_SECONDS;
const uint32_t ClientOptions::MAX_REFRESH_INTERVAL_SECONDS;
const uint32_t ClientOptions::MAX_TIMEOUT_SECONDS;
const uint32_t ClientOptions::MAX_STOP_INFO_TTL_SECONDS;
const uint32_t ClientOptions::MAX_RETRY_DELAY_SECONDS;
const uint32_t ClientOptions::MAX_JITTER_SECONDS;
const int ClientOptions::MIN_DEPARTURES;
const int ClientOptions::MAX_DEPARTURES;

namespace {

const char* const API_KEY_KEYS[] = {"api_key", "apikey", "apiKey", nullptr};
const char* const STOP_ID_KEYS[] = {"stop_id", "busstop_id", "busstopId", "busstopID", "stopId", "zespol", nullptr};
const char* const STOP_NR_KEYS[] = {"stop_nr", "busstop_nr", "busstopNr", "stopNr", "slupek", nullptr};
const char* const LINE_KEYS[] = {"line", "linia", nullptr};

std::string trim(const std::string& value) {
    size_t first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::string();
    }
    size_t last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

// Strings are trimmed, numbers written out ("7009" and 7009 are the same stop)
std::string toText(JsonVariantConst value) {
    if (value.isNull()) {
        return std::string();
    }
    if (value.is<const char*>()) {
        return trim(value.as<const char*>());
    }
    if (value.is<JsonObjectConst>() || value.is<JsonArrayConst>()) {
        return std::string();
    }
    char buf[32];
    size_t len = serializeJson(value, buf, sizeof(buf));
    return trim(std::string(buf, len));
}

std::string firstNonEmpty(JsonObjectConst merged, const char* const* keys) {
    for (size_t i = 0; keys[i] != nullptr; i++) {
        std::string text = toText(merged[keys[i]]);
        if (!text.empty()) {
            return text;
        }
    }
    return std::string();
}

// Wide enough for any uint32_t on the ESP32, where long is 32 bits
bool toInteger(JsonVariantConst value, long long& out) {
    if (value.is<long long>()) {
        out = value.as<long long>();
        return true;
    }
    if (value.is<double>()) {
        double parsed = value.as<double>();
        if (parsed != parsed) {
            return false;
        }
        if (parsed > 1e15) {
            parsed = 1e15;
        } else if (parsed < -1e15) {
            parsed = -1e15;
        }
        out = (long long)parsed;
        return true;
    }
    if (value.is<const char*>()) {
        std::string text = trim(value.as<const char*>());
        if (text.empty()) {
            return false;
        }
        char* end = nullptr;
        long long parsed = strtoll(text.c_str(), &end, 10);
        if (end == nullptr || *end != '\0') {
            return false;
        }
        out = parsed;
        return true;
    }
    return false;
}

// Negative or non-numeric values are ignored, large ones capped at `maxSeconds`
void readSeconds(JsonObjectConst merged, const char* key, uint32_t maxSeconds, uint32_t& target) {
    JsonVariantConst value = merged[key];
    if (value.isNull()) {
        return;
    }
    long long parsed = 0;
    if (!toInteger(value, parsed) || parsed < 0) {
        ZTM_LOGW("Config: ignoring invalid %s", key);
        return;
    }
    if (parsed > (long long)maxSeconds) {
        ZTM_LOGW("Config: %s capped at %u s", key, (unsigned)maxSeconds);
        parsed = maxSeconds;
    }
    target = (uint32_t)parsed;
}

void appendName(std::string& list, const char* name) {
    if (!list.empty()) {
        list += ", ";
    }
    list += name;
}

} // namespace

ClientOptions::ClientOptions()
    : timeoutSeconds(DEFAULT_TIMEOUT_SECONDS),
      stopInfoTtlSeconds(0),
      maxDepartures(1),
      refreshIntervalSeconds(DEFAULT_REFRESH_INTERVAL_SECONDS),
      retryDelaySeconds(120),
      jitterMaxSeconds(45) {
}

std::string SubscriptionConfig::title() const {
    return "Line " + line + " from " + stopId + "/" + stopNr;
}

bool isValidStopNumber(const std::string& stopNr) {
    return stopNr.size() == 2 &&
           stopNr[0] >= '0' && stopNr[0] <= '9' &&
           stopNr[1] >= '0' && stopNr[1] <= '9';
}

bool parseSubscriptionConfig(JsonVariantConst data, JsonVariantConst options,
                             SubscriptionConfig& out, std::string& error) {
    JsonDocument merged;
    merged.to<JsonObject>();
    if (data.is<JsonObjectConst>()) {
        for (JsonPairConst kv : data.as<JsonObjectConst>()) {
            merged[kv.key()] = kv.value();
        }
    }
    if (options.is<JsonObjectConst>()) {
        for (JsonPairConst kv : options.as<JsonObjectConst>()) {
            merged[kv.key()] = kv.value();
        }
    }
    JsonObjectConst fields = merged.as<JsonObjectConst>();

    SubscriptionConfig config;
    config.apiKey = firstNonEmpty(fields, API_KEY_KEYS);
    config.stopId = firstNonEmpty(fields, STOP_ID_KEYS);
    config.stopNr = firstNonEmpty(fields, STOP_NR_KEYS);
    config.line = firstNonEmpty(fields, LINE_KEYS);

    std::string missing;
    if (config.stopId.empty()) {
        appendName(missing, "stop_id");
    }
    if (config.stopNr.empty()) {
        appendName(missing, "stop_nr");
    }
    if (config.line.empty()) {
        appendName(missing, "line");
    }

    if (config.apiKey.empty()) {
        // Do not reveal which credential is absent
        error = "Missing required configuration. Please reconfigure.";
        ZTM_LOGE("%s", error.c_str());
        return false;
    }
    if (!missing.empty()) {
        error = "Missing required config: " + missing;
        ZTM_LOGE("%s", error.c_str());
        return false;
    }

    ClientOptions& opts = config.options;
    readSeconds(fields, "timeout_seconds", ClientOptions::MAX_TIMEOUT_SECONDS, opts.timeoutSeconds);
    readSeconds(fields, "stop_info_ttl_seconds", ClientOptions::MAX_STOP_INFO_TTL_SECONDS,
                opts.stopInfoTtlSeconds);
    readSeconds(fields, "refresh_interval", ClientOptions::MAX_REFRESH_INTERVAL_SECONDS,
                opts.refreshIntervalSeconds);
    readSeconds(fields, "retry_delay_seconds", ClientOptions::MAX_RETRY_DELAY_SECONDS,
                opts.retryDelaySeconds);
    readSeconds(fields, "jitter_max_seconds", ClientOptions::MAX_JITTER_SECONDS, opts.jitterMaxSeconds);

    if (opts.timeoutSeconds == 0) {
        opts.timeoutSeconds = ClientOptions::DEFAULT_TIMEOUT_SECONDS;
    }

    JsonVariantConst departures = fields["max_departures_to_expose"];
    if (departures.isNull()) {
        departures = fields["departures"];
    }
    long long count = 0;
    if (!departures.isNull() && toInteger(departures, count)) {
        if (count < ClientOptions::MIN_DEPARTURES) {
            count = ClientOptions::MIN_DEPARTURES;
        }
        if (count > ClientOptions::MAX_DEPARTURES) {
            count = ClientOptions::MAX_DEPARTURES;
        }
        opts.maxDepartures = (int)count;
    }

    out = config;
    error.clear();
    return true;
}

bool updateSubscriptionConfig(const SubscriptionConfig& current, JsonVariantConst changes,
                              SubscriptionConfig& out, std::string& error) {
    JsonDocument base;
    writeSubscriptionConfig(current, base);
    return parseSubscriptionConfig(base.as<JsonVariantConst>(), changes, out, error);
}

void writeSubscriptionConfig(const SubscriptionConfig& config, JsonDocument& doc) {
    doc.clear();
    doc["api_key"] = config.apiKey;
    doc["stop_id"] = config.stopId;
    doc["stop_nr"] = config.stopNr;
    doc["line"] = config.line;
    doc["timeout_seconds"] = config.options.timeoutSeconds;
    doc["stop_info_ttl_seconds"] = config.options.stopInfoTtlSeconds;
    doc["max_departures_to_expose"] = config.options.maxDepartures;
    doc["refresh_interval"] = config.options.refreshIntervalSeconds;
    doc["retry_delay_seconds"] = config.options.retryDelaySeconds;
    doc["jitter_max_seconds"] = config.options.jitterMaxSeconds;
}
