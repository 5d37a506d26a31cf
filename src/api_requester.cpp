#include "api_requester.h"
#include "ztm_log.h"

namespace {

std::string sanitize(const std::string& value) {
    std::string out = value;
    for (size_t i = 0; i < out.size(); i++) {
        char c = out[i];
        bool safe = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                    (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!safe) {
            out[i] = '*';
        }
    }
    return out;
}

uint32_t effectiveTimeoutMs(uint32_t seconds) {
    if (seconds == 0) {
        seconds = ApiRequester::DEFAULT_TIMEOUT_SECONDS;
    } else if (seconds > ApiRequester::MAX_TIMEOUT_SECONDS) {
        seconds = ApiRequester::MAX_TIMEOUT_SECONDS;
    }
    return seconds * 1000UL;
}

} // namespace

const int ApiRequester::DEFAULT_MAX_RETRIES;
const uint32_t ApiRequester::DEFAULT_BACKOFF_BASE_MS;
const uint32_t ApiRequester::DEFAULT_TIMEOUT_SECONDS;
const uint32_t ApiRequester::MAX_TIMEOUT_SECONDS;

ApiRequester::ApiRequester(HttpTransport& transport, Clock& clock, uint32_t timeoutSeconds)
    : transport(transport),
      clock(clock),
      requestTimeoutMs(effectiveTimeoutMs(timeoutSeconds)),
      maxRetries(DEFAULT_MAX_RETRIES),
      backoffBaseMs(DEFAULT_BACKOFF_BASE_MS),
      outcome(REQUEST_OK),
      status(0) {
}

void ApiRequester::setRetryPolicy(int retries, uint32_t baseMs) {
    maxRetries = retries < 0 ? 0 : retries;
    backoffBaseMs = baseMs;
}

bool ApiRequester::getWithRetry(const std::string& url, const QueryParams& params, JsonDocument& doc) {
    doc.clear();
    std::string ctx = describeParams(params);
    int attempt = 0;

    while (true) {
        HttpResponse response = transport.get(url, params, requestTimeoutMs);

        // Server-side trouble: retry with a linearly growing pause
        if (response.status >= 500 && response.status <= 599 && attempt < maxRetries) {
            attempt++;
            ZTM_LOGW("HTTP %d from %s [%s]; retrying (%d/%d)",
                     response.status, url.c_str(), ctx.c_str(), attempt, maxRetries);
            clock.sleepMs(backoffBaseMs * attempt);
            continue;
        }

        if (response.isTimeout()) {
            if (attempt < maxRetries) {
                attempt++;
                ZTM_LOGW("Timeout talking to %s [%s]; retrying (%d/%d)",
                         url.c_str(), ctx.c_str(), attempt, maxRetries);
                clock.sleepMs(backoffBaseMs * attempt);
                continue;
            }
            ZTM_LOGE("Timeout after %lus for %s [%s]",
                     (unsigned long)(requestTimeoutMs / 1000), url.c_str(), ctx.c_str());
            return fail(REQUEST_TIMEOUT, response.status, doc);
        }

        if (response.isTransportError()) {
            ZTM_LOGE("Network error %d for %s [%s]", response.status, url.c_str(), ctx.c_str());
            return fail(REQUEST_NETWORK_ERROR, response.status, doc);
        }

        if (response.status != 200) {
            ZTM_LOGE("HTTP %d from %s [%s]", response.status, url.c_str(), ctx.c_str());
            return fail(REQUEST_HTTP_ERROR, response.status, doc);
        }

        DeserializationError error = deserializeJson(doc, response.body);
        if (error) {
            ZTM_LOGE("Invalid JSON from %s [%s]: %s", url.c_str(), ctx.c_str(), error.c_str());
            return fail(REQUEST_INVALID_JSON, response.status, doc);
        }

        outcome = REQUEST_OK;
        status = response.status;
        return true;
    }
}

bool ApiRequester::fail(Outcome why, int code, JsonDocument& doc) {
    doc.clear();
    outcome = why;
    status = code;
    return false;
}

ApiRequester::Outcome ApiRequester::lastOutcome() const {
    return outcome;
}

int ApiRequester::lastStatus() const {
    return status;
}

uint32_t ApiRequester::timeoutMs() const {
    return requestTimeoutMs;
}

const char* ApiRequester::outcomeName(Outcome value) {
    switch (value) {
        case REQUEST_OK:
            return "ok";
        case REQUEST_HTTP_ERROR:
            return "http_error";
        case REQUEST_TIMEOUT:
            return "timeout";
        case REQUEST_NETWORK_ERROR:
            return "network_error";
        case REQUEST_INVALID_JSON:
            return "invalid_json";
    }
    return "unknown";
}

std::string ApiRequester::describeParams(const QueryParams& params) {
    static const char* const whitelist[][2] = {
        {"busstopId", "stop_id"},
        {"busstopNr", "stop_nr"},
        {"line", "line"}
    };

    std::string out;
    for (size_t w = 0; w < 3; w++) {
        for (size_t i = 0; i < params.size(); i++) {
            if (params[i].first != whitelist[w][0]) {
                continue;
            }
            if (!out.empty()) {
                out += ", ";
            }
            out += whitelist[w][1];
            out += '=';
            out += sanitize(params[i].second);
            break;
        }
    }
    return out;
}
