#ifndef API_REQUESTER_H
#define API_REQUESTER_H

#include <stdint.h>
#include <string>
#include <ArduinoJson.h>
#include "clock.h"
#include "http_transport.h"

// ============================================================================
// API REQUESTER
// GET + JSON decode with a small retry on timeouts and 5xx answers.
// Never throws: failure is a false return with the document left null.
// ============================================================================

class ApiRequester {
public:
    enum Outcome {
        REQUEST_OK,
        REQUEST_HTTP_ERROR,     // non-200 status (after retries for 5xx)
        REQUEST_TIMEOUT,        // still timing out after retries
        REQUEST_NETWORK_ERROR,  // connection refused, DNS failure, ...
        REQUEST_INVALID_JSON
    };

    static const int DEFAULT_MAX_RETRIES = 1;
    static const uint32_t DEFAULT_BACKOFF_BASE_MS = 1500;
    static const uint32_t DEFAULT_TIMEOUT_SECONDS = 20;
    static const uint32_t MAX_TIMEOUT_SECONDS = 120;

    ApiRequester(HttpTransport& transport, Clock& clock,
                 uint32_t timeoutSeconds = DEFAULT_TIMEOUT_SECONDS);

    // Backoff before retry n (1-based) is backoffBaseMs * n
    void setRetryPolicy(int maxRetries, uint32_t backoffBaseMs);

    bool getWithRetry(const std::string& url, const QueryParams& params, JsonDocument& doc);

    Outcome lastOutcome() const;
    int lastStatus() const;
    uint32_t timeoutMs() const;

    static const char* outcomeName(Outcome outcome);

    // "stop_id=..., stop_nr=..., line=..." built from whitelisted params only,
    // values sanitized. The API key never appears in logs.
    static std::string describeParams(const QueryParams& params);

private:
    HttpTransport& transport;
    Clock& clock;
    uint32_t requestTimeoutMs;
    int maxRetries;
    uint32_t backoffBaseMs;
    Outcome outcome;
    int status;

    bool fail(Outcome why, int code, JsonDocument& doc);
};

#endif // API_REQUESTER_H
