#ifndef SUBSCRIPTION_VALIDATOR_H
#define SUBSCRIPTION_VALIDATOR_H

#include <stdint.h>
#include <string>
#include <ArduinoJson.h>
#include "http_transport.h"

// ============================================================================
// SUBSCRIPTION VALIDATOR
// Checks a stop / post / line triple against the live API before it is
// saved: the line must call at the post and have at least one timetabled
// departure. Used by the setup portal.
// ============================================================================

class SubscriptionValidator {
public:
    enum Result {
        VALIDATION_OK,
        VALIDATION_INVALID_STOP_NUMBER,
        VALIDATION_API_HTTP_ERROR,
        VALIDATION_INVALID_API_KEY,
        VALIDATION_LINE_CHECK_FAILED,
        VALIDATION_LINE_NOT_FOUND,
        VALIDATION_NO_DEPARTURES,
        VALIDATION_NO_VALID_TIMES,
        VALIDATION_CONNECTION_ERROR
    };

    static const char* const ENDPOINT;
    static const char* const LINES_DATASET_ID;
    static const char* const TIMETABLE_DATASET_ID;
    static const uint32_t DEFAULT_TIMEOUT_SECONDS = 10;

    explicit SubscriptionValidator(HttpTransport& transport,
                                   uint32_t timeoutSeconds = DEFAULT_TIMEOUT_SECONDS);

    Result validate(const std::string& apiKey, const std::string& stopId,
                    const std::string& stopNr, const std::string& line);

    // Stable key, e.g. "line_not_found"
    static const char* resultKey(Result result);
    // Message for the setup form
    static const char* describe(Result result);

private:
    HttpTransport& transport;
    uint32_t timeoutMs;

    // VALIDATION_OK with `doc` filled, or the transport/HTTP failure
    Result request(const QueryParams& params, JsonDocument& doc);
    Result checkLine(JsonVariantConst result, const std::string& line);
    Result checkTimes(JsonVariantConst result);
};

#endif // SUBSCRIPTION_VALIDATOR_H
