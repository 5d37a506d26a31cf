#include "subscription_validator.h"
#include "api_requester.h"
#include "subscription_config.h"
#include "timetable_codec.h"
#include "ztm_log.h"

#include <string.h>

const char* const SubscriptionValidator::ENDPOINT = "https://api.um.warszawa.pl/api/action/dbtimetable_get/";
const char* const SubscriptionValidator::LINES_DATASET_ID = "88cd555f-6f31-43ca-9de4-66c479ad5942";
const char* const SubscriptionValidator::TIMETABLE_DATASET_ID = "e923fa0e-d96c-43f9-ae6e-60518c9f3238";
const uint32_t SubscriptionValidator::DEFAULT_TIMEOUT_SECONDS;

SubscriptionValidator::SubscriptionValidator(HttpTransport& transport, uint32_t timeoutSeconds)
    : transport(transport),
      timeoutMs((timeoutSeconds > 0 ? timeoutSeconds : DEFAULT_TIMEOUT_SECONDS) * 1000UL) {
}

SubscriptionValidator::Result SubscriptionValidator::validate(const std::string& apiKey,
                                                              const std::string& stopId,
                                                              const std::string& stopNr,
                                                              const std::string& line) {
    if (!isValidStopNumber(stopNr)) {
        return VALIDATION_INVALID_STOP_NUMBER;
    }

    // 1. Which lines call at this post?
    QueryParams lineParams;
    lineParams.push_back(std::make_pair(std::string("id"), std::string(LINES_DATASET_ID)));
    lineParams.push_back(std::make_pair(std::string("busstopId"), stopId));
    lineParams.push_back(std::make_pair(std::string("busstopNr"), stopNr));
    lineParams.push_back(std::make_pair(std::string("apikey"), apiKey));

    JsonDocument doc;
    Result outcome = request(lineParams, doc);
    if (outcome != VALIDATION_OK) {
        return outcome;
    }
    outcome = checkLine(doc["result"].as<JsonVariantConst>(), line);
    if (outcome != VALIDATION_OK) {
        return outcome;
    }

    // 2. Does the line have any departures from it?
    QueryParams timetableParams;
    timetableParams.push_back(std::make_pair(std::string("id"), std::string(TIMETABLE_DATASET_ID)));
    timetableParams.push_back(std::make_pair(std::string("busstopId"), stopId));
    timetableParams.push_back(std::make_pair(std::string("busstopNr"), stopNr));
    timetableParams.push_back(std::make_pair(std::string("line"), line));
    timetableParams.push_back(std::make_pair(std::string("apikey"), apiKey));

    outcome = request(timetableParams, doc);
    if (outcome != VALIDATION_OK) {
        return outcome;
    }
    return checkTimes(doc["result"].as<JsonVariantConst>());
}

SubscriptionValidator::Result SubscriptionValidator::request(const QueryParams& params, JsonDocument& doc) {
    doc.clear();
    HttpResponse response = transport.get(ENDPOINT, params, timeoutMs);

    if (response.isTransportError()) {
        ZTM_LOGE("API connection error %d [%s]", response.status,
                 ApiRequester::describeParams(params).c_str());
        return VALIDATION_CONNECTION_ERROR;
    }
    if (response.status != 200) {
        return VALIDATION_API_HTTP_ERROR;
    }

    DeserializationError error = deserializeJson(doc, response.body);
    if (error) {
        ZTM_LOGE("Invalid JSON during validation: %s", error.c_str());
        return VALIDATION_CONNECTION_ERROR;
    }
    return VALIDATION_OK;
}

SubscriptionValidator::Result SubscriptionValidator::checkLine(JsonVariantConst result, const std::string& line) {
    if (result.is<const char*>() && strcmp(result.as<const char*>(), "false") == 0) {
        return VALIDATION_INVALID_API_KEY;
    }
    if (result.isNull()) {
        return VALIDATION_LINE_CHECK_FAILED;
    }
    if (!result.is<JsonArrayConst>()) {
        return VALIDATION_LINE_NOT_FOUND;
    }

    for (JsonVariantConst item : result.as<JsonArrayConst>()) {
        if (!item.is<JsonObjectConst>()) {
            continue;
        }
        RawRow values;
        if (!TimetableCodec::flattenRow(item["values"], values)) {
            continue;
        }
        RawRow::const_iterator served = values.find("linia");
        if (served != values.end() && served->second == line) {
            return VALIDATION_OK;
        }
    }
    return VALIDATION_LINE_NOT_FOUND;
}

SubscriptionValidator::Result SubscriptionValidator::checkTimes(JsonVariantConst result) {
    if (result.is<const char*>() && strcmp(result.as<const char*>(), "false") == 0) {
        return VALIDATION_INVALID_API_KEY;
    }
    if (result.isNull()) {
        return VALIDATION_NO_DEPARTURES;
    }
    if (!result.is<JsonArrayConst>()) {
        return VALIDATION_NO_VALID_TIMES;
    }

    for (JsonVariantConst row : result.as<JsonArrayConst>()) {
        RawRow fields;
        if (!TimetableCodec::flattenRow(row, fields)) {
            continue;
        }
        RawRow::const_iterator clock = fields.find("czas");
        if (clock != fields.end() && TimetableCodec::isClockFormat(clock->second)) {
            return VALIDATION_OK;
        }
    }
    return VALIDATION_NO_VALID_TIMES;
}

const char* SubscriptionValidator::resultKey(Result result) {
    switch (result) {
        case VALIDATION_OK:
            return "ok";
        case VALIDATION_INVALID_STOP_NUMBER:
            return "invalid_stop_number";
        case VALIDATION_API_HTTP_ERROR:
            return "api_http_error";
        case VALIDATION_INVALID_API_KEY:
            return "invalid_api_key";
        case VALIDATION_LINE_CHECK_FAILED:
            return "line_check_failed";
        case VALIDATION_LINE_NOT_FOUND:
            return "line_not_found";
        case VALIDATION_NO_DEPARTURES:
            return "no_departures";
        case VALIDATION_NO_VALID_TIMES:
            return "no_valid_times";
        case VALIDATION_CONNECTION_ERROR:
            return "api_connection_error";
    }
    return "unknown";
}

const char* SubscriptionValidator::describe(Result result) {
    switch (result) {
        case VALIDATION_OK:
            return "Configuration verified";
        case VALIDATION_INVALID_STOP_NUMBER:
            return "Stop number must be exactly two digits (e.g. 01)";
        case VALIDATION_API_HTTP_ERROR:
            return "The ZTM API returned an error. Try again later.";
        case VALIDATION_INVALID_API_KEY:
            return "The API key was rejected";
        case VALIDATION_LINE_CHECK_FAILED:
            return "Could not list the lines serving this stop";
        case VALIDATION_LINE_NOT_FOUND:
            return "This line does not call at the given stop";
        case VALIDATION_NO_DEPARTURES:
            return "No departures found for this line at this stop";
        case VALIDATION_NO_VALID_TIMES:
            return "The timetable has no valid departure times";
        case VALIDATION_CONNECTION_ERROR:
            return "Could not connect to the ZTM API";
    }
    return "Unknown error";
}
