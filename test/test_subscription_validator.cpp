#include <gtest/gtest.h>
#include "fakes.h"
#include "subscription_validator.h"

namespace {

std::string linesServing(const std::string& first, const std::string& second) {
    return resultList("{\"values\":[" + kv("linia", first) + "]}," +
                      "{\"values\":[" + kv("linia", second) + "]}");
}

} // namespace

class SubscriptionValidatorTest : public ::testing::Test {
protected:
    SubscriptionValidatorTest() : validator(transport) {}

    SubscriptionValidator::Result validate(const std::string& stopNr = "01",
                                           const std::string& line = "520") {
        return validator.validate("secret-key", "7009", stopNr, line);
    }

    FakeHttpTransport transport;
    SubscriptionValidator validator;
};

TEST_F(SubscriptionValidatorTest, AcceptsServedLineWithDepartures) {
    transport.enqueueJson(linesServing("128", "520"));
    transport.enqueueJson(resultList(timetableRow("08:15:00", "Marysin")));

    EXPECT_EQ(SubscriptionValidator::VALIDATION_OK, validate());
    ASSERT_EQ(2u, transport.callCount());

    const RecordedRequest& lines = transport.requests[0];
    EXPECT_EQ(SubscriptionValidator::ENDPOINT, lines.url);
    EXPECT_EQ(SubscriptionValidator::LINES_DATASET_ID, lines.param("id"));
    EXPECT_EQ("7009", lines.param("busstopId"));
    EXPECT_EQ("01", lines.param("busstopNr"));
    EXPECT_EQ("", lines.param("line"));
    EXPECT_EQ(10000u, lines.timeoutMs);

    const RecordedRequest& times = transport.requests[1];
    EXPECT_EQ(SubscriptionValidator::TIMETABLE_DATASET_ID, times.param("id"));
    EXPECT_EQ("520", times.param("line"));
    EXPECT_EQ("secret-key", times.param("apikey"));
}

TEST_F(SubscriptionValidatorTest, StopNumberCheckedBeforeNetwork) {
    EXPECT_EQ(SubscriptionValidator::VALIDATION_INVALID_STOP_NUMBER, validate("1"));
    EXPECT_EQ(SubscriptionValidator::VALIDATION_INVALID_STOP_NUMBER, validate("1a"));
    EXPECT_EQ(0u, transport.callCount());
}

TEST_F(SubscriptionValidatorTest, RejectedApiKey) {
    transport.enqueueJson("{\"result\":\"false\"}");
    EXPECT_EQ(SubscriptionValidator::VALIDATION_INVALID_API_KEY, validate());

    transport.enqueueJson(linesServing("520", "523"));
    transport.enqueueJson("{\"result\":\"false\"}");
    EXPECT_EQ(SubscriptionValidator::VALIDATION_INVALID_API_KEY, validate());
}

TEST_F(SubscriptionValidatorTest, LineChecks) {
    transport.enqueueJson("{\"result\":null}");
    EXPECT_EQ(SubscriptionValidator::VALIDATION_LINE_CHECK_FAILED, validate());

    transport.enqueueJson(linesServing("128", "523"));
    EXPECT_EQ(SubscriptionValidator::VALIDATION_LINE_NOT_FOUND, validate());

    transport.enqueueJson("{\"result\":\"Błędna metoda lub parametry wywołania\"}");
    EXPECT_EQ(SubscriptionValidator::VALIDATION_LINE_NOT_FOUND, validate());
    EXPECT_EQ(3u, transport.callCount());
}

TEST_F(SubscriptionValidatorTest, TimetableChecks) {
    transport.enqueueJson(linesServing("520", "523"));
    transport.enqueueJson("{\"result\":null}");
    EXPECT_EQ(SubscriptionValidator::VALIDATION_NO_DEPARTURES, validate());

    transport.enqueueJson(linesServing("520", "523"));
    transport.enqueueJson(resultList(timetableRow("8:15", "Marysin")));
    EXPECT_EQ(SubscriptionValidator::VALIDATION_NO_VALID_TIMES, validate());
}

TEST_F(SubscriptionValidatorTest, TransportFailures) {
    transport.enqueue(-1, "");
    EXPECT_EQ(SubscriptionValidator::VALIDATION_CONNECTION_ERROR, validate());

    transport.enqueue(403, "Forbidden");
    EXPECT_EQ(SubscriptionValidator::VALIDATION_API_HTTP_ERROR, validate());

    transport.enqueueJson("not json");
    EXPECT_EQ(SubscriptionValidator::VALIDATION_CONNECTION_ERROR, validate());

    transport.enqueueJson(linesServing("520", "523"));
    transport.enqueue(500, "");
    EXPECT_EQ(SubscriptionValidator::VALIDATION_API_HTTP_ERROR, validate());
}

TEST_F(SubscriptionValidatorTest, ResultKeysAndMessages) {
    EXPECT_STREQ("line_not_found",
                 SubscriptionValidator::resultKey(SubscriptionValidator::VALIDATION_LINE_NOT_FOUND));
    EXPECT_STREQ("api_connection_error",
                 SubscriptionValidator::resultKey(SubscriptionValidator::VALIDATION_CONNECTION_ERROR));
    EXPECT_STREQ("invalid_stop_number",
                 SubscriptionValidator::resultKey(SubscriptionValidator::VALIDATION_INVALID_STOP_NUMBER));
    EXPECT_STRNE("", SubscriptionValidator::describe(SubscriptionValidator::VALIDATION_NO_DEPARTURES));
}
