#include <gtest/gtest.h>
#include "api_requester.h"
#include "fakes.h"
#include "stop_info_cache.h"
#include "transit_client.h"

class TransitClientTest : public ::testing::Test {
protected:
    TransitClientTest()
        : requester(transport, clock),
          stopInfo(requester, clock, "secret-key", "7009", "01"),
          client(requester, stopInfo, clock, "secret-key", "7009", "01", "520") {
        clock.setLocal(2025, 6, 10, 12, 0);
    }

    void enqueueStopInfo() {
        transport.enqueueJson(resultList(stopEntry("7009", "01", "Centrum")));
    }

    FakeClock clock;
    FakeHttpTransport transport;
    ApiRequester requester;
    StopInfoCache stopInfo;
    TransitClient client;
};

TEST_F(TransitClientTest, SendsTimetableQuery) {
    enqueueStopInfo();
    transport.enqueueJson("{\"result\":null}");

    DepartureSnapshot snapshot;
    ASSERT_TRUE(client.fetchDepartures(snapshot));

    const RecordedRequest& request = transport.lastRequest();
    EXPECT_EQ(TransitClient::TIMETABLE_ENDPOINT, request.url);
    EXPECT_EQ(TransitClient::TIMETABLE_DATASET_ID, request.param("id"));
    EXPECT_EQ("secret-key", request.param("apikey"));
    EXPECT_EQ("7009", request.param("busstopId"));
    EXPECT_EQ("01", request.param("busstopNr"));
    EXPECT_EQ("520", request.param("line"));
    EXPECT_EQ(20000u, request.timeoutMs);
}

TEST_F(TransitClientTest, RequestTimeoutIsCapped) {
    ApiRequester slow(transport, clock, 4294967295u);
    EXPECT_EQ(ApiRequester::MAX_TIMEOUT_SECONDS * 1000u, slow.timeoutMs());
    ApiRequester unset(transport, clock, 0);
    EXPECT_EQ(ApiRequester::DEFAULT_TIMEOUT_SECONDS * 1000u, unset.timeoutMs());
}

TEST_F(TransitClientTest, ContextNeverContainsApiKey) {
    std::string context = client.context();
    EXPECT_EQ("stop_id=7009, stop_nr=01, line=520", context);
    EXPECT_EQ(std::string::npos, context.find("secret"));
}

TEST_F(TransitClientTest, NullResultIsEmptySuccess) {
    enqueueStopInfo();
    transport.enqueueJson("{\"result\":null}");

    DepartureSnapshot snapshot;
    EXPECT_TRUE(client.fetchDepartures(snapshot));
    EXPECT_TRUE(snapshot.isEmpty());
    EXPECT_EQ(clock.nowUtc(), snapshot.fetchedAtUtc);
    EXPECT_TRUE(snapshot.hasStopInfo);
    EXPECT_EQ("Centrum", snapshot.stopName());
    EXPECT_TRUE(client.getLastError().empty());
}

TEST_F(TransitClientTest, RefusedKeyIsFailureWithValidSnapshot) {
    enqueueStopInfo();
    transport.enqueueJson("{\"result\":\"false\"}");

    DepartureSnapshot snapshot;
    snapshot.departures.resize(3);
    EXPECT_FALSE(client.fetchDepartures(snapshot));
    EXPECT_TRUE(snapshot.isEmpty());
    EXPECT_EQ("api error: false", client.getLastError());
    EXPECT_EQ("Centrum", snapshot.stopName());
}

TEST_F(TransitClientTest, DecodesAndSortsDepartures) {
    enqueueStopInfo();
    transport.enqueueJson(resultList(
        timetableRow("12:30:00", "Kabaty") + "," +
        timetableRow("11:00:00", "Kabaty") + "," +
        timetableRow("25:10:00", "Zajezdnia")));

    DepartureSnapshot snapshot;
    ASSERT_TRUE(client.fetchDepartures(snapshot));
    ASSERT_EQ(3u, snapshot.departures.size());

    EXPECT_EQ("12:30:00", snapshot.departures[0].reading.scheduledClock);
    EXPECT_EQ(30, snapshot.departures[0].minutesToDepart(clock.nowUtc()));
    EXPECT_EQ("25:10:00", snapshot.departures[1].reading.scheduledClock);
    EXPECT_TRUE(snapshot.departures[1].reading.isNightService());
    EXPECT_EQ(fromLocalTime(2025, 6, 11, 1, 10, 0), snapshot.departures[1].departureUtc);
    EXPECT_EQ("11:00:00", snapshot.departures[2].reading.scheduledClock);

    const DepartureReading& first = snapshot.departures[0].reading;
    EXPECT_EQ("Kabaty", first.headsign);
    EXPECT_EQ("TP-WIL", first.routeId);
    EXPECT_EQ("3", first.brigade);
}

TEST_F(TransitClientTest, MalformedRowsAreDropped) {
    enqueueStopInfo();
    transport.enqueueJson(
        "{\"result\":[" + timetableRow("13:00:00", "Kabaty") + "," +
        "{\"key\":\"czas\",\"value\":\"14:00:00\"}," +
        "\"garbage\"," +
        timetableRow("9:5", "Broken") + "]}");

    DepartureSnapshot snapshot;
    ASSERT_TRUE(client.fetchDepartures(snapshot));
    ASSERT_EQ(1u, snapshot.departures.size());
    EXPECT_EQ("13:00:00", snapshot.departures[0].reading.scheduledClock);
}

TEST_F(TransitClientTest, NonArrayResultIsFailure) {
    enqueueStopInfo();
    transport.enqueueJson("{\"result\":{\"unexpected\":true}}");

    DepartureSnapshot snapshot;
    EXPECT_FALSE(client.fetchDepartures(snapshot));
    EXPECT_TRUE(snapshot.isEmpty());
    EXPECT_EQ("unexpected result type", client.getLastError());
}

TEST_F(TransitClientTest, RetriesServerErrorOnce) {
    enqueueStopInfo();
    transport.enqueue(503, "Service Unavailable");
    transport.enqueueJson(resultList(timetableRow("12:45:00", "Kabaty")));

    DepartureSnapshot snapshot;
    ASSERT_TRUE(client.fetchDepartures(snapshot));
    EXPECT_EQ(1u, snapshot.departures.size());
    EXPECT_EQ(2u, transport.callsTo(TransitClient::TIMETABLE_ENDPOINT));
    EXPECT_EQ(ApiRequester::DEFAULT_BACKOFF_BASE_MS, clock.totalSleptMs());
}

TEST_F(TransitClientTest, PersistentServerErrorIsHttpError) {
    enqueueStopInfo();
    transport.enqueue(502, "");
    transport.enqueue(502, "");

    DepartureSnapshot snapshot;
    EXPECT_FALSE(client.fetchDepartures(snapshot));
    EXPECT_EQ("http_error", client.getLastError());
    EXPECT_EQ(502, requester.lastStatus());
    EXPECT_EQ(2u, transport.callsTo(TransitClient::TIMETABLE_ENDPOINT));
}

TEST_F(TransitClientTest, TimeoutIsReportedAfterRetry) {
    enqueueStopInfo();
    transport.enqueue(-11, "");
    transport.enqueue(-11, "");

    DepartureSnapshot snapshot;
    EXPECT_FALSE(client.fetchDepartures(snapshot));
    EXPECT_EQ("timeout", client.getLastError());
    EXPECT_EQ(ApiRequester::REQUEST_TIMEOUT, requester.lastOutcome());
    EXPECT_TRUE(snapshot.isEmpty());
}

TEST_F(TransitClientTest, InvalidJsonIsFailure) {
    enqueueStopInfo();
    transport.enqueueJson("<html>maintenance</html>");

    DepartureSnapshot snapshot;
    EXPECT_FALSE(client.fetchDepartures(snapshot));
    EXPECT_EQ("invalid_json", client.getLastError());
}

TEST_F(TransitClientTest, MissingStopInfoDoesNotBlockDepartures) {
    transport.enqueue(404, "");
    transport.enqueueJson(resultList(timetableRow("12:10:00", "Kabaty")));

    DepartureSnapshot snapshot;
    ASSERT_TRUE(client.fetchDepartures(snapshot));
    EXPECT_EQ(1u, snapshot.departures.size());
    EXPECT_FALSE(snapshot.hasStopInfo);
    EXPECT_TRUE(snapshot.stopName().empty());
}

TEST_F(TransitClientTest, StopInfoFetchedOnlyOnce) {
    enqueueStopInfo();
    transport.enqueueJson("{\"result\":null}");
    transport.enqueueJson("{\"result\":null}");

    DepartureSnapshot snapshot;
    ASSERT_TRUE(client.fetchDepartures(snapshot));
    ASSERT_TRUE(client.fetchDepartures(snapshot));
    EXPECT_EQ(1u, transport.callsTo(StopInfoCache::ENDPOINT));
    EXPECT_EQ(2u, transport.callsTo(TransitClient::TIMETABLE_ENDPOINT));
    EXPECT_EQ("Centrum", snapshot.stopName());
}

TEST_F(TransitClientTest, StopInfoRefreshedAfterTtl) {
    StopInfoCache expiring(requester, clock, "secret-key", "7009", "01", 600);
    TransitClient ttlClient(requester, expiring, clock, "secret-key", "7009", "01", "520");
    enqueueStopInfo();
    transport.enqueueJson("{\"result\":null}");
    transport.enqueueJson("{\"result\":null}");
    transport.enqueueJson(resultList(stopEntry("7009", "01", "Centrum 2")));
    transport.enqueueJson("{\"result\":null}");

    DepartureSnapshot snapshot;
    ASSERT_TRUE(ttlClient.fetchDepartures(snapshot));
    clock.advanceSeconds(300);
    ASSERT_TRUE(ttlClient.fetchDepartures(snapshot));
    EXPECT_EQ(1u, transport.callsTo(StopInfoCache::ENDPOINT));
    EXPECT_EQ("Centrum", snapshot.stopName());

    clock.advanceSeconds(301);
    ASSERT_TRUE(ttlClient.fetchDepartures(snapshot));
    EXPECT_EQ(2u, transport.callsTo(StopInfoCache::ENDPOINT));
    EXPECT_EQ("Centrum 2", snapshot.stopName());
}

TEST_F(TransitClientTest, FetchReturnsSnapshotEvenOnFailure) {
    enqueueStopInfo();
    transport.enqueue(404, "");

    DepartureSnapshot snapshot = client.fetch();
    EXPECT_TRUE(snapshot.isEmpty());
    EXPECT_EQ("Centrum", snapshot.stopName());
    EXPECT_EQ("http_error", client.getLastError());
}
