#include <gtest/gtest.h>
#include "api_requester.h"
#include "fakes.h"
#include "stop_info_cache.h"

class StopInfoCacheTest : public ::testing::Test {
protected:
    StopInfoCacheTest()
        : requester(transport, clock),
          cache(requester, clock, "secret-key", "7009", "01") {
        clock.setLocal(2025, 6, 10, 12, 0);
    }

    void enqueueStops() {
        transport.enqueueJson(resultList(
            stopEntry("7008", "01", "Dworzec Gdanski") + "," +
            stopEntry("7009", "02", "Centrum (post 02)") + "," +
            stopEntry("7009", "01", "Centrum")));
    }

    FakeClock clock;
    FakeHttpTransport transport;
    ApiRequester requester;
    StopInfoCache cache;
};

TEST_F(StopInfoCacheTest, PrefersExactPostMatch) {
    enqueueStops();

    StopMetadata info;
    ASSERT_TRUE(cache.fetchOrGetCached(info));
    EXPECT_EQ("Centrum", info["nazwa_zespolu"]);
    EXPECT_EQ("Centrum", info["stop_name"]);
    EXPECT_EQ("52.2296", info["szer_geo"]);
    EXPECT_EQ(0u, info.count("zespol"));
    EXPECT_EQ(0u, info.count("slupek"));

    const RecordedRequest& request = transport.lastRequest();
    EXPECT_EQ(StopInfoCache::ENDPOINT, request.url);
    EXPECT_EQ(StopInfoCache::DATASET_ID, request.param("id"));
    EXPECT_EQ("secret-key", request.param("apikey"));
}

TEST_F(StopInfoCacheTest, FallsBackToFirstEntryOfStopGroup) {
    StopInfoCache otherPost(requester, clock, "secret-key", "7009", "05");
    enqueueStops();

    StopMetadata info;
    ASSERT_TRUE(otherPost.fetchOrGetCached(info));
    EXPECT_EQ("Centrum (post 02)", info["stop_name"]);
}

TEST_F(StopInfoCacheTest, CachedValueServedWithoutNetworkWhenTtlDisabled) {
    enqueueStops();

    StopMetadata info;
    ASSERT_TRUE(cache.fetchOrGetCached(info));
    clock.advanceSeconds(30 * 24 * 3600);
    for (int i = 0; i < 100; i++) {
        ASSERT_TRUE(cache.fetchOrGetCached(info));
    }
    EXPECT_EQ(1u, transport.callCount());
}

TEST_F(StopInfoCacheTest, RefreshesAfterTtlAndKeepsOldValueOnFailure) {
    StopInfoCache ttlCache(requester, clock, "secret-key", "7009", "01", 3600);
    enqueueStops();

    StopMetadata info;
    ASSERT_TRUE(ttlCache.fetchOrGetCached(info));
    clock.advanceSeconds(1800);
    ASSERT_TRUE(ttlCache.fetchOrGetCached(info));
    EXPECT_EQ(1u, transport.callCount());

    clock.advanceSeconds(1801);
    transport.enqueue(404, "");
    StopMetadata refreshed;
    EXPECT_FALSE(ttlCache.fetchOrGetCached(refreshed));
    EXPECT_EQ(2u, transport.callCount());
    EXPECT_TRUE(ttlCache.hasValue());
    EXPECT_EQ("Centrum", ttlCache.current().at("stop_name"));
    EXPECT_EQ(1, ttlCache.attemptCount());
}

TEST_F(StopInfoCacheTest, BacksOffThenGivesUpAfterThreeFailures) {
    time_t start = clock.nowUtc();

    transport.enqueue(404, "");
    StopMetadata info;
    EXPECT_FALSE(cache.fetchOrGetCached(info));
    EXPECT_EQ(1, cache.attemptCount());
    EXPECT_EQ(start + 2 * 3600, cache.nextRetryAt());

    // Inside the 2h window nothing goes out
    clock.advanceSeconds(3600);
    EXPECT_FALSE(cache.fetchOrGetCached(info));
    EXPECT_EQ(1u, transport.callCount());

    clock.advanceSeconds(3600);
    transport.enqueueJson("{\"result\":null}");
    EXPECT_FALSE(cache.fetchOrGetCached(info));
    EXPECT_EQ(2, cache.attemptCount());
    EXPECT_EQ(clock.nowUtc() + 6 * 3600, cache.nextRetryAt());
    EXPECT_FALSE(cache.isPermanentlyMissing());

    clock.advanceSeconds(6 * 3600);
    transport.enqueueJson(resultList(stopEntry("1234", "01", "Elsewhere")));
    EXPECT_FALSE(cache.fetchOrGetCached(info));
    EXPECT_EQ(3, cache.attemptCount());
    EXPECT_TRUE(cache.isPermanentlyMissing());
    EXPECT_EQ(0, cache.nextRetryAt());
    EXPECT_EQ(3u, transport.callCount());
}

TEST_F(StopInfoCacheTest, PermanentlyMissingNeverCallsNetwork) {
    for (int attempt = 0; attempt < StopInfoCache::MAX_ATTEMPTS; attempt++) {
        transport.enqueue(404, "");
        StopMetadata info;
        cache.fetchOrGetCached(info);
        clock.advanceSeconds(7 * 3600);
    }
    ASSERT_TRUE(cache.isPermanentlyMissing());
    size_t calls = transport.callCount();

    for (int i = 0; i < 5000; i++) {
        StopMetadata info;
        EXPECT_FALSE(cache.fetchOrGetCached(info));
        clock.advanceSeconds(3600);
    }
    EXPECT_EQ(calls, transport.callCount());
    EXPECT_TRUE(cache.isPermanentlyMissing());
}

TEST_F(StopInfoCacheTest, ResetClearsGiveUpState) {
    for (int attempt = 0; attempt < StopInfoCache::MAX_ATTEMPTS; attempt++) {
        transport.enqueue(404, "");
        StopMetadata info;
        cache.fetchOrGetCached(info);
        clock.advanceSeconds(7 * 3600);
    }
    ASSERT_TRUE(cache.isPermanentlyMissing());

    cache.reset();
    EXPECT_FALSE(cache.isPermanentlyMissing());
    EXPECT_EQ(0, cache.attemptCount());

    enqueueStops();
    StopMetadata info;
    EXPECT_TRUE(cache.fetchOrGetCached(info));
    EXPECT_EQ("Centrum", info["stop_name"]);
}

TEST_F(StopInfoCacheTest, StringResultRetriedOnceAfterShortPause) {
    transport.enqueueJson("{\"result\":\"Błędna metoda lub parametry wywołania\"}");
    enqueueStops();

    StopMetadata info;
    ASSERT_TRUE(cache.fetchOrGetCached(info));
    EXPECT_EQ("Centrum", info["stop_name"]);
    EXPECT_EQ(2u, transport.callCount());
    EXPECT_EQ(StopInfoCache::STRING_RESULT_RETRY_MS, clock.totalSleptMs());
    EXPECT_EQ(0, cache.attemptCount());
}

TEST_F(StopInfoCacheTest, PersistentStringResultCountsAsOneFailure) {
    transport.enqueueJson("{\"result\":\"false\"}");
    transport.enqueueJson("{\"result\":\"false\"}");

    StopMetadata info;
    EXPECT_FALSE(cache.fetchOrGetCached(info));
    EXPECT_EQ(2u, transport.callCount());
    EXPECT_EQ(1, cache.attemptCount());
}

TEST_F(StopInfoCacheTest, SuccessResetsFailureCounter) {
    transport.enqueue(404, "");
    StopMetadata info;
    EXPECT_FALSE(cache.fetchOrGetCached(info));
    ASSERT_EQ(1, cache.attemptCount());

    clock.advanceSeconds(2 * 3600);
    enqueueStops();
    EXPECT_TRUE(cache.fetchOrGetCached(info));
    EXPECT_EQ(0, cache.attemptCount());
    EXPECT_EQ(0, cache.nextRetryAt());
    EXPECT_EQ(clock.nowUtc(), cache.lastFetchAt());
}
