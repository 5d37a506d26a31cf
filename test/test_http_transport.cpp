#include <gtest/gtest.h>
#include "http_transport.h"

TEST(HttpTransportTest, SlowConnectFailureCountsAsTimeout) {
    EXPECT_EQ(HTTP_TRANSPORT_READ_TIMEOUT,
              classifyTransportStatus(HTTP_TRANSPORT_CONNECTION_REFUSED, 20000, 20000));
    EXPECT_EQ(HTTP_TRANSPORT_READ_TIMEOUT,
              classifyTransportStatus(HTTP_TRANSPORT_CONNECTION_LOST, 25000, 20000));
    EXPECT_EQ(HTTP_TRANSPORT_READ_TIMEOUT,
              classifyTransportStatus(HTTP_TRANSPORT_READ_TIMEOUT, 100, 20000));
}

TEST(HttpTransportTest, FastFailuresAndAnswersKeepTheirStatus) {
    EXPECT_EQ(HTTP_TRANSPORT_CONNECTION_REFUSED,
              classifyTransportStatus(HTTP_TRANSPORT_CONNECTION_REFUSED, 150, 20000));
    EXPECT_EQ(200, classifyTransportStatus(200, 30000, 20000));
    EXPECT_EQ(503, classifyTransportStatus(503, 30000, 20000));
}

TEST(HttpTransportTest, QueryUrlIsEncoded) {
    QueryParams params;
    params.push_back(std::make_pair("id", "e923fa0e-d96c-43f9-ae6e-60518c9f3238"));
    params.push_back(std::make_pair("line", "N 44/ä"));
    EXPECT_EQ("https://example.test/api?id=e923fa0e-d96c-43f9-ae6e-60518c9f3238&line=N%2044%2F%C3%A4",
              buildQueryUrl("https://example.test/api", params));
    EXPECT_EQ("https://example.test/api?x=1&a=b",
              buildQueryUrl("https://example.test/api?x=1", QueryParams(1, std::make_pair("a", "b"))));
}
