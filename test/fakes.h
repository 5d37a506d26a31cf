#ifndef ZTM_TEST_FAKES_H
#define ZTM_TEST_FAKES_H

#include <deque>
#include <string>
#include <vector>
#include "clock.h"
#include "http_transport.h"
#include "local_time.h"

// Manually driven wall clock and monotonic clock. sleepMs() advances both.
class FakeClock : public Clock {
public:
    FakeClock() : utc(0), ms(0), slept(0) {}

    time_t nowUtc() const override { return utc; }
    uint32_t monotonicMs() const override { return ms; }

    void sleepMs(uint32_t duration) override {
        slept += duration;
        advanceMs(duration);
    }

    void setUtc(time_t value) { utc = value; }

    // Jump to a Europe/Warsaw wall-clock time
    void setLocal(int year, int month, int day, int hour, int minute, int second = 0) {
        utc = fromLocalTime(year, month, day, hour, minute, second);
    }

    void advanceMs(uint32_t duration) {
        ms += duration;
        utc += (time_t)(duration / 1000);
    }

    void advanceSeconds(uint32_t seconds) { advanceMs(seconds * 1000UL); }

    uint32_t totalSleptMs() const { return slept; }

private:
    time_t utc;
    uint32_t ms;
    uint32_t slept;
};

struct RecordedRequest {
    std::string url;
    QueryParams params;
    uint32_t timeoutMs;

    std::string param(const std::string& name) const {
        for (size_t i = 0; i < params.size(); i++) {
            if (params[i].first == name) {
                return params[i].second;
            }
        }
        return std::string();
    }
};

// Replays queued responses in order. An empty queue answers with a
// connection failure so unexpected calls show up as failures, not hangs.
class FakeHttpTransport : public HttpTransport {
public:
    HttpResponse get(const std::string& url, const QueryParams& params,
                     uint32_t timeoutMs) override {
        RecordedRequest request;
        request.url = url;
        request.params = params;
        request.timeoutMs = timeoutMs;
        requests.push_back(request);

        if (responses.empty()) {
            return HttpResponse(HTTP_TRANSPORT_CONNECTION_REFUSED, std::string());
        }
        HttpResponse response = responses.front();
        responses.pop_front();
        return response;
    }

    void enqueue(int status, const std::string& body) {
        responses.push_back(HttpResponse(status, body));
    }

    void enqueueJson(const std::string& body) { enqueue(200, body); }

    size_t callCount() const { return requests.size(); }

    size_t callsTo(const std::string& url) const {
        size_t count = 0;
        for (size_t i = 0; i < requests.size(); i++) {
            if (requests[i].url == url) {
                count++;
            }
        }
        return count;
    }

    const RecordedRequest& lastRequest() const { return requests.back(); }

    std::vector<RecordedRequest> requests;
    std::deque<HttpResponse> responses;
};

// {"key": k, "value": v} pair inside a timetable row
inline std::string kv(const std::string& key, const std::string& value) {
    return "{\"key\":\"" + key + "\",\"value\":\"" + value + "\"}";
}

// One dbtimetable_get row
inline std::string timetableRow(const std::string& clock, const std::string& headsign) {
    return "[" + kv("symbol_2", "null") + "," + kv("symbol_1", "null") + "," +
           kv("brygada", "3") + "," + kv("kierunek", headsign) + "," +
           kv("trasa", "TP-WIL") + "," + kv("czas", clock) + "]";
}

// One dbstore_get entry
inline std::string stopEntry(const std::string& group, const std::string& post,
                             const std::string& name) {
    return "{\"values\":[" + kv("zespol", group) + "," + kv("slupek", post) + "," +
           kv("nazwa_zespolu", name) + "," + kv("id_ulicy", "1234") + "," +
           kv("szer_geo", "52.2296") + "," + kv("dlug_geo", "21.0122") + "," +
           kv("kierunek", "Centrum") + "]}";
}

inline std::string resultList(const std::string& items) {
    return "{\"result\":[" + items + "]}";
}

#endif // ZTM_TEST_FAKES_H
