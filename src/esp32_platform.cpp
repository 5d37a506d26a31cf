#include "esp32_platform.h"
#include <HTTPClient.h>
#include "config.h"
#include "ztm_log.h"

// ============================================================================
// HTTP TRANSPORT
// ============================================================================

Esp32HttpTransport::Esp32HttpTransport() {
}

void Esp32HttpTransport::init() {
    // api.um.warszawa.pl is only reachable over HTTPS
    secureClient.setInsecure();
    DEBUG_PRINTLN("ZTM HTTP transport initialized");
}

HttpResponse Esp32HttpTransport::get(const std::string& url, const QueryParams& params,
                                     uint32_t timeoutMs) {
    std::string fullUrl = buildQueryUrl(url, params);

    HTTPClient http;
    if (!http.begin(secureClient, fullUrl.c_str())) {
        return HttpResponse(HTTP_TRANSPORT_CONNECTION_REFUSED, std::string());
    }
    // HTTPClient's read timeout is 16-bit on the 2.x core
    http.setTimeout(timeoutMs > 0xFFFF ? 0xFFFF : timeoutMs);
    http.setConnectTimeout(timeoutMs);
    http.setFollowRedirects(HTTPC_STRICT_FOLLOW_REDIRECTS);

    uint32_t startMs = millis();
    int httpCode = classifyTransportStatus(http.GET(), millis() - startMs, timeoutMs);
    HttpResponse response;
    response.status = httpCode;
    if (httpCode > 0) {
        String body = http.getString();
        response.body.assign(body.c_str(), body.length());
    }
    http.end();
    return response;
}

// ============================================================================
// CLOCK
// ============================================================================

time_t Esp32Clock::nowUtc() const {
    time_t now = time(nullptr);
    return isClockSynced(now) ? now : 0;
}

uint32_t Esp32Clock::monotonicMs() const {
    return millis();
}

void Esp32Clock::sleepMs(uint32_t ms) {
    delay(ms);
}

uint32_t esp32Random(uint32_t upperInclusive) {
    return (uint32_t)random(0, (long)upperInclusive + 1);
}

// ============================================================================
// LOGGING
// ============================================================================

namespace {

void serialSink(LogLevel level, const char* message) {
    Serial.printf("[%s] %s\n", ztmLogLevelTag(level), message);
}

} // namespace

void installSerialLogSink() {
#if DEBUG_SERIAL
    ztmSetLogSink(serialSink, LogLevel::Debug);
#else
    ztmSetLogSink(nullptr);
#endif
}
