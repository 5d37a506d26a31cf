#ifndef ESP32_PLATFORM_H
#define ESP32_PLATFORM_H

#include <Arduino.h>
#include <WiFiClientSecure.h>
#include "clock.h"
#include "http_transport.h"

// ============================================================================
// ESP32 PLATFORM
// HTTPClient transport, SNTP-backed clock and Serial log sink for the
// core library.
// ============================================================================

class Esp32HttpTransport : public HttpTransport {
public:
    Esp32HttpTransport();

    void init();

    HttpResponse get(const std::string& url, const QueryParams& params,
                     uint32_t timeoutMs) override;

private:
    WiFiClientSecure secureClient;
};

class Esp32Clock : public Clock {
public:
    time_t nowUtc() const override;
    uint32_t monotonicMs() const override;
    void sleepMs(uint32_t ms) override;
};

// Uniform integer in [0, upperInclusive] from the hardware RNG
uint32_t esp32Random(uint32_t upperInclusive);

// Routes ZTM_LOG* to Serial when DEBUG_SERIAL is enabled
void installSerialLogSink();

#endif // ESP32_PLATFORM_H
