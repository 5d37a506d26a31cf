#ifndef SUBSCRIPTION_CONFIG_H
#define SUBSCRIPTION_CONFIG_H

#include <stdint.h>
#include <string>
#include <ArduinoJson.h>

// ============================================================================
// SUBSCRIPTION CONFIGURATION
// One stop post + line pair and the options that shape how it is polled.
// Stored as JSON (NVS on the device), parsed with key aliases so entries
// written by older portal versions keep working.
// ============================================================================

struct ClientOptions {
    static const uint32_t DEFAULT_TIMEOUT_SECONDS = 20;
    static const uint32_t DEFAULT_REFRESH_INTERVAL_SECONDS = 3600;
    static const uint32_t MAX_REFRESH_INTERVAL_SECONDS = 7 * 24 * 3600;
    static const uint32_t MAX_TIMEOUT_SECONDS = 120;
    static const uint32_t MAX_STOP_INFO_TTL_SECONDS = 30 * 24 * 3600;
    static const uint32_t MAX_RETRY_DELAY_SECONDS = 24 * 3600;
    static const uint32_t MAX_JITTER_SECONDS = 300;
    static const int MIN_DEPARTURES = 1;
    static const int MAX_DEPARTURES = 3;

    uint32_t timeoutSeconds;          // per request
    uint32_t stopInfoTtlSeconds;      // 0 = stop metadata is never refreshed
    int maxDepartures;                // departures exposed to the display layer
    uint32_t refreshIntervalSeconds;  // 0 disables the interval trigger
    uint32_t retryDelaySeconds;
    uint32_t jitterMaxSeconds;

    ClientOptions();
};

struct SubscriptionConfig {
    std::string apiKey;
    std::string stopId;   // stop group ("zespol"), e.g. "7009"
    std::string stopNr;   // stop post ("slupek"), two digits, e.g. "01"
    std::string line;
    ClientOptions options;

    // "Line 520 from 7009/01"
    std::string title() const;
};

// Merge `data` and `options` (options win), resolve aliases and fill `out`.
// On failure `error` names the missing fields, unless the API key is among
// them, in which case the message stays generic.
bool parseSubscriptionConfig(JsonVariantConst data, JsonVariantConst options,
                             SubscriptionConfig& out, std::string& error);

// Apply a partial update (e.g. a settings form) on top of `current`.
// Fields absent from `changes` keep their current values.
bool updateSubscriptionConfig(const SubscriptionConfig& current, JsonVariantConst changes,
                              SubscriptionConfig& out, std::string& error);

// Inverse of parseSubscriptionConfig, canonical key names only
void writeSubscriptionConfig(const SubscriptionConfig& config, JsonDocument& doc);

// Stop post numbers are exactly two digits
bool isValidStopNumber(const std::string& stopNr);

#endif // SUBSCRIPTION_CONFIG_H
