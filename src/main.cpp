/**
 * ============================================================================
 * ZTM WARSAW DEPARTURES
 * ESP32 departure board for one Warsaw public transport stop and line
 * ============================================================================
 *
 * Polls the City of Warsaw open data timetable (api.um.warszawa.pl) for a
 * single stop post / line pair and publishes the next departures to
 * Home Assistant.
 *
 * Features:
 * - Scheduled timetable from the ZTM open data API
 * - Hourly refresh plus nightly refreshes after the timetable update
 * - Last good timetable kept when the API is down
 * - Home Assistant integration via MQTT auto-discovery
 * - WiFi setup portal and web settings page with live validation
 *
 * License: MIT
 * ============================================================================
 */

#include <Arduino.h>
#include <WiFi.h>
#include <WebServer.h>
#include <DNSServer.h>
#include <Preferences.h>
#include <ArduinoJson.h>
#include <time.h>
#include <memory>
#include "config.h"
#include "esp32_platform.h"
#include "local_time.h"
#include "mqtt_ha.h"
#include "subscription_config.h"
#include "subscription_validator.h"
#include "timer_service.h"
#include "ztm_log.h"
#include "ztm_subscription.h"

// WiFi configuration portal
Preferences wifiPrefs;
WebServer configServer(80);
DNSServer dnsServer;
bool configPortalActive = false;

// Subscription settings
Preferences ztmPrefs;

// ============================================================================
// GLOBAL STATE
// ============================================================================

Esp32HttpTransport httpTransport;
Esp32Clock platformClock;
TimerService timers(platformClock);
std::unique_ptr<ZtmSubscription> subscription;
SubscriptionConfig activeConfig;

// Timing variables
unsigned long lastMqttPublish = 0;
unsigned long lastWifiReconnect = 0;

// Connection state
bool wifiConnected = false;
bool mqttConnected = false;
bool statePending = false;

// ============================================================================
// FUNCTION PROTOTYPES
// ============================================================================

void setupWiFi();
void setupTime();
void setupSettingsServer();
bool loadSubscriptionConfig(SubscriptionConfig& config);
bool saveSubscriptionConfig(const SubscriptionConfig& config);
void startSubscription();
void checkWiFi(unsigned long now);
void publishMqttState();
void handleMqttCommand(const String& command);

// ============================================================================
// SETUP
// ============================================================================

void setup() {
    Serial.begin(DEBUG_BAUD_RATE);
    delay(1000);
    installSerialLogSink();

    DEBUG_PRINTLN("\n\n");
    DEBUG_PRINTLN("========================================");
    DEBUG_PRINTLN("  ZTM WARSAW DEPARTURES");
    DEBUG_PRINTF("  Version: %s\n", FIRMWARE_VERSION);
    DEBUG_PRINTLN("========================================\n");

    DEBUG_PRINTLN("Connecting to WiFi...");
    setupWiFi();

    if (!wifiConnected) {
        // Portal is running; loop() serves it until the device reboots
        return;
    }

    DEBUG_PRINTLN("Synchronizing time...");
    setupTime();

    httpTransport.init();

    DEBUG_PRINTLN("Initializing MQTT...");
    mqtt.init();
    mqtt.setCommandCallback(handleMqttCommand);
    mqtt.connect();

    setupSettingsServer();

    if (!loadSubscriptionConfig(activeConfig)) {
        DEBUG_PRINTLN("No usable subscription configured. Open the settings page.");
    } else {
        DEBUG_PRINTF("Subscription: %s\n", activeConfig.title().c_str());
        startSubscription();
    }

    DEBUG_PRINTLN("\nSetup complete!\n");
}

// ============================================================================
// MAIN LOOP
// ============================================================================

void loop() {
    // Handle WiFi config portal if active
    if (configPortalActive) {
        dnsServer.processNextRequest();
        configServer.handleClient();
        delay(10);
        return;  // Don't run normal loop while in config mode
    }

    unsigned long now = millis();

    checkWiFi(now);
    configServer.handleClient();

    if (wifiConnected) {
        mqtt.loop();
        mqttConnected = mqtt.isConnected();
    }

    // Scheduled refreshes, retries and MQTT-requested refreshes
    timers.tick();

    // Minutes-to-departure change every minute even without a new fetch
    if (mqttConnected && subscription &&
        (statePending || now - lastMqttPublish >= MQTT_STATE_PUBLISH_INTERVAL_MS)) {
        publishMqttState();
        lastMqttPublish = now;
        statePending = false;
    }

    delay(10);
}

// ============================================================================
// WIFI SETUP
// ============================================================================

// Try to connect to WiFi with given credentials
bool tryWiFiConnect(const char* ssid, const char* password, int timeoutMs) {
    WiFi.disconnect(true);
    delay(100);
    WiFi.mode(WIFI_STA);
    WiFi.setSleep(false);

    DEBUG_PRINTF("Connecting to %s...\n", ssid);
    WiFi.begin(ssid, password);

    unsigned long startTime = millis();
    while (WiFi.status() != WL_CONNECTED && (millis() - startTime) < (unsigned long)timeoutMs) {
        delay(500);
        DEBUG_PRINT(".");
    }
    DEBUG_PRINTLN();

    return WiFi.status() == WL_CONNECTED;
}

// Start WiFi configuration portal
void startConfigPortal() {
    DEBUG_PRINTLN("Starting WiFi configuration portal...");

    WiFi.mode(WIFI_AP);
    WiFi.softAP(CONFIG_PORTAL_SSID, "");  // Open network
    delay(100);

    IPAddress apIP(192, 168, 4, 1);
    WiFi.softAPConfig(apIP, apIP, IPAddress(255, 255, 255, 0));

    // DNS server to redirect all domains to our IP (captive portal)
    dnsServer.start(53, "*", apIP);

    configServer.on("/", HTTP_GET, []() {
        String html = "<!DOCTYPE html><html><head>";
        html += "<meta name='viewport' content='width=device-width,initial-scale=1'>";
        html += "<title>ZTM Departures WiFi Setup</title>";
        html += "<style>";
        html += "body{font-family:system-ui;background:#1a1a1a;color:#fff;margin:0;padding:20px;text-align:center;}";
        html += "h1{color:#E2001A;}";
        html += ".card{background:#2a2a2a;border-radius:15px;padding:20px;max-width:350px;margin:20px auto;}";
        html += "input{width:100%;padding:12px;margin:8px 0;border:none;border-radius:8px;font-size:16px;box-sizing:border-box;}";
        html += ".btn{background:#E2001A;color:#fff;border:none;padding:15px;border-radius:8px;font-size:16px;cursor:pointer;width:100%;}";
        html += "</style></head><body>";
        html += "<h1>ZTM Departures</h1>";
        html += "<p>WiFi Configuration</p>";
        html += "<div class='card'>";
        html += "<form action='/save' method='POST'>";
        html += "<input type='text' name='ssid' placeholder='WiFi Network Name' required>";
        html += "<input type='password' name='pass' placeholder='WiFi Password'>";
        html += "<input type='submit' value='Connect' class='btn'>";
        html += "</form></div>";
        html += "<p>Stop and line are set on the settings page once connected.</p>";
        html += "</body></html>";
        configServer.send(200, "text/html", html);
    });

    configServer.on("/save", HTTP_POST, []() {
        String ssid = configServer.arg("ssid");
        String pass = configServer.arg("pass");

        if (ssid.length() > 0) {
            wifiPrefs.begin("wifi", false);
            wifiPrefs.putString("ssid", ssid);
            wifiPrefs.putString("pass", pass);
            wifiPrefs.end();

            String html = "<!DOCTYPE html><html><head>";
            html += "<meta name='viewport' content='width=device-width,initial-scale=1'>";
            html += "<style>body{font-family:system-ui;background:#1a1a1a;color:#fff;text-align:center;padding:50px;}</style>";
            html += "</head><body>";
            html += "<h1>Saved!</h1>";
            html += "<p>Rebooting to connect to: " + ssid + "</p>";
            html += "</body></html>";
            configServer.send(200, "text/html", html);

            delay(2000);
            ESP.restart();
        } else {
            configServer.send(400, "text/plain", "SSID required");
        }
    });

    // Captive portal detection endpoints
    configServer.on("/generate_204", HTTP_GET, []() { configServer.sendHeader("Location", "/"); configServer.send(302); });
    configServer.on("/fwlink", HTTP_GET, []() { configServer.sendHeader("Location", "/"); configServer.send(302); });
    configServer.onNotFound([]() { configServer.sendHeader("Location", "/"); configServer.send(302); });

    configServer.begin();
    configPortalActive = true;

    DEBUG_PRINTLN("Config portal started at 192.168.4.1");
    DEBUG_PRINTF("Connect to WiFi: %s (no password)\n", CONFIG_PORTAL_SSID);
}

void setupWiFi() {
    // First, try saved credentials from Preferences
    wifiPrefs.begin("wifi", true);  // Read-only
    String savedSSID = wifiPrefs.getString("ssid", "");
    String savedPass = wifiPrefs.getString("pass", "");
    wifiPrefs.end();

    if (savedSSID.length() > 0) {
        DEBUG_PRINTLN("Trying saved WiFi credentials...");
        if (tryWiFiConnect(savedSSID.c_str(), savedPass.c_str(), WIFI_CONNECT_TIMEOUT_MS)) {
            wifiConnected = true;
            DEBUG_PRINTLN("WiFi connected using saved credentials!");
            DEBUG_PRINTF("IP Address: %s\n", WiFi.localIP().toString().c_str());
            DEBUG_PRINTF("Signal strength: %d dBm\n", WiFi.RSSI());
            return;
        }
        DEBUG_PRINTLN("Saved credentials failed.");
    }

    // Try hardcoded credentials
    DEBUG_PRINTLN("Trying default WiFi credentials...");
    if (tryWiFiConnect(WIFI_SSID, WIFI_PASSWORD, WIFI_CONNECT_TIMEOUT_MS)) {
        wifiConnected = true;
        DEBUG_PRINTLN("WiFi connected!");
        DEBUG_PRINTF("IP Address: %s\n", WiFi.localIP().toString().c_str());
        DEBUG_PRINTF("Signal strength: %d dBm\n", WiFi.RSSI());
        return;
    }

    // All connection attempts failed - start config portal
    DEBUG_PRINTLN("All WiFi connection attempts failed.");
    wifiConnected = false;
    startConfigPortal();
}

void checkWiFi(unsigned long now) {
    bool connected = WiFi.status() == WL_CONNECTED;

    if (connected && !wifiConnected) {
        wifiConnected = true;
        DEBUG_PRINTLN("WiFi reconnected");
        // Offline across midnight means yesterday's timetable
        if (subscription) {
            subscription->checkDayChange();
        }
    } else if (!connected) {
        if (wifiConnected) {
            DEBUG_PRINTLN("WiFi connection lost");
        }
        wifiConnected = false;
        if (now - lastWifiReconnect >= WIFI_RECONNECT_INTERVAL_MS) {
            WiFi.reconnect();
            lastWifiReconnect = now;
        }
    }
}

// ============================================================================
// TIME SYNCHRONIZATION
// ============================================================================

void setupTime() {
    // Configure NTP
    configTime(0, 0, NTP_SERVER_1, NTP_SERVER_2);

    // Departures are resolved in Warsaw local time
    configureTimeZone(ZTM_TIMEZONE_POSIX);

    DEBUG_PRINT("Waiting for time sync");

    int attempts = 0;
    while (!isClockSynced(time(nullptr)) && attempts < NTP_SYNC_ATTEMPTS) {
        DEBUG_PRINT(".");
        delay(500);
        attempts++;
    }

    DEBUG_PRINTLN();

    time_t now = time(nullptr);
    if (isClockSynced(now)) {
        struct tm timeinfo;
        toLocalTime(now, timeinfo);
        char timeStr[20];
        strftime(timeStr, sizeof(timeStr), "%Y-%m-%d %H:%M:%S", &timeinfo);
        DEBUG_PRINTF("Time synchronized: %s\n", timeStr);
    } else {
        // Daily timers arm themselves once SNTP delivers a time
        DEBUG_PRINTLN("WARNING: Time not synced, but proceeding anyway");
    }
}

// ============================================================================
// SUBSCRIPTION
// ============================================================================

bool loadSubscriptionConfig(SubscriptionConfig& config) {
    ztmPrefs.begin(ZTM_PREFS_NAMESPACE, true);
    String stored = ztmPrefs.getString(ZTM_PREFS_KEY, "");
    ztmPrefs.end();

    std::string error;
    if (stored.length() > 0) {
        JsonDocument doc;
        DeserializationError jsonError = deserializeJson(doc, stored);
        if (jsonError) {
            DEBUG_PRINTF("Stored subscription is not valid JSON: %s\n", jsonError.c_str());
        } else if (parseSubscriptionConfig(doc.as<JsonVariantConst>(), JsonVariantConst(), config, error)) {
            return true;
        }
    }

    // Compile-time defaults from secrets.h
    JsonDocument defaults;
    defaults["api_key"] = ZTM_API_KEY;
    defaults["stop_id"] = ZTM_STOP_ID;
    defaults["stop_nr"] = ZTM_STOP_NR;
    defaults["line"] = ZTM_LINE;
    defaults["max_departures_to_expose"] = ZTM_MAX_DEPARTURES;
    return parseSubscriptionConfig(defaults.as<JsonVariantConst>(), JsonVariantConst(), config, error);
}

bool saveSubscriptionConfig(const SubscriptionConfig& config) {
    JsonDocument doc;
    writeSubscriptionConfig(config, doc);
    String payload;
    serializeJson(doc, payload);

    ztmPrefs.begin(ZTM_PREFS_NAMESPACE, false);
    size_t written = ztmPrefs.putString(ZTM_PREFS_KEY, payload);
    ztmPrefs.end();
    return written == payload.length();
}

void startSubscription() {
    if (subscription) {
        subscription->shutdown();
        subscription.reset();
    }

    subscription = ZtmSubscription::configure(activeConfig, httpTransport, platformClock, timers);
    subscription->setRandomSource(esp32Random);
    subscription->setUpdateCallback([](const ZtmSubscription&) {
        statePending = true;
    });
    subscription->start();
}

// ============================================================================
// SETTINGS PAGE (station mode)
// ============================================================================

String htmlEscape(const std::string& value) {
    String out;
    for (size_t i = 0; i < value.size(); i++) {
        char c = value[i];
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '\'': out += "&#39;"; break;
            case '"': out += "&quot;"; break;
            default: out += c; break;
        }
    }
    return out;
}

void sendSettingsPage(const char* message) {
    String html = "<!DOCTYPE html><html><head>";
    html += "<meta name='viewport' content='width=device-width,initial-scale=1'>";
    html += "<title>ZTM Departures</title>";
    html += "<style>";
    html += "body{font-family:system-ui;background:#1a1a1a;color:#fff;margin:0;padding:20px;text-align:center;}";
    html += "h1{color:#E2001A;}";
    html += ".card{background:#2a2a2a;border-radius:15px;padding:20px;max-width:350px;margin:20px auto;text-align:left;}";
    html += "input{width:100%;padding:12px;margin:8px 0;border:none;border-radius:8px;font-size:16px;box-sizing:border-box;}";
    html += ".btn{background:#E2001A;color:#fff;border:none;padding:15px;border-radius:8px;font-size:16px;cursor:pointer;width:100%;}";
    html += ".msg{color:#FFB81C;}";
    html += "</style></head><body>";
    html += "<h1>ZTM Departures</h1>";
    if (message != nullptr) {
        html += "<p class='msg'>";
        html += message;
        html += "</p>";
    }
    html += "<div class='card'>";
    html += "<form action='/settings' method='POST'>";
    html += "<label>API key</label><input type='password' name='api_key' placeholder='unchanged'>";
    html += "<label>Stop ID (zespol)</label><input type='text' name='stop_id' value='" + htmlEscape(activeConfig.stopId) + "' required>";
    html += "<label>Stop number (slupek)</label><input type='text' name='stop_nr' maxlength='2' value='" + htmlEscape(activeConfig.stopNr) + "' required>";
    html += "<label>Line</label><input type='text' name='line' value='" + htmlEscape(activeConfig.line) + "' required>";
    html += "<label>Departures shown (1-3)</label><input type='number' name='departures' min='1' max='3' value='" + String(activeConfig.options.maxDepartures) + "'>";
    html += "<label>Refresh interval (s, 0 = daily only)</label><input type='number' name='refresh_interval' min='0' value='" + String(activeConfig.options.refreshIntervalSeconds) + "'>";
    html += "<label>Stop info refresh (s, 0 = never)</label><input type='number' name='stop_info_ttl' min='0' value='" + String(activeConfig.options.stopInfoTtlSeconds) + "'>";
    html += "<input type='submit' value='Validate and save' class='btn'>";
    html += "</form></div>";
    html += "<p><a href='/state' style='color:#aaa'>Current departures (JSON)</a></p>";
    html += "</body></html>";
    configServer.send(200, "text/html", html);
}

void setupSettingsServer() {
    configServer.on("/", HTTP_GET, []() {
        sendSettingsPage(nullptr);
    });

    configServer.on("/state", HTTP_GET, []() {
        if (!subscription) {
            configServer.send(503, "application/json", "{\"status\":\"unconfigured\"}");
            return;
        }
        JsonDocument doc;
        MQTTHomeAssistant::buildStatePayload(*subscription, platformClock.nowUtc(), doc);
        String payload;
        serializeJson(doc, payload);
        configServer.send(200, "application/json", payload);
    });

    configServer.on("/settings", HTTP_POST, []() {
        // Posted fields override the stored config; blank ones keep it
        static const char* const FORM_FIELDS[][2] = {
            {"api_key", "api_key"},
            {"stop_id", "stop_id"},
            {"stop_nr", "stop_nr"},
            {"line", "line"},
            {"departures", "max_departures_to_expose"},
            {"refresh_interval", "refresh_interval"},
            {"stop_info_ttl", "stop_info_ttl_seconds"},
        };
        JsonDocument form;
        form.to<JsonObject>();
        for (size_t i = 0; i < sizeof(FORM_FIELDS) / sizeof(FORM_FIELDS[0]); i++) {
            String value = configServer.arg(FORM_FIELDS[i][0]);
            value.trim();
            if (value.length() > 0) {
                form[FORM_FIELDS[i][1]] = value.c_str();
            }
        }

        SubscriptionConfig candidate;
        std::string error;
        if (!updateSubscriptionConfig(activeConfig, form.as<JsonVariantConst>(), candidate, error)) {
            sendSettingsPage(error.c_str());
            return;
        }

        SubscriptionValidator validator(httpTransport);
        SubscriptionValidator::Result result = validator.validate(candidate.apiKey, candidate.stopId,
                                                                  candidate.stopNr, candidate.line);
        if (result != SubscriptionValidator::VALIDATION_OK) {
            ZTM_LOGW("Validation error: %s", SubscriptionValidator::resultKey(result));
            sendSettingsPage(SubscriptionValidator::describe(result));
            return;
        }

        if (!saveSubscriptionConfig(candidate)) {
            sendSettingsPage("Could not store the settings");
            return;
        }

        activeConfig = candidate;
        DEBUG_PRINTF("Subscription changed: %s\n", activeConfig.title().c_str());
        startSubscription();
        sendSettingsPage("Saved");
    });

    configServer.begin();
    DEBUG_PRINTF("Settings page at http://%s/\n", WiFi.localIP().toString().c_str());
}

// ============================================================================
// MQTT STATE PUBLISHING
// ============================================================================

void publishMqttState() {
    mqtt.publishState(*subscription, platformClock.nowUtc(), WiFi.RSSI(), WiFi.localIP().toString());
}

// ============================================================================
// MQTT COMMAND HANDLER
// ============================================================================

void handleMqttCommand(const String& command) {
    DEBUG_PRINTF("Received command: %s\n", command.c_str());

    if (command == "refresh") {
        DEBUG_PRINTLN("Manual refresh requested");
        if (subscription) {
            subscription->requestRefresh();
        }
    }
    else if (command == "reload") {
        DEBUG_PRINTLN("Stop info reload requested");
        if (subscription) {
            subscription->reloadStopInfo();
        }
    }
    else if (command == "reboot") {
        DEBUG_PRINTLN("Reboot requested");
        if (subscription) {
            subscription->shutdown();
        }
        mqtt.publishUnavailable();
        delay(500);
        ESP.restart();
    }
    else {
        DEBUG_PRINTF("Unknown command: %s\n", command.c_str());
    }
}
