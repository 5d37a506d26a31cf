#ifndef CONFIG_H
#define CONFIG_H

#include "../src/secrets.h"  // API keys and secrets

// ============================================================================
// ZTM WARSAW DEPARTURES CONFIGURATION
// ESP32 board polling the City of Warsaw timetable API
// ============================================================================

// ----------------------------------------------------------------------------
// VERSION INFO
// ----------------------------------------------------------------------------
#define FIRMWARE_VERSION "1.0.0"
#define DEVICE_NAME "ztm-departures"
#define DEVICE_FRIENDLY_NAME "ZTM Departures"
#define DEVICE_MODEL "ESP32 Departure Board"

// ----------------------------------------------------------------------------
// WIFI CONFIGURATION
// ----------------------------------------------------------------------------
#define WIFI_SSID SECRET_WIFI_SSID
#define WIFI_PASSWORD SECRET_WIFI_PASSWORD
#define WIFI_CONNECT_TIMEOUT_MS 30000
#define WIFI_RECONNECT_INTERVAL_MS 30000
#define CONFIG_PORTAL_SSID "ZtmDepartures"

// ----------------------------------------------------------------------------
// MQTT CONFIGURATION (Home Assistant Auto-Discovery)
// ----------------------------------------------------------------------------
#define MQTT_SERVER SECRET_MQTT_SERVER
#define MQTT_PORT SECRET_MQTT_PORT
#define MQTT_USER SECRET_MQTT_USER
#define MQTT_PASSWORD SECRET_MQTT_PASSWORD
#define MQTT_CLIENT_ID SECRET_MQTT_CLIENT_ID

// Home Assistant Discovery prefix
#define HA_DISCOVERY_PREFIX "homeassistant"

// MQTT Topics
#define MQTT_STATE_TOPIC "ztm_departures/state"
#define MQTT_AVAILABILITY_TOPIC "ztm_departures/availability"
#define MQTT_COMMAND_TOPIC "ztm_departures/command"
#define MQTT_STATE_PUBLISH_INTERVAL_MS 60000

// ----------------------------------------------------------------------------
// ZTM API SUBSCRIPTION (defaults, overridden by the setup portal)
// https://api.um.warszawa.pl
// ----------------------------------------------------------------------------
#define ZTM_API_KEY SECRET_ZTM_API_KEY
#define ZTM_STOP_ID SECRET_ZTM_STOP_ID   // stop group ("zespol")
#define ZTM_STOP_NR SECRET_ZTM_STOP_NR   // stop post ("slupek"), two digits
#define ZTM_LINE SECRET_ZTM_LINE
#define ZTM_MAX_DEPARTURES 3

// NVS namespace holding the subscription JSON
#define ZTM_PREFS_NAMESPACE "ztm"
#define ZTM_PREFS_KEY "config"

// ----------------------------------------------------------------------------
// TIME
// ----------------------------------------------------------------------------
#define NTP_SERVER_1 "pool.ntp.org"
#define NTP_SERVER_2 "time.nist.gov"
#define NTP_SYNC_ATTEMPTS 20

// ----------------------------------------------------------------------------
// DEBUG CONFIGURATION
// ----------------------------------------------------------------------------
#define DEBUG_SERIAL true
#define DEBUG_BAUD_RATE 115200

#if DEBUG_SERIAL
    #define DEBUG_PRINT(x) Serial.print(x)
    #define DEBUG_PRINTLN(x) Serial.println(x)
    #define DEBUG_PRINTF(...) Serial.printf(__VA_ARGS__)
#else
    #define DEBUG_PRINT(x)
    #define DEBUG_PRINTLN(x)
    #define DEBUG_PRINTF(...)
#endif

#endif // CONFIG_H
