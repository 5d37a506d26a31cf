/**
 * secrets.example.h
 *
 * Copy this file to src/secrets.h and fill in your real credentials.
 * The actual secrets file is ignored by git so sensitive data never
 * ends up in source control.
 */

#ifndef SECRETS_EXAMPLE_H
#define SECRETS_EXAMPLE_H

// ---------------------------------------------------------------------------
// WiFi credentials
// ---------------------------------------------------------------------------
#define SECRET_WIFI_SSID        "YOUR_WIFI_SSID"
#define SECRET_WIFI_PASSWORD    "YOUR_WIFI_PASSWORD"

// ---------------------------------------------------------------------------
// MQTT broker (Home Assistant)
// ---------------------------------------------------------------------------
#define SECRET_MQTT_SERVER      "mqtt.example.com"
#define SECRET_MQTT_PORT        1883
#define SECRET_MQTT_USER        "mqtt_user"
#define SECRET_MQTT_PASSWORD    "mqtt_password"
#define SECRET_MQTT_CLIENT_ID   "ztm_departures"

// ---------------------------------------------------------------------------
// City of Warsaw open data API
// Register at https://api.um.warszawa.pl to get a key.
// DO NOT COMMIT THESE TO GITHUB!
// ---------------------------------------------------------------------------
#define SECRET_ZTM_API_KEY      "your_um_warszawa_api_key"

// Default subscription: stop group, post and line
#define SECRET_ZTM_STOP_ID      "7009"
#define SECRET_ZTM_STOP_NR      "01"
#define SECRET_ZTM_LINE         "520"

#endif // SECRETS_EXAMPLE_H
