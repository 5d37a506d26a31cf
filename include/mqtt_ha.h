#ifndef MQTT_HA_H
#define MQTT_HA_H

#include <Arduino.h>
#include <PubSubClient.h>
#include <WiFiClient.h>
#include <ArduinoJson.h>
#include <time.h>
#include "config.h"
#include "ztm_subscription.h"

// ============================================================================
// MQTT CLIENT WITH HOME ASSISTANT AUTO-DISCOVERY
// Publishes the next departures of the subscription plus device telemetry
// ============================================================================

class MQTTHomeAssistant {
public:
    MQTTHomeAssistant();

    // Initialize and connect
    void init();
    bool connect();
    void loop();
    bool isConnected();

    // Publish Home Assistant discovery configs
    void publishDiscoveryConfig();

    // Publish current departures and telemetry
    void publishState(const ZtmSubscription& subscription, time_t nowUtc,
                      int rssi, const String& ipAddress);

    // Publish availability
    void publishAvailable();
    void publishUnavailable();

    // Handle incoming commands
    void setCommandCallback(void (*callback)(const String& command));

    // State document, shared with the web status page
    static void buildStatePayload(const ZtmSubscription& subscription, time_t nowUtc,
                                  JsonDocument& doc);

private:
    WiFiClient wifiClient;
    PubSubClient mqttClient;
    bool discoveryPublished;
    unsigned long lastReconnectAttempt;
    void (*commandCallback)(const String& command);

    // Unique device ID based on MAC
    String getDeviceId();

    // Discovery message builders
    void publishSensorDiscovery(const char* name, const char* uniqueId,
                                const char* deviceClass, const char* unit,
                                const char* valueTemplate, const char* icon,
                                bool withAttributes = false);
    void publishButtonDiscovery(const char* name, const char* uniqueId,
                                const char* command, const char* icon);

    // Device block shared by every discovery message
    void addDeviceInfo(JsonDocument& doc);

    // MQTT callback
    static void mqttCallback(char* topic, byte* payload, unsigned int length);
    static MQTTHomeAssistant* instance;
};

extern MQTTHomeAssistant mqtt;

#endif // MQTT_HA_H
