#include "mqtt_ha.h"
#include <WiFi.h>
#include "local_time.h"

// ============================================================================
// MQTT HOME ASSISTANT IMPLEMENTATION
// Auto-discovery for seamless integration
// ============================================================================

MQTTHomeAssistant mqtt;
MQTTHomeAssistant* MQTTHomeAssistant::instance = nullptr;

MQTTHomeAssistant::MQTTHomeAssistant() : mqttClient(wifiClient) {
    discoveryPublished = false;
    lastReconnectAttempt = 0;
    commandCallback = nullptr;
    instance = this;
}

void MQTTHomeAssistant::init() {
    mqttClient.setServer(MQTT_SERVER, MQTT_PORT);
    mqttClient.setCallback(mqttCallback);
    mqttClient.setBufferSize(1536); // Departures array plus discovery messages

    DEBUG_PRINTLN("MQTT client initialized");
    DEBUG_PRINTF("Server: %s:%d\n", MQTT_SERVER, MQTT_PORT);
}

bool MQTTHomeAssistant::connect() {
    if (mqttClient.connected()) {
        return true;
    }

    unsigned long now = millis();
    if (now - lastReconnectAttempt < 5000) {
        return false; // Don't retry too frequently
    }
    lastReconnectAttempt = now;

    DEBUG_PRINTLN("Connecting to MQTT...");

    String clientId = String(MQTT_CLIENT_ID) + "_" + getDeviceId();

    // Set last will for availability
    bool connected = mqttClient.connect(
        clientId.c_str(),
        MQTT_USER,
        MQTT_PASSWORD,
        MQTT_AVAILABILITY_TOPIC,
        0,      // QoS
        true,   // Retain
        "offline"
    );

    if (connected) {
        DEBUG_PRINTLN("MQTT connected!");

        publishAvailable();
        mqttClient.subscribe(MQTT_COMMAND_TOPIC);

        if (!discoveryPublished) {
            publishDiscoveryConfig();
            discoveryPublished = true;
        }

        return true;
    }

    DEBUG_PRINTF("MQTT connection failed, rc=%d\n", mqttClient.state());
    return false;
}

void MQTTHomeAssistant::loop() {
    if (!mqttClient.connected()) {
        connect();
    }
    mqttClient.loop();
}

bool MQTTHomeAssistant::isConnected() {
    return mqttClient.connected();
}

void MQTTHomeAssistant::mqttCallback(char* topic, byte* payload, unsigned int length) {
    if (instance == nullptr) return;

    String message;
    for (unsigned int i = 0; i < length; i++) {
        message += (char)payload[i];
    }

    DEBUG_PRINTF("MQTT message on %s: %s\n", topic, message.c_str());

    if (String(topic) == MQTT_COMMAND_TOPIC && instance->commandCallback) {
        instance->commandCallback(message);
    }
}

void MQTTHomeAssistant::setCommandCallback(void (*callback)(const String& command)) {
    commandCallback = callback;
}

String MQTTHomeAssistant::getDeviceId() {
    uint8_t mac[6];
    WiFi.macAddress(mac);
    char id[13];
    snprintf(id, sizeof(id), "%02X%02X%02X%02X%02X%02X",
             mac[0], mac[1], mac[2], mac[3], mac[4], mac[5]);
    return String(id);
}

void MQTTHomeAssistant::addDeviceInfo(JsonDocument& doc) {
    doc["device"]["identifiers"][0] = "ztm_departures_" + getDeviceId();
    doc["device"]["name"] = DEVICE_FRIENDLY_NAME;
    doc["device"]["model"] = DEVICE_MODEL;
    doc["device"]["manufacturer"] = "Espressif";
    doc["device"]["sw_version"] = FIRMWARE_VERSION;
    doc["device"]["configuration_url"] = "http://" + WiFi.localIP().toString();
}

void MQTTHomeAssistant::publishDiscoveryConfig() {
    DEBUG_PRINTLN("Publishing Home Assistant discovery config...");

    // Minutes to the next departure; the departure list rides along as attributes
    publishSensorDiscovery(
        "Next Departure",
        "next_departure",
        nullptr,
        "min",
        "{{ value_json.next_minutes }}",
        "mdi:bus-clock",
        true
    );

    publishSensorDiscovery(
        "Stop",
        "stop_name",
        nullptr,
        nullptr,
        "{{ value_json.stop_name }}",
        "mdi:bus-stop"
    );

    publishSensorDiscovery(
        "Data Status",
        "status",
        nullptr,
        nullptr,
        "{{ value_json.status }}",
        "mdi:database-clock"
    );

    publishSensorDiscovery(
        "WiFi Signal",
        "wifi_rssi",
        "signal_strength",
        "dBm",
        "{{ value_json.rssi }}",
        "mdi:wifi"
    );

    publishSensorDiscovery(
        "Firmware",
        "firmware",
        nullptr,
        nullptr,
        "{{ value_json.version }}",
        "mdi:chip"
    );

    publishButtonDiscovery(
        "Refresh Timetable",
        "refresh",
        "refresh",
        "mdi:refresh"
    );

    publishButtonDiscovery(
        "Reload Stop Info",
        "reload",
        "reload",
        "mdi:database-refresh"
    );

    DEBUG_PRINTLN("Discovery config published");
}

void MQTTHomeAssistant::publishSensorDiscovery(const char* name, const char* uniqueId,
                                                const char* deviceClass, const char* unit,
                                                const char* valueTemplate, const char* icon,
                                                bool withAttributes) {
    JsonDocument doc;
    String deviceId = getDeviceId();

    doc["name"] = name;
    doc["unique_id"] = String("ztm_departures_") + deviceId + "_" + uniqueId;
    doc["state_topic"] = MQTT_STATE_TOPIC;
    doc["availability_topic"] = MQTT_AVAILABILITY_TOPIC;
    doc["value_template"] = valueTemplate;

    if (deviceClass) {
        doc["device_class"] = deviceClass;
    }
    if (unit) {
        doc["unit_of_measurement"] = unit;
    }
    if (icon) {
        doc["icon"] = icon;
    }
    if (withAttributes) {
        doc["json_attributes_topic"] = MQTT_STATE_TOPIC;
        doc["json_attributes_template"] = "{{ {'departures': value_json.departures} | tojson }}";
    }

    addDeviceInfo(doc);

    String topic = String(HA_DISCOVERY_PREFIX) + "/sensor/ztm_departures_" +
                   deviceId + "/" + uniqueId + "/config";

    String payload;
    serializeJson(doc, payload);

    mqttClient.publish(topic.c_str(), payload.c_str(), true);
}

void MQTTHomeAssistant::publishButtonDiscovery(const char* name, const char* uniqueId,
                                                const char* command, const char* icon) {
    JsonDocument doc;
    String deviceId = getDeviceId();

    doc["name"] = name;
    doc["unique_id"] = String("ztm_departures_") + deviceId + "_" + uniqueId;
    doc["command_topic"] = MQTT_COMMAND_TOPIC;
    doc["payload_press"] = command;
    doc["availability_topic"] = MQTT_AVAILABILITY_TOPIC;

    if (icon) {
        doc["icon"] = icon;
    }

    addDeviceInfo(doc);

    String topic = String(HA_DISCOVERY_PREFIX) + "/button/ztm_departures_" +
                   deviceId + "/" + uniqueId + "/config";

    String payload;
    serializeJson(doc, payload);

    mqttClient.publish(topic.c_str(), payload.c_str(), true);
}

void MQTTHomeAssistant::buildStatePayload(const ZtmSubscription& subscription, time_t nowUtc,
                                          JsonDocument& doc) {
    const SubscriptionConfig& config = subscription.config();

    doc["status"] = RefreshScheduler::statusName(subscription.status());
    doc["line"] = config.line;
    doc["stop_id"] = config.stopId;
    doc["stop_nr"] = config.stopNr;
    doc["stop_name"] = subscription.stopName();

    const DepartureSnapshot* snapshot = subscription.snapshot();
    if (snapshot != nullptr && snapshot->fetchedAtUtc != 0) {
        doc["fetched_at"] = formatUtcIso8601(snapshot->fetchedAtUtc);
    }

    std::vector<ScheduledDeparture> upcoming = subscription.upcoming(nowUtc);
    if (upcoming.empty()) {
        doc["next_minutes"] = nullptr;
    } else {
        doc["next_minutes"] = upcoming[0].minutesToDepart(nowUtc);
    }

    JsonArray departures = doc["departures"].to<JsonArray>();
    for (size_t i = 0; i < upcoming.size(); i++) {
        const ScheduledDeparture& departure = upcoming[i];
        JsonObject item = departures.add<JsonObject>();
        item["time"] = formatUtcIso8601(departure.departureUtc);
        item["local_time"] = formatLocalClock(departure.departureUtc);
        item["minutes"] = departure.minutesToDepart(nowUtc);
        item["headsign"] = departure.reading.headsign;
        item["night"] = departure.reading.isNightService();
        if (!departure.reading.routeId.empty()) {
            item["route"] = departure.reading.routeId;
        }
        if (!departure.reading.brigade.empty()) {
            item["brigade"] = departure.reading.brigade;
        }
    }
}

void MQTTHomeAssistant::publishState(const ZtmSubscription& subscription, time_t nowUtc,
                                      int rssi, const String& ipAddress) {
    if (!mqttClient.connected()) return;

    JsonDocument doc;
    buildStatePayload(subscription, nowUtc, doc);
    doc["rssi"] = rssi;
    doc["ip_address"] = ipAddress;
    doc["version"] = FIRMWARE_VERSION;

    String payload;
    serializeJson(doc, payload);

    mqttClient.publish(MQTT_STATE_TOPIC, payload.c_str(), true);
    DEBUG_PRINTLN("Published state to MQTT");
}

void MQTTHomeAssistant::publishAvailable() {
    mqttClient.publish(MQTT_AVAILABILITY_TOPIC, "online", true);
}

void MQTTHomeAssistant::publishUnavailable() {
    mqttClient.publish(MQTT_AVAILABILITY_TOPIC, "offline", true);
}
