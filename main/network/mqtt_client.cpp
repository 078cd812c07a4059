#include <main/network/mqtt_client.hpp>
#include <main/utils/logger.hpp>
#include <main/config/config.hpp>
#include <cstring>
#include <cstdio>

static const char* TAG_MQTT = "MqttClient";

MqttClient::MqttClient()
    : MqttClient(Config::Mqtt::host, Config::Mqtt::port, Config::Device::id) {}

MqttClient::MqttClient(const char* host, int port, const char* client_id)
    : client(nullptr),
      host(host),
      port(port),
      client_id(client_id),
      connected(false),
      on_message(nullptr),
      message_context(nullptr),
      on_connect(nullptr),
      connect_context(nullptr),
      uri{},
      availability_topic{} {}

bool MqttClient::connect() {
    if (client != nullptr) {
        return true;
    }

    std::snprintf(uri, sizeof(uri), "mqtt://%s:%d", host, port);
    std::snprintf(availability_topic, sizeof(availability_topic), Config::Mqtt::Topics::AVAILABILITY, client_id);

    esp_mqtt_client_config_t cfg = {};
    cfg.broker.address.uri = uri;
    cfg.credentials.client_id = client_id;
    cfg.session.keepalive = Config::Mqtt::keepalive_seconds;
    cfg.session.disable_clean_session = !Config::Mqtt::clean_session;
    if (Config::Mqtt::lwt_enable) {
        // Broker flips availability to "offline" if the gateway vanishes
        cfg.session.last_will.topic = availability_topic;
        cfg.session.last_will.msg = "offline";
        cfg.session.last_will.qos = Config::Mqtt::default_qos;
        cfg.session.last_will.retain = true;
    }

    LOG_INFO(TAG_MQTT, "Broker %s, client id %s", uri, client_id);

    client = esp_mqtt_client_init(&cfg);
    if (client == nullptr) {
        LOG_ERROR(TAG_MQTT, "%s", "Client init failed");
        return false;
    }
    esp_err_t err = esp_mqtt_client_register_event(client, MQTT_EVENT_ANY, &MqttClient::mqttEventHandler, this);
    if (err == ESP_OK) {
        err = esp_mqtt_client_start(client);
    }
    if (err != ESP_OK) {
        LOG_ERROR(TAG_MQTT, "Client start failed: %s", esp_err_to_name(err));
        (void)esp_mqtt_client_destroy(client);
        client = nullptr;
        return false;
    }
    return true;
}

void MqttClient::disconnect() {
    if (client == nullptr) {
        return;
    }
    (void)esp_mqtt_client_stop(client);
    (void)esp_mqtt_client_destroy(client);
    client = nullptr;
    connected = false;
}

bool MqttClient::canSend(const char* action, const char* topic) const {
    if (client != nullptr && connected) {
        return true;
    }
    LOG_WARN(TAG_MQTT, "Offline, %s skipped for %s", action, topic);
    return false;
}

int MqttClient::publish(const char* topic, const char* payload, int qos, bool retain) {
    return publish(topic, payload, static_cast<int>(std::strlen(payload)), qos, retain);
}

int MqttClient::publish(const char* topic, const char* payload, int length, int qos, bool retain) {
    if (!canSend("publish", topic)) {
        return -1;
    }
    const int mid = esp_mqtt_client_publish(client, topic, payload, length, qos, retain ? 1 : 0);
    if (mid < 0) {
        LOG_ERROR(TAG_MQTT, "Publish to %s rejected (rc=%d)", topic, mid);
    } else {
        LOG_DEBUG(TAG_MQTT, "Published %d bytes to %s (qos=%d retain=%d mid=%d)",
                  length, topic, qos, retain ? 1 : 0, mid);
    }
    return mid;
}

int MqttClient::subscribe(const char* topic, int qos) {
    if (!canSend("subscribe", topic)) {
        return -1;
    }
    const int mid = esp_mqtt_client_subscribe(client, topic, qos);
    if (mid < 0) {
        LOG_ERROR(TAG_MQTT, "Subscribe to %s rejected (rc=%d)", topic, mid);
    } else {
        LOG_INFO(TAG_MQTT, "Subscribed to %s (qos=%d mid=%d)", topic, qos, mid);
    }
    return mid;
}

void MqttClient::setMessageHandler(MessageHandler handler, void* context) {
    on_message = handler;
    message_context = context;
}

void MqttClient::setConnectHandler(ConnectHandler handler, void* context) {
    on_connect = handler;
    connect_context = context;
}

void MqttClient::mqttEventHandler(void* handler_args, esp_event_base_t, int32_t, void* event_data) {
    static_cast<MqttClient*>(handler_args)->handleEvent(static_cast<esp_mqtt_event_handle_t>(event_data));
}

void MqttClient::onConnected() {
    connected = true;
    LOG_INFO(TAG_MQTT, "%s", "Broker session up");
    if (Config::Mqtt::lwt_enable) {
        (void)publish(availability_topic, "online", Config::Mqtt::default_qos, true);
    }
    // Clean sessions drop subscriptions, so the owner re-subscribes here
    if (on_connect != nullptr) {
        on_connect(connect_context);
    }
}

void MqttClient::onData(esp_mqtt_event_handle_t event) {
    // Commands are small; anything split across events is not one of ours
    if (event->current_data_offset != 0 || event->data_len != event->total_data_len) {
        LOG_WARN(TAG_MQTT, "Dropping fragmented message (%d of %d bytes)", event->data_len, event->total_data_len);
        return;
    }
    if (on_message == nullptr) {
        LOG_DEBUG(TAG_MQTT, "No handler for %.*s (%d bytes)", event->topic_len, event->topic, event->data_len);
        return;
    }
    on_message(message_context, event->topic, event->topic_len,
               reinterpret_cast<const uint8_t*>(event->data), event->data_len);
}

void MqttClient::handleEvent(esp_mqtt_event_handle_t event) {
    switch (event->event_id) {
        case MQTT_EVENT_CONNECTED:
            onConnected();
            break;
        case MQTT_EVENT_DISCONNECTED:
            connected = false;
            LOG_WARN(TAG_MQTT, "%s", "Broker session lost");
            break;
        case MQTT_EVENT_DATA:
            onData(event);
            break;
        case MQTT_EVENT_ERROR:
            if (event->error_handle != nullptr) {
                LOG_ERROR(TAG_MQTT, "Transport error (type=%d)", static_cast<int>(event->error_handle->error_type));
            } else {
                LOG_ERROR(TAG_MQTT, "%s", "Transport error");
            }
            break;
        default:
            break;
    }
}
