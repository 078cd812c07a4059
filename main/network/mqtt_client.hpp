#ifndef MQTT_CLIENT_HPP
#define MQTT_CLIENT_HPP

#include <cstdint>
#include <mqtt_client.h>

class MqttClient {
public:
    // topic is not null-terminated; use topic_length
    using MessageHandler = void (*)(void* context, const char* topic, int topic_length,
                                    const uint8_t* payload, int length);
    // Fired on every (re)connect, from the esp-mqtt task
    using ConnectHandler = void (*)(void* context);

    // Construct using values from Config::Mqtt and Config::Device
    MqttClient();
    MqttClient(const char* host, int port, const char* client_id);

    bool connect();
    void disconnect();
    bool isConnected() const { return connected; }

    // Return the message id, or -1 when offline or rejected
    int publish(const char* topic, const char* payload, int qos = 1, bool retain = false);
    int publish(const char* topic, const char* payload, int length, int qos, bool retain);
    int subscribe(const char* topic, int qos = 1);

    void setMessageHandler(MessageHandler handler, void* context);
    void setConnectHandler(ConnectHandler handler, void* context);

private:
    static void mqttEventHandler(void* handler_args, esp_event_base_t base, int32_t event_id, void* event_data);
    void handleEvent(esp_mqtt_event_handle_t event);
    void onConnected();
    void onData(esp_mqtt_event_handle_t event);
    bool canSend(const char* action, const char* topic) const;

    esp_mqtt_client_handle_t client;
    const char* host;
    int port;
    const char* client_id;
    volatile bool connected;

    MessageHandler on_message;
    void* message_context;
    ConnectHandler on_connect;
    void* connect_context;

    char uri[128];
    char availability_topic[64];
};

#endif // MQTT_CLIENT_HPP
