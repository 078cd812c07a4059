#include <main/tasks/cloud_communication_task.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <freertos/queue.h>
#include <main/utils/logger.hpp>
#include <main/network/wifi_manager.hpp>
#include <main/network/mqtt_client.hpp>
#include <main/network/payload_codec.hpp>
#include <main/utils/circular_buffer.hpp>
#include <main/config/config.hpp>
#include <main/models/command.hpp>
#include <main/models/telemetry_report.hpp>
#include <main/models/cloud_publish_request.hpp>
#include <main/utils/time_sync.hpp>
#include <main/utils/watchdog.hpp>
#include <atomic>
#include <cstdio>
#include <cstring>

static const char* TAG = "CLOUD_TASK";

namespace {
    // Static instances (no heap)
    static WiFiManager s_wifi_manager;
    static MqttClient s_mqtt_client;
    // Reports produced while the broker was unreachable; oldest evicted first
    static CircularBuffer<TelemetryReport, 16> s_telemetry_buffer;
    static std::atomic<bool> s_post_connect_pending{false};

    static TelemetryReport s_last_report{};
    static bool s_have_report = false;

    static char s_telemetry_payload[768];

    static StaticTask_t s_task_tcb;
    static StackType_t s_task_stack[6144 / sizeof(StackType_t)];

    static QueueHandle_t s_telemetry_queue = nullptr;
    static QueueHandle_t s_command_queue = nullptr;
    static QueueHandle_t s_publish_queue = nullptr;

    // Called from the esp-mqtt task
    static void onMqttConnected(void* context) {
        (void)context;
        s_post_connect_pending.store(true);
    }

    // Called from the esp-mqtt task; only parses and hands off
    static void onMqttMessage(void* context, const char* topic, int topic_length,
                              const uint8_t* payload, int length) {
        (void)context;
        if (s_command_queue == nullptr || length <= 0 || length > 256) {
            LOG_WARN(TAG, "MQTT RX invalid: topic=%.*s len=%d", topic_length, topic, length);
            return;
        }

        char json_buf[257];
        std::memcpy(json_buf, payload, static_cast<size_t>(length));
        json_buf[length] = '\0';

        Command cmd{};
        if (!PayloadCodec::parseCommand(json_buf, length, cmd)) {
            LOG_WARN(TAG, "MQTT RX unrecognized command: %s", json_buf);
            return;
        }
        cmd.timestamp_ms = static_cast<uint32_t>(xTaskGetTickCount() * portTICK_PERIOD_MS);

        if (xQueueSend(s_command_queue, &cmd, 0) == pdTRUE) {
            LOG_INFO(TAG, "MQTT RX parsed: %s", PayloadCodec::commandName(cmd.type));
        } else {
            LOG_WARN(TAG, "%s", "MQTT RX queue full, dropped command");
        }
    }

    static bool publishTelemetry(const TelemetryReport& report) {
        char topic[64];
        char ts[24];
        TimeSync::formatIsoTimestamp(ts, sizeof(ts));
        std::snprintf(topic, sizeof(topic), Config::Mqtt::Topics::TELEMETRY, Config::Device::id);
        const int length = PayloadCodec::formatTelemetry(report, ts, s_telemetry_payload, sizeof(s_telemetry_payload));
        if (length < 0) {
            LOG_ERROR(TAG, "Telemetry for cycle %lu does not fit", static_cast<unsigned long>(report.cycle));
            return false;
        }
        if (s_mqtt_client.publish(topic, s_telemetry_payload, length, Config::Mqtt::default_qos,
                                  Config::Mqtt::telemetry_retain) < 0) {
            return false;
        }
        LOG_INFO(TAG, "MQTT TX topic=%s payload=%s", topic, s_telemetry_payload);
        return true;
    }

    static void publishStatus(TickType_t now) {
        char topic[64];
        char payload[256];
        std::snprintf(topic, sizeof(topic), Config::Mqtt::Topics::STATUS, Config::Device::id);

        TelemetryReport empty{};
        const TelemetryReport& report = s_have_report ? s_last_report : empty;
        const char* name = (s_have_report && report.device_name[0] != '\0') ? report.device_name
                                                                           : Config::Device::default_name;
        const uint32_t uptime_ms = static_cast<uint32_t>(now * portTICK_PERIOD_MS);
        if (PayloadCodec::formatStatus(report, name, uptime_ms, payload, sizeof(payload)) < 0) {
            LOG_ERROR(TAG, "%s", "Status payload does not fit");
            return;
        }
        (void)s_mqtt_client.publish(topic, payload, Config::Mqtt::default_qos, true);
        LOG_INFO(TAG, "MQTT TX topic=%s payload=%s (buffered=%u evicted=%lu)", topic, payload,
                 static_cast<unsigned>(s_telemetry_buffer.size()),
                 static_cast<unsigned long>(s_telemetry_buffer.evicted()));
    }

    static void onPostConnect() {
        char cmd_topic[64];
        std::snprintf(cmd_topic, sizeof(cmd_topic), Config::Mqtt::Topics::CMD, Config::Device::id);
        if (s_mqtt_client.subscribe(cmd_topic, Config::Mqtt::default_qos) < 0) {
            LOG_WARN(TAG, "Subscribe to %s failed", cmd_topic);
        }

        // Flush reports buffered while offline, oldest first
        TelemetryReport buffered;
        while (s_telemetry_buffer.peek(buffered)) {
            if (!publishTelemetry(buffered)) {
                break;
            }
            (void)s_telemetry_buffer.pop(buffered);
            Watchdog::feed();
            vTaskDelay(pdMS_TO_TICKS(50));
        }
    }

    static void taskFunction(void* parameters) {
        (void)parameters;
        LOG_INFO(TAG, "%s", "Cloud Communication Task started");

        // WiFi init and optional auto-connect handled in init()
        if (!s_wifi_manager.init()) {
            LOG_ERROR(TAG, "%s", "WiFi init failed");
            vTaskDelete(nullptr);
            return;
        }
        (void)s_wifi_manager.waitForIp(Config::Wifi::connect_wait_ms);

        s_mqtt_client.setMessageHandler(&onMqttMessage, nullptr);
        s_mqtt_client.setConnectHandler(&onMqttConnected, nullptr);

        Watchdog::subscribe();

        bool time_inited = false;
        bool time_synced_once = false;

        TickType_t last_status_time = xTaskGetTickCount();
        const TickType_t status_period = pdMS_TO_TICKS(Config::Tasks::Cloud::status_period_ms);
        TickType_t last_reconnect_attempt = 0;
        const TickType_t reconnect_interval = pdMS_TO_TICKS(Config::Tasks::Cloud::reconnect_interval_ms);

        TelemetryReport report;

        for (;;) {
            Watchdog::feed();
            TickType_t now = xTaskGetTickCount();
            bool has_ip = s_wifi_manager.hasIp();

            if (has_ip && !time_inited) {
                TimeSync::init();
                time_inited = true;
            }
            // Before the first publishes, wait briefly so telemetry carries real timestamps
            if (has_ip && time_inited && !time_synced_once) {
                (void)TimeSync::waitForSync(Config::Time::sync_wait_ms);
                time_synced_once = true;
                Watchdog::feed();
            }

            if (!has_ip) {
                if ((now - last_reconnect_attempt) > reconnect_interval) {
                    (void)s_wifi_manager.reconnect();
                    last_reconnect_attempt = now;
                }
            }

            if (has_ip && !s_mqtt_client.isConnected()) {
                (void)s_mqtt_client.connect();
            }

            if (s_mqtt_client.isConnected() && s_post_connect_pending.exchange(false)) {
                onPostConnect();
            }

            if (s_telemetry_queue != nullptr && xQueueReceive(s_telemetry_queue, &report, 0) == pdTRUE) {
                s_last_report = report;
                s_have_report = true;
                if (!s_mqtt_client.isConnected() || !publishTelemetry(report)) {
                    if (!s_telemetry_buffer.push(report)) {
                        LOG_WARN(TAG, "Offline buffer full, evicted oldest report (%lu total)",
                                 static_cast<unsigned long>(s_telemetry_buffer.evicted()));
                    }
                }
            }

            if ((now - last_status_time) > status_period && s_mqtt_client.isConnected()) {
                publishStatus(now);
                last_status_time = now;
            }

            // Acks from the command task
            if (s_publish_queue != nullptr && s_mqtt_client.isConnected()) {
                CloudPublishRequest req;
                int drained = 0;
                const int max_drain = 8;
                while (drained < max_drain && xQueueReceive(s_publish_queue, &req, 0) == pdTRUE) {
                    (void)s_mqtt_client.publish(req.topic, req.payload, req.qos, req.retain);
                    LOG_INFO(TAG, "MQTT TX topic=%s payload=%s", req.topic, req.payload);
                    drained++;
                    vTaskDelay(pdMS_TO_TICKS(10));
                }
            }

            vTaskDelay(pdMS_TO_TICKS(100));
        }
    }
} // namespace

namespace CloudCommunicationTask {
    void create(QueueHandle_t telemetry_queue,
                QueueHandle_t command_queue,
                QueueHandle_t publish_queue) {
        s_telemetry_queue = telemetry_queue;
        s_command_queue = command_queue;
        s_publish_queue = publish_queue;
        xTaskCreateStatic(taskFunction,
                          "cloud_comm",
                          sizeof(s_task_stack) / sizeof(StackType_t),
                          nullptr,
                          Config::TaskPriorities::NORMAL,
                          s_task_stack,
                          &s_task_tcb);
    }
}
