#include <main/tasks/command_task.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <freertos/queue.h>
#include <main/utils/logger.hpp>
#include <main/models/command.hpp>
#include <main/models/cloud_publish_request.hpp>
#include <main/config/config.hpp>
#include <main/network/payload_codec.hpp>
#include <main/state/runtime_settings.hpp>
#include <main/tasks/sensor_poll_task.hpp>
#include <main/utils/time_sync.hpp>
#include <cstdio>

static const char* TAG = "CMD_TASK";

namespace {
    static StaticTask_t s_task_tcb;
    static StackType_t s_task_stack[4096 / sizeof(StackType_t)];

    static SensorSession* s_session = nullptr;
    static QueueHandle_t s_command_queue = nullptr;
    static QueueHandle_t s_publish_queue = nullptr;

    static bool handleBuzzer(const Command& cmd, char* detail, size_t detail_size) {
        bool on = false;
        bool ok;
        if (cmd.type == CommandType::BUZZER_QUERY) {
            ok = s_session->readBuzzerState(on);
        } else {
            on = cmd.type == CommandType::BUZZER_ON;
            ok = s_session->setBuzzerState(on);
        }
        if (ok) {
            SensorPollTask::noteBuzzerState(on);
            std::snprintf(detail, detail_size, "buzzer %s", on ? "on" : "off");
        } else {
            std::snprintf(detail, detail_size, "%s", "buzzer not reachable");
        }
        return ok;
    }

    static bool handleCommand(const Command& cmd, char* detail, size_t detail_size) {
        switch (cmd.type) {
            case CommandType::BUZZER_ON:
            case CommandType::BUZZER_OFF:
            case CommandType::BUZZER_QUERY:
                return handleBuzzer(cmd, detail, detail_size);

            case CommandType::REFRESH:
                SensorPollTask::requestRefresh();
                std::snprintf(detail, detail_size, "%s", "refresh scheduled");
                return true;

            case CommandType::SET_POLL_INTERVAL: {
                const uint32_t interval_ms = static_cast<uint32_t>(cmd.value) * 1000U;
                if (!RuntimeSettings::setPollIntervalMs(interval_ms)) {
                    std::snprintf(detail, detail_size, "interval out of range (%lu..%lu s)",
                                  static_cast<unsigned long>(Config::Tasks::Poll::min_period_ms / 1000),
                                  static_cast<unsigned long>(Config::Tasks::Poll::max_period_ms / 1000));
                    return false;
                }
                std::snprintf(detail, detail_size, "poll interval %ld s", static_cast<long>(cmd.value));
                return true;
            }

            case CommandType::SET_DISCONNECT_POLICY: {
                const DisconnectPolicy policy = static_cast<DisconnectPolicy>(cmd.value);
                if (!RuntimeSettings::setDisconnectPolicy(policy)) {
                    std::snprintf(detail, detail_size, "%s", "policy not saved");
                    return false;
                }
                s_session->setDisconnectPolicy(policy);
                std::snprintf(detail, detail_size, "policy %s",
                              policy == DisconnectPolicy::EAGER ? "eager" : "keep_alive");
                return true;
            }

            default:
                std::snprintf(detail, detail_size, "%s", "unknown command");
                return false;
        }
    }

    static void publishAck(const Command& cmd, bool ok, const char* detail) {
        if (s_publish_queue == nullptr) {
            return;
        }
        CloudPublishRequest req{};
        std::snprintf(req.topic, sizeof(req.topic), Config::Mqtt::Topics::ACK, Config::Device::id);
        req.qos = static_cast<uint8_t>(Config::Mqtt::default_qos);
        req.retain = false;

        char ts[24];
        TimeSync::formatIsoTimestamp(ts, sizeof(ts));
        if (PayloadCodec::formatAck(cmd, ok, detail, ts, req.payload, sizeof(req.payload)) < 0) {
            LOG_ERROR(TAG, "Ack for %s does not fit", PayloadCodec::commandName(cmd.type));
            return;
        }

        if (xQueueSend(s_publish_queue, &req, 0) != pdTRUE) {
            LOG_WARN(TAG, "%s", "publish queue full, dropped ack");
        } else {
            LOG_DEBUG(TAG, "Enqueued ack: %s", req.payload);
        }
    }

    static void taskFunction(void* arg) {
        (void)arg;
        LOG_INFO(TAG, "%s", "Command Task started");

        Command cmd;
        for (;;) {
            if (xQueueReceive(s_command_queue, &cmd, portMAX_DELAY) != pdTRUE) {
                continue;
            }

            char detail[64];
            detail[0] = '\0';
            const bool ok = handleCommand(cmd, detail, sizeof(detail));
            if (ok) {
                LOG_INFO(TAG, "Command executed: %s (%s)", PayloadCodec::commandName(cmd.type), detail);
            } else {
                LOG_ERROR(TAG, "Command failed: %s (%s)", PayloadCodec::commandName(cmd.type), detail);
            }
            publishAck(cmd, ok, detail);
        }
    }
}

namespace CommandTask {
    void create(SensorSession& session, QueueHandle_t command_queue, QueueHandle_t publish_queue) {
        s_session = &session;
        s_command_queue = command_queue;
        s_publish_queue = publish_queue;
        xTaskCreateStatic(taskFunction,
                          "cmd_task",
                          sizeof(s_task_stack) / sizeof(StackType_t),
                          nullptr,
                          Config::TaskPriorities::NORMAL,
                          s_task_stack,
                          &s_task_tcb);
    }
}
