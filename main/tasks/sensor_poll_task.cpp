#include <main/tasks/sensor_poll_task.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <freertos/queue.h>
#include <main/utils/logger.hpp>
#include <main/config/config.hpp>
#include <main/models/sensor_snapshot.hpp>
#include <main/models/telemetry_report.hpp>
#include <main/protocol/sensor_table.hpp>
#include <main/state/reading_cache.hpp>
#include <main/state/runtime_settings.hpp>
#include <atomic>
#include <cstdio>
#include <cstring>

static const char* TAG = "POLL_TASK";

namespace {
    static StaticTask_t s_task_tcb;
    static StackType_t s_task_stack[6144 / sizeof(StackType_t)];
    static TaskHandle_t s_task_handle = nullptr;

    static SensorSession* s_session = nullptr;
    static QueueHandle_t s_telemetry_queue = nullptr;

    static ReadingCache s_cache;
    static char s_device_name[32];

    // 0 = unknown, 1 = off, 2 = on
    static std::atomic<uint8_t> s_buzzer_state{0};

    static uint32_t nowMs() {
        return static_cast<uint32_t>(xTaskGetTickCount() * portTICK_PERIOD_MS);
    }

    static void logCycle(const TelemetryReport& report) {
        for (size_t i = 0; i < report.count; ++i) {
            const TelemetryEntry& entry = report.entries[i];
            const SensorDescriptor* d = SensorTable::find(entry.sensor_id);
            if (d == nullptr) {
                continue;
            }
            if (entry.fresh) {
                LOG_DEBUG(TAG, "%s = %.*f %s", d->name, static_cast<int>(d->precision),
                          static_cast<double>(entry.value), d->unit);
            } else if (entry.available) {
                LOG_DEBUG(TAG, "%s = %.*f %s (cached, %lu s old)", d->name, static_cast<int>(d->precision),
                          static_cast<double>(entry.value), d->unit,
                          static_cast<unsigned long>(entry.age_ms / 1000));
            } else {
                LOG_DEBUG(TAG, "%s unavailable", d->name);
            }
        }
    }

    static void runCycle(uint32_t cycle) {
        SensorSnapshot snapshot{};
        const ReadResult result = s_session->readAllSensors(snapshot);

        TelemetryReport report{};
        s_cache.apply(snapshot, nowMs(), report);
        report.cycle = cycle;
        report.ts_ms = nowMs();
        const uint8_t buzzer = s_buzzer_state.load();
        report.buzzer_known = buzzer != 0;
        report.buzzer_on = buzzer == 2;
        s_session->describeBreaker(report.breaker, sizeof(report.breaker));
        std::snprintf(report.device_name, sizeof(report.device_name), "%s", s_device_name);

        if (!report.update_ok) {
            LOG_WARN(TAG, "Update failed (cycle %lu, %s, breaker %s)",
                     static_cast<unsigned long>(cycle), SensorSession::resultName(result), report.breaker);
        } else {
            LOG_INFO(TAG, "Cycle %lu: %u/%u sensors read",
                     static_cast<unsigned long>(cycle),
                     static_cast<unsigned>(report.valid_count), static_cast<unsigned>(report.count));
        }
        logCycle(report);

        if (s_telemetry_queue != nullptr) {
            (void)xQueueOverwrite(s_telemetry_queue, &report);
        }
    }

    static void taskFunction(void* parameters) {
        (void)parameters;
        LOG_INFO(TAG, "%s", "Sensor Poll Task started");

        // Give the BLE host and the sensor time to settle after boot
        vTaskDelay(pdMS_TO_TICKS(Config::Tasks::Poll::startup_delay_ms));

        if (!s_session->readDeviceName(s_device_name, sizeof(s_device_name)) || s_device_name[0] == '\0') {
            std::snprintf(s_device_name, sizeof(s_device_name), "%s", Config::Device::default_name);
            LOG_WARN(TAG, "Device name unavailable, using '%s'", s_device_name);
        } else {
            LOG_INFO(TAG, "Connected sensor: %s", s_device_name);
        }

        bool buzzer_on = false;
        if (s_session->readBuzzerState(buzzer_on)) {
            SensorPollTask::noteBuzzerState(buzzer_on);
            LOG_INFO(TAG, "Buzzer is %s", buzzer_on ? "on" : "off");
        }

        uint32_t cycle = 0;
        for (;;) {
            runCycle(++cycle);

            const uint32_t interval_ms = RuntimeSettings::getPollIntervalMs();
            // Woken early by requestRefresh()
            if (ulTaskNotifyTake(pdTRUE, pdMS_TO_TICKS(interval_ms)) > 0) {
                LOG_INFO(TAG, "%s", "Refresh requested");
            }
        }
    }
}

namespace SensorPollTask {
    void create(SensorSession& session, QueueHandle_t telemetry_queue) {
        s_session = &session;
        s_telemetry_queue = telemetry_queue;
        s_task_handle = xTaskCreateStatic(taskFunction,
                                          "sensor_poll",
                                          sizeof(s_task_stack) / sizeof(StackType_t),
                                          nullptr,
                                          Config::TaskPriorities::HIGH,
                                          s_task_stack,
                                          &s_task_tcb);
    }

    void requestRefresh() {
        if (s_task_handle != nullptr) {
            xTaskNotifyGive(s_task_handle);
        }
    }

    void noteBuzzerState(bool on) {
        s_buzzer_state.store(on ? 2 : 1);
    }
}
