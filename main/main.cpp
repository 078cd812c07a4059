#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <freertos/queue.h>
#include <main/utils/logger.hpp>
#include <main/config/config.hpp>
#include <main/ble/nimble_transport.hpp>
#include <main/session/sensor_session.hpp>
#include <main/tasks/cloud_communication_task.hpp>
#include <main/tasks/command_task.hpp>
#include <main/tasks/sensor_poll_task.hpp>
#include <main/models/command.hpp>
#include <main/models/telemetry_report.hpp>
#include <main/models/cloud_publish_request.hpp>
#include <main/state/runtime_settings.hpp>
#include <main/utils/clock.hpp>
#include <main/utils/watchdog.hpp>
#include <nvs_flash.h>

extern "C" void app_main(void)
{
    Logger::setLevel(LogLevel::INFO);
    LOG_INFO("MAIN", "%s", "---EM1003 gateway started---");

    // NVS backs WiFi calibration and the runtime settings
    esp_err_t err = nvs_flash_init();
    if (err == ESP_ERR_NVS_NO_FREE_PAGES || err == ESP_ERR_NVS_NEW_VERSION_FOUND) {
        ESP_ERROR_CHECK(nvs_flash_erase());
        err = nvs_flash_init();
    }
    if (err != ESP_OK) {
        LOG_ERROR("MAIN", "NVS init failed: %s", esp_err_to_name(err));
    }

    RuntimeSettings::init();
    Watchdog::init();

    static SystemClock clock;
    static NimbleTransport transport;
    const bool ble_ready = transport.init();
    if (!ble_ready) {
        LOG_ERROR("MAIN", "%s", "BLE host did not start; sensor polling disabled");
    }

    SessionOptions options;
    options.disconnect_policy = RuntimeSettings::getDisconnectPolicy();
    static SensorSession session(transport, Config::Device::sensor_address, clock, options);

    // Latest report only; the poll task overwrites it each cycle
    static uint8_t telemetry_queue_storage[1 * sizeof(TelemetryReport)];
    static StaticQueue_t telemetry_queue_tcb;
    QueueHandle_t telemetry_queue = xQueueCreateStatic(
        1, sizeof(TelemetryReport), telemetry_queue_storage, &telemetry_queue_tcb);

    static uint8_t command_queue_storage[8 * sizeof(Command)];
    static StaticQueue_t command_queue_tcb;
    QueueHandle_t command_queue = xQueueCreateStatic(
        8, sizeof(Command), command_queue_storage, &command_queue_tcb);

    static uint8_t publish_queue_storage[4 * sizeof(CloudPublishRequest)];
    static StaticQueue_t publish_queue_tcb;
    QueueHandle_t publish_queue = xQueueCreateStatic(
        4, sizeof(CloudPublishRequest), publish_queue_storage, &publish_queue_tcb);

    if (Config::Features::enable_cloud_comm) {
        CloudCommunicationTask::create(telemetry_queue, command_queue, publish_queue);
    }
    CommandTask::create(session, command_queue, publish_queue);

    if (Config::Features::enable_poll_task && ble_ready) {
        SensorPollTask::create(session, telemetry_queue);
    }

    // Main task has nothing to do after initialization - block forever
    for (;;) {
        vTaskDelay(portMAX_DELAY);
    }
}
