#ifndef SENSOR_POLL_TASK_HPP
#define SENSOR_POLL_TASK_HPP

#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#include <main/session/sensor_session.hpp>

namespace SensorPollTask {
    // telemetry_queue: length 1, the task overwrites it with the latest TelemetryReport
    void create(SensorSession& session, QueueHandle_t telemetry_queue);

    // Run a cycle now instead of waiting for the poll interval
    void requestRefresh();

    // Buzzer state learned by the command task, carried in the next report
    void noteBuzzerState(bool on);
}

#endif // SENSOR_POLL_TASK_HPP
