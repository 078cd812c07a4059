#ifndef CLOUD_COMMUNICATION_TASK_HPP
#define CLOUD_COMMUNICATION_TASK_HPP

#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>

namespace CloudCommunicationTask {
    // telemetry_queue: TelemetryReport from the poll task (latest only)
    // command_queue:   Commands parsed from em1003/<id>/cmd
    // publish_queue:   CloudPublishRequest acks from the command task
    void create(QueueHandle_t telemetry_queue,
                QueueHandle_t command_queue,
                QueueHandle_t publish_queue);
}

#endif // CLOUD_COMMUNICATION_TASK_HPP
