#ifndef COMMAND_TASK_HPP
#define COMMAND_TASK_HPP

#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#include <main/session/sensor_session.hpp>

namespace CommandTask {
    // Executes Commands from command_queue against the session and runtime
    // settings, and queues a CloudPublishRequest ack for each one
    void create(SensorSession& session, QueueHandle_t command_queue, QueueHandle_t publish_queue);
}

#endif // COMMAND_TASK_HPP
