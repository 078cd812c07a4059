// Fixed-size MQTT publish request handed to the cloud communication task
// (acks from the command task).
#ifndef CLOUD_PUBLISH_REQUEST_HPP
#define CLOUD_PUBLISH_REQUEST_HPP

#include <cstdint>

struct CloudPublishRequest {
    char topic[64];
    char payload[256];
    uint8_t qos;
    bool retain;
};

#endif // CLOUD_PUBLISH_REQUEST_HPP
