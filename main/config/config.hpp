#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <main/secrets.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

namespace Config {
namespace Wifi {
    // Network credentials sourced from secrets.hpp (git-ignored)
    static constexpr const char* ssid = Secrets::WIFI_SSID;
    static constexpr const char* password = Secrets::WIFI_PASSWORD;

    static constexpr bool auto_connect_on_start = true;
    static constexpr int max_retry_count = 5;            // Reconnect attempts per trigger before giving up
    static constexpr uint32_t connect_wait_ms = 15000;   // Upper bound for the first IP wait
}

namespace Device {
    // Gateway identity used in MQTT topics
    static constexpr const char* id = Secrets::DEVICE_ID;
    // BLE address of the EM1003 this gateway owns ("AA:BB:CC:DD:EE:FF")
    static constexpr const char* sensor_address = Secrets::SENSOR_ADDRESS;
    static constexpr const char* default_name = "EM1003";
}

namespace Ble {
    // GATT layout of the EM1003 (16-bit UUIDs)
    static constexpr uint16_t write_char_uuid = 0xFFF1;
    static constexpr uint16_t notify_char_uuid = 0xFFF2;
    static constexpr uint16_t device_name_uuid = 0x2A00;
    static constexpr uint16_t cccd_uuid = 0x2902;

    // 0 = public, 1 = random static
    static constexpr uint8_t peer_address_type = 0;

    static constexpr uint32_t sync_timeout_ms = 10000;
    static constexpr uint32_t connect_timeout_ms = 30000;   // Single attempt, no radio-level retries
    static constexpr uint32_t discovery_timeout_ms = 5000;
    static constexpr uint32_t gatt_op_timeout_ms = 3000;
    static constexpr uint32_t disconnect_timeout_ms = 2000;

    // Notification frames buffered between the host task and the session
    static constexpr size_t mailbox_depth = 8;
    static constexpr size_t max_frame_len = 32;
}

namespace Session {
    static constexpr uint32_t response_timeout_ms = 2000;
    static constexpr uint32_t pending_max_age_ms = 10000;
    static constexpr uint32_t batch_pacing_ms = 300;
    static constexpr uint32_t lock_timeout_ms = 120000;

    // Connection lifecycle
    static constexpr uint32_t fast_fail_window_ms = 30000;
    static constexpr uint32_t base_reconnect_delay_ms = 2000;
    static constexpr uint32_t abort_backoff_cap_ms = 30000;
    static constexpr uint32_t abort_decay_ms = 300000;      // 5 minutes without an abort resets the counter

    // Disconnect right after a batch read to free the adapter's connection slot
    static constexpr bool eager_disconnect = true;
}

namespace Breaker {
    static constexpr uint32_t failure_threshold = 3;
    static constexpr uint32_t base_open_ms = 60000;
    static constexpr uint32_t max_open_ms = 3600000;
}

namespace Tasks {
namespace Poll {
    static constexpr uint32_t default_period_ms = 60000;
    static constexpr uint32_t min_period_ms = 10000;
    static constexpr uint32_t max_period_ms = 3600000;
    static constexpr uint32_t startup_delay_ms = 2000;
    // Cached readings keep a sensor available this long after the last good value
    static constexpr uint32_t stale_after_ms = 20U * 60U * 1000U;
}
namespace Cloud {
    static constexpr uint32_t status_period_ms = 30000;
    static constexpr uint32_t reconnect_interval_ms = 30000;
}
}

namespace Features {
    static constexpr bool enable_cloud_comm = true;
    static constexpr bool enable_poll_task  = true;
}

// Task priority levels (higher number = higher priority, can preempt lower)
namespace TaskPriorities {
    // BLE exchanges have tight response windows
    static constexpr UBaseType_t HIGH   = tskIDLE_PRIORITY + 2;

    // Network I/O and command handling can tolerate latency
    static constexpr UBaseType_t NORMAL = tskIDLE_PRIORITY + 1;
}

namespace Watchdog {
    // Must exceed the longest blocking step of a subscribed task (SNTP wait)
    static constexpr uint32_t timeout_ms = 30000;
}

namespace Time {
    static constexpr const char* primary_server = "pool.ntp.org";
    static constexpr const char* secondary_server = "time.google.com";
    static constexpr uint32_t sync_wait_ms = 10000;
}

namespace Mqtt {
    // Broker endpoint (from secrets)
    static constexpr const char* host = Secrets::MQTT_HOST;
    static constexpr int port = Secrets::MQTT_PORT;

    static constexpr bool clean_session = true;
    static constexpr uint16_t keepalive_seconds = 60;
    static constexpr int default_qos = 1;
    static constexpr bool telemetry_retain = true;

    // LWT marks the gateway offline on broker side
    static constexpr bool lwt_enable = true;

    // MQTT Topic Templates (use with device ID via snprintf)
    namespace Topics {
        static constexpr const char* TELEMETRY = "em1003/%s/telemetry";
        static constexpr const char* STATUS = "em1003/%s/status";
        static constexpr const char* AVAILABILITY = "em1003/%s/availability";
        static constexpr const char* CMD = "em1003/%s/cmd";
        static constexpr const char* ACK = "em1003/%s/ack";
    }
}
}

#endif // CONFIG_HPP
