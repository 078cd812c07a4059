// Site-specific credentials. Replace the placeholders before flashing and keep
// the filled-in copy out of version control.
#ifndef SECRETS_HPP
#define SECRETS_HPP

namespace Secrets {
    static constexpr const char* WIFI_SSID = "changeme";
    static constexpr const char* WIFI_PASSWORD = "changeme";

    static constexpr const char* DEVICE_ID = "em1003-gw-01";
    static constexpr const char* SENSOR_ADDRESS = "00:00:00:00:00:00";

    static constexpr const char* MQTT_HOST = "192.168.1.10";
    static constexpr int MQTT_PORT = 1883;
}

#endif // SECRETS_HPP
