#include <main/network/wifi_manager.hpp>
#include <main/utils/logger.hpp>
#include <main/config/config.hpp>

#include <esp_err.h>
#include <cstdio>

static const char* TAG = "WiFiManager";

namespace {
    static constexpr EventBits_t BIT_GOT_IP = BIT0;

    bool checked(const char* what, esp_err_t err) {
        if (err != ESP_OK) {
            LOG_ERROR(TAG, "%s failed: %s", what, esp_err_to_name(err));
            return false;
        }
        return true;
    }
}

WiFiManager::WiFiManager()
    : initialized(false),
      connected(false),
      got_ip(false),
      retry_count(0),
      events(xEventGroupCreateStatic(&events_buffer)),
      wifi_any_id_instance(nullptr),
      ip_got_ip_instance(nullptr) {}

bool WiFiManager::init() {
    if (initialized) {
        return true;
    }

    esp_err_t err = esp_netif_init();
    if (!checked("esp_netif_init", err)) {
        return false;
    }
    err = esp_event_loop_create_default();
    if (err != ESP_ERR_INVALID_STATE && !checked("esp_event_loop_create_default", err)) {
        return false;
    }

    if (esp_netif_create_default_wifi_sta() == nullptr) {
        LOG_ERROR(TAG, "%s", "Could not create the STA netif");
        return false;
    }

    wifi_init_config_t cfg = WIFI_INIT_CONFIG_DEFAULT();
    if (!checked("esp_wifi_init", esp_wifi_init(&cfg))) {
        return false;
    }

    err = esp_event_handler_instance_register(WIFI_EVENT, ESP_EVENT_ANY_ID,
                                              &WiFiManager::wifiEventHandler, this, &wifi_any_id_instance);
    if (!checked("register WIFI_EVENT", err)) {
        return false;
    }
    err = esp_event_handler_instance_register(IP_EVENT, IP_EVENT_STA_GOT_IP,
                                              &WiFiManager::ipEventHandler, this, &ip_got_ip_instance);
    if (!checked("register IP_EVENT", err)) {
        return false;
    }

    wifi_config_t wifi_config = {};
    // IDF expects zero-terminated credentials
    snprintf(reinterpret_cast<char*>(wifi_config.sta.ssid),
             sizeof(wifi_config.sta.ssid), "%s", Config::Wifi::ssid);
    snprintf(reinterpret_cast<char*>(wifi_config.sta.password),
             sizeof(wifi_config.sta.password), "%s", Config::Wifi::password);
    wifi_config.sta.threshold.authmode = WIFI_AUTH_WPA2_PSK;
    wifi_config.sta.sae_pwe_h2e = WPA3_SAE_PWE_BOTH;
    wifi_config.sta.pmf_cfg.capable = true;
    wifi_config.sta.pmf_cfg.required = false;

    if (!checked("esp_wifi_set_mode", esp_wifi_set_mode(WIFI_MODE_STA)) ||
        !checked("esp_wifi_set_config", esp_wifi_set_config(WIFI_IF_STA, &wifi_config)) ||
        // BLE and WiFi share the radio; modem sleep lets the coexistence scheduler interleave them
        !checked("esp_wifi_set_ps", esp_wifi_set_ps(WIFI_PS_MIN_MODEM)) ||
        !checked("esp_wifi_start", esp_wifi_start())) {
        return false;
    }

    initialized = true;
    if (Config::Wifi::auto_connect_on_start) {
        return connect();
    }
    return true;
}

bool WiFiManager::connect() {
    if (!initialized && !init()) {
        return false;
    }
    retry_count = 0;
    got_ip = false;
    xEventGroupClearBits(events, BIT_GOT_IP);
    esp_err_t err = esp_wifi_connect();
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "esp_wifi_connect failed: %s", esp_err_to_name(err));
        return false;
    }
    LOG_INFO(TAG, "Connecting to SSID: %s", Config::Wifi::ssid);
    return true;
}

void WiFiManager::disconnect() {
    (void)esp_wifi_disconnect();
    connected = false;
    got_ip = false;
    xEventGroupClearBits(events, BIT_GOT_IP);
}

bool WiFiManager::reconnect() {
    disconnect();
    return connect();
}

bool WiFiManager::waitForIp(uint32_t timeout_ms) {
    const EventBits_t bits = xEventGroupWaitBits(events, BIT_GOT_IP, pdFALSE, pdTRUE, pdMS_TO_TICKS(timeout_ms));
    return (bits & BIT_GOT_IP) != 0;
}

void WiFiManager::wifiEventHandler(void* arg, esp_event_base_t, int32_t event_id, void* event_data) {
    WiFiManager* self = static_cast<WiFiManager*>(arg);
    switch (event_id) {
        case WIFI_EVENT_STA_CONNECTED:
            LOG_INFO(TAG, "%s", "WIFI_EVENT_STA_CONNECTED");
            self->connected = true;
            break;
        case WIFI_EVENT_STA_DISCONNECTED: {
            const auto* info = static_cast<const wifi_event_sta_disconnected_t*>(event_data);
            LOG_WARN(TAG, "WIFI_EVENT_STA_DISCONNECTED (reason %d)", info != nullptr ? info->reason : -1);
            self->connected = false;
            self->got_ip = false;
            xEventGroupClearBits(self->events, BIT_GOT_IP);
            if (self->retry_count < Config::Wifi::max_retry_count) {
                self->retry_count++;
                LOG_INFO(TAG, "Retrying WiFi (%d/%d)", self->retry_count, Config::Wifi::max_retry_count);
                (void)esp_wifi_connect();
            } else {
                LOG_ERROR(TAG, "WiFi connect failed after %d retries", Config::Wifi::max_retry_count);
            }
            break;
        }
        case WIFI_EVENT_STA_STOP:
            self->connected = false;
            self->got_ip = false;
            break;
        default:
            break;
    }
}

void WiFiManager::ipEventHandler(void* arg, esp_event_base_t, int32_t event_id, void* event_data) {
    WiFiManager* self = static_cast<WiFiManager*>(arg);
    if (event_id == IP_EVENT_STA_GOT_IP) {
        const auto* info = static_cast<const ip_event_got_ip_t*>(event_data);
        self->got_ip = true;
        self->connected = true;
        self->retry_count = 0;
        if (info != nullptr) {
            LOG_INFO(TAG, "Got IP " IPSTR, IP2STR(&info->ip_info.ip));
        }
        xEventGroupSetBits(self->events, BIT_GOT_IP);
    }
}
