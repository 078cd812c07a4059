#include <main/state/runtime_settings.hpp>
#include <main/config/config.hpp>
#include <main/utils/logger.hpp>
#include <nvs_flash.h>
#include <nvs.h>
#include <freertos/FreeRTOS.h>
#include <freertos/portmacro.h>

static const char* TAG = "RUNTIME_SET";
static const char* NVS_NAMESPACE = "em1003";

namespace {
    // Bump when the blob layout changes; older blobs are ignored
    static constexpr uint8_t SETTINGS_VERSION = 1;

    struct SettingsData {
        uint8_t  version;
        uint8_t  disconnect_policy;
        uint32_t poll_interval_ms;
    };

    static SettingsData s_data;
    static bool s_initialized = false;
    static portMUX_TYPE s_mux = portMUX_INITIALIZER_UNLOCKED;

    static void loadDefaults() {
        s_data.version = SETTINGS_VERSION;
        s_data.poll_interval_ms = Config::Tasks::Poll::default_period_ms;
        s_data.disconnect_policy = static_cast<uint8_t>(
            Config::Session::eager_disconnect ? DisconnectPolicy::EAGER : DisconnectPolicy::KEEP_ALIVE);
    }

    static bool loadFromNvs() {
        nvs_handle_t handle;
        esp_err_t err = nvs_open(NVS_NAMESPACE, NVS_READONLY, &handle);
        if (err != ESP_OK) {
            return false;
        }

        SettingsData stored;
        size_t required_size = sizeof(SettingsData);
        err = nvs_get_blob(handle, "settings", &stored, &required_size);
        nvs_close(handle);

        if (err != ESP_OK || required_size != sizeof(SettingsData) || stored.version != SETTINGS_VERSION) {
            return false;
        }
        s_data = stored;
        return true;
    }

    static bool saveToNvs() {
        SettingsData copy;
        taskENTER_CRITICAL(&s_mux);
        copy = s_data;
        taskEXIT_CRITICAL(&s_mux);

        nvs_handle_t handle;
        esp_err_t err = nvs_open(NVS_NAMESPACE, NVS_READWRITE, &handle);
        if (err != ESP_OK) {
            LOG_ERROR(TAG, "NVS open failed: %s", esp_err_to_name(err));
            return false;
        }

        err = nvs_set_blob(handle, "settings", &copy, sizeof(SettingsData));
        if (err != ESP_OK) {
            LOG_ERROR(TAG, "NVS set_blob failed: %s", esp_err_to_name(err));
            nvs_close(handle);
            return false;
        }

        err = nvs_commit(handle);
        nvs_close(handle);
        if (err != ESP_OK) {
            LOG_ERROR(TAG, "NVS commit failed: %s", esp_err_to_name(err));
            return false;
        }
        return true;
    }
}

namespace RuntimeSettings {
    void init() {
        if (s_initialized) {
            return;
        }

        loadDefaults();

        if (loadFromNvs()) {
            LOG_INFO(TAG, "Loaded settings from NVS (poll %lu ms, %s disconnect)",
                     static_cast<unsigned long>(s_data.poll_interval_ms),
                     s_data.disconnect_policy == static_cast<uint8_t>(DisconnectPolicy::EAGER) ? "eager" : "keep-alive");
        } else {
            LOG_INFO(TAG, "%s", "Using default settings (NVS not found or outdated)");
            loadDefaults();
            (void)saveToNvs();
        }

        s_initialized = true;
    }

    uint32_t getPollIntervalMs() {
        taskENTER_CRITICAL(&s_mux);
        uint32_t val = s_data.poll_interval_ms;
        taskEXIT_CRITICAL(&s_mux);
        return val;
    }

    bool setPollIntervalMs(uint32_t value) {
        if (value < Config::Tasks::Poll::min_period_ms || value > Config::Tasks::Poll::max_period_ms) {
            LOG_WARN(TAG, "Poll interval %lu ms out of range [%lu, %lu]",
                     static_cast<unsigned long>(value),
                     static_cast<unsigned long>(Config::Tasks::Poll::min_period_ms),
                     static_cast<unsigned long>(Config::Tasks::Poll::max_period_ms));
            return false;
        }
        taskENTER_CRITICAL(&s_mux);
        s_data.poll_interval_ms = value;
        taskEXIT_CRITICAL(&s_mux);
        bool ok = saveToNvs();
        if (ok) {
            LOG_INFO(TAG, "Updated poll interval to %lu ms", static_cast<unsigned long>(value));
        }
        return ok;
    }

    DisconnectPolicy getDisconnectPolicy() {
        taskENTER_CRITICAL(&s_mux);
        uint8_t val = s_data.disconnect_policy;
        taskEXIT_CRITICAL(&s_mux);
        return val == static_cast<uint8_t>(DisconnectPolicy::KEEP_ALIVE) ? DisconnectPolicy::KEEP_ALIVE
                                                                         : DisconnectPolicy::EAGER;
    }

    bool setDisconnectPolicy(DisconnectPolicy value) {
        taskENTER_CRITICAL(&s_mux);
        s_data.disconnect_policy = static_cast<uint8_t>(value);
        taskEXIT_CRITICAL(&s_mux);
        bool ok = saveToNvs();
        if (ok) {
            LOG_INFO(TAG, "Updated disconnect policy to %s",
                     value == DisconnectPolicy::EAGER ? "eager" : "keep-alive");
        }
        return ok;
    }
}
