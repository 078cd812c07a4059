#include <main/utils/time_sync.hpp>
#include <main/utils/logger.hpp>
#include <main/config/config.hpp>

#include <ctime>
#include <sys/time.h>
#include <esp_sntp.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

namespace {
    static const char* TAG = "TIME_SYNC";
    static bool s_inited = false;

    // Anything before 2026-01-01 00:00:00 UTC is an unset RTC
    static constexpr time_t MIN_VALID_EPOCH = 1767225600;

    static bool timeIsReasonable() {
        time_t now = 0;
        time(&now);
        return now >= MIN_VALID_EPOCH;
    }
}

namespace TimeSync {
    void init() {
        if (s_inited) {
            return;
        }
        esp_sntp_setoperatingmode(ESP_SNTP_OPMODE_POLL);
        esp_sntp_setservername(0, Config::Time::primary_server);
        esp_sntp_setservername(1, Config::Time::secondary_server);
        esp_sntp_set_time_sync_notification_cb([](struct timeval*){
            LOG_INFO(TAG, "%s", "SNTP time synchronized");
        });
        esp_sntp_init();
        s_inited = true;
        LOG_INFO(TAG, "SNTP initialized (%s, %s)", Config::Time::primary_server, Config::Time::secondary_server);
    }

    bool isSynced() {
        if (!s_inited) {
            return false;
        }
        if (timeIsReasonable()) {
            return true;
        }
        return sntp_get_sync_status() == SNTP_SYNC_STATUS_COMPLETED;
    }

    bool waitForSync(uint32_t timeout_ms) {
        if (!s_inited) {
            init();
        }
        const TickType_t interval = pdMS_TO_TICKS(100);
        TickType_t remaining = pdMS_TO_TICKS(timeout_ms);
        TimeOut_t timeout;
        vTaskSetTimeOutState(&timeout);
        while (!isSynced()) {
            if (xTaskCheckForTimeOut(&timeout, &remaining) == pdTRUE) {
                LOG_WARN(TAG, "Time sync timeout after %lu ms; telemetry goes out without timestamps",
                         static_cast<unsigned long>(timeout_ms));
                return false;
            }
            vTaskDelay(remaining < interval ? remaining : interval);
        }
        return true;
    }

    uint32_t epochSeconds() {
        if (!isSynced()) {
            return 0;
        }
        time_t now = 0;
        time(&now);
        return static_cast<uint32_t>(now);
    }

    void formatIsoTimestamp(char* out, std::size_t out_size) {
        if (out_size == 0) {
            return;
        }
        out[0] = '\0';
        if (!isSynced()) {
            return;
        }
        time_t now = 0;
        time(&now);
        struct tm tm_utc;
        gmtime_r(&now, &tm_utc);
        if (strftime(out, out_size, "%Y-%m-%dT%H:%M:%SZ", &tm_utc) == 0) {
            out[0] = '\0';
        }
    }
}
