#ifndef WIFI_MANAGER_HPP
#define WIFI_MANAGER_HPP

#include <cstdint>
#include <esp_wifi.h>
#include <esp_event.h>
#include <esp_netif.h>
#include <freertos/FreeRTOS.h>
#include <freertos/event_groups.h>

// Station-mode WiFi. Expects NVS to be initialized by app_main.
class WiFiManager {
public:
    WiFiManager();

    bool init();
    bool connect();
    void disconnect();
    bool reconnect();

    // Block until an IP is assigned or timeout_ms elapses
    bool waitForIp(uint32_t timeout_ms);

    bool isConnected() const { return connected; }
    bool hasIp() const { return got_ip; }

private:
    static void wifiEventHandler(void* arg, esp_event_base_t event_base, int32_t event_id, void* event_data);
    static void ipEventHandler(void* arg, esp_event_base_t event_base, int32_t event_id, void* event_data);

    bool initialized;
    volatile bool connected;
    volatile bool got_ip;
    int retry_count;

    StaticEventGroup_t events_buffer;
    EventGroupHandle_t events;

    esp_event_handler_instance_t wifi_any_id_instance;
    esp_event_handler_instance_t ip_got_ip_instance;
};

#endif // WIFI_MANAGER_HPP
