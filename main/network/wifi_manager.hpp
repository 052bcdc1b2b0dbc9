#ifndef WIFI_MANAGER_HPP
#define WIFI_MANAGER_HPP

#include <cstdint>
#include <esp_wifi.h>
#include <esp_event.h>
#include <esp_netif.h>
#include <freertos/FreeRTOS.h>
#include <freertos/event_groups.h>
#include <main/control/collaborators.hpp>

// Station-mode Wi-Fi link. connect() blocks until an IP is assigned or the
// attempt runs out of retries/time; the first success also syncs the clock.
class WiFiManager : public NetworkLink {
public:
    WiFiManager();

    bool init();
    bool connect() override;
    void disconnect();

    bool isConnected() const override { return got_ip; }

private:
    static void wifiEventHandler(void* arg, esp_event_base_t event_base, int32_t event_id, void* event_data);
    static void ipEventHandler(void* arg, esp_event_base_t event_base, int32_t event_id, void* event_data);

    bool initialized;
    volatile bool got_ip;
    volatile int retry_count;
    bool time_synced_once;

    StaticEventGroup_t event_group_storage;
    EventGroupHandle_t event_group;
    esp_event_handler_instance_t wifi_any_id_instance;
    esp_event_handler_instance_t ip_got_ip_instance;
};

#endif // WIFI_MANAGER_HPP
