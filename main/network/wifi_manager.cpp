#include <main/network/wifi_manager.hpp>
#include <main/utils/logger.hpp>
#include <main/utils/time_sync.hpp>
#include <main/config/config.hpp>

#include <esp_err.h>
#include <cstdio>

static const char* TAG = "WiFiManager";

namespace {
    static constexpr EventBits_t BIT_GOT_IP = BIT0;
    static constexpr EventBits_t BIT_FAILED = BIT1;
}

WiFiManager::WiFiManager()
    : initialized(false),
      got_ip(false),
      retry_count(0),
      time_synced_once(false),
      event_group_storage{},
      event_group(nullptr),
      wifi_any_id_instance(nullptr),
      ip_got_ip_instance(nullptr) {}

bool WiFiManager::init() {
    if (initialized) {
        return true;
    }

    // NVS is initialised by app_main before any task starts; app_main may
    // also have brought up the TCP/IP stack for the status server
    esp_err_t err = esp_netif_init();
    if (err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
        LOG_ERROR(TAG, "esp_netif_init failed: %s", esp_err_to_name(err));
        return false;
    }
    err = esp_event_loop_create_default();
    if (err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
        LOG_ERROR(TAG, "Event loop create failed: %s", esp_err_to_name(err));
        return false;
    }

    event_group = xEventGroupCreateStatic(&event_group_storage);
    esp_netif_create_default_wifi_sta();

    wifi_init_config_t cfg = WIFI_INIT_CONFIG_DEFAULT();
    err = esp_wifi_init(&cfg);
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "esp_wifi_init failed: %s", esp_err_to_name(err));
        return false;
    }

    ESP_ERROR_CHECK(esp_event_handler_instance_register(
        WIFI_EVENT,
        ESP_EVENT_ANY_ID,
        &WiFiManager::wifiEventHandler,
        this,
        &wifi_any_id_instance
    ));
    ESP_ERROR_CHECK(esp_event_handler_instance_register(
        IP_EVENT,
        IP_EVENT_STA_GOT_IP,
        &WiFiManager::ipEventHandler,
        this,
        &ip_got_ip_instance
    ));

    ESP_ERROR_CHECK(esp_wifi_set_mode(WIFI_MODE_STA));

    wifi_config_t wifi_config = {};
    snprintf(reinterpret_cast<char*>(wifi_config.sta.ssid),
             sizeof(wifi_config.sta.ssid), "%s", Config::Wifi::ssid);
    snprintf(reinterpret_cast<char*>(wifi_config.sta.password),
             sizeof(wifi_config.sta.password), "%s", Config::Wifi::password);
    wifi_config.sta.threshold.authmode = WIFI_AUTH_WPA2_PSK;
    wifi_config.sta.sae_pwe_h2e = WPA3_SAE_PWE_BOTH;
    wifi_config.sta.pmf_cfg.capable = true;
    wifi_config.sta.pmf_cfg.required = false;

    ESP_ERROR_CHECK(esp_wifi_set_config(WIFI_IF_STA, &wifi_config));
    ESP_ERROR_CHECK(esp_wifi_start());

    initialized = true;
    return true;
}

bool WiFiManager::connect() {
    if (!init()) {
        return false;
    }
    if (got_ip) {
        return true;
    }
    retry_count = 0;
    xEventGroupClearBits(event_group, BIT_GOT_IP | BIT_FAILED);

    esp_err_t err = esp_wifi_connect();
    if (err != ESP_OK && err != ESP_ERR_WIFI_CONN) {
        LOG_ERROR(TAG, "esp_wifi_connect failed: %s", esp_err_to_name(err));
        return false;
    }
    LOG_INFO(TAG, "Connecting to SSID: %s", Config::Wifi::ssid);

    EventBits_t bits = xEventGroupWaitBits(event_group, BIT_GOT_IP | BIT_FAILED, pdFALSE, pdFALSE,
                                           pdMS_TO_TICKS(Config::Wifi::connect_timeout_ms));
    if ((bits & BIT_GOT_IP) == 0) {
        LOG_ERROR(TAG, "WiFi connect %s", (bits & BIT_FAILED) ? "gave up after retries" : "timed out");
        return false;
    }

    if (!time_synced_once) {
        TimeSync::init();
        time_synced_once = TimeSync::waitForSync(Config::Wifi::time_sync_timeout_ms);
    }
    return true;
}

void WiFiManager::disconnect() {
    (void)esp_wifi_disconnect();
    got_ip = false;
}

void WiFiManager::wifiEventHandler(void* arg, esp_event_base_t event_base, int32_t event_id, void* event_data) {
    (void)event_base;
    (void)event_data;
    WiFiManager* self = static_cast<WiFiManager*>(arg);
    switch (event_id) {
        case WIFI_EVENT_STA_START:
            LOG_INFO(TAG, "WIFI_EVENT_STA_START");
            break;
        case WIFI_EVENT_STA_CONNECTED:
            LOG_INFO(TAG, "WIFI_EVENT_STA_CONNECTED");
            break;
        case WIFI_EVENT_STA_DISCONNECTED:
            LOG_WARN(TAG, "WIFI_EVENT_STA_DISCONNECTED");
            self->got_ip = false;
            if (self->retry_count < Config::Wifi::max_retry_count) {
                self->retry_count = self->retry_count + 1;
                LOG_INFO(TAG, "Retrying WiFi (%d/%d)", self->retry_count, Config::Wifi::max_retry_count);
                (void)esp_wifi_connect();
            } else {
                LOG_ERROR(TAG, "WiFi connect failed after %d retries", Config::Wifi::max_retry_count);
                xEventGroupSetBits(self->event_group, BIT_FAILED);
            }
            break;
        case WIFI_EVENT_STA_STOP:
            LOG_INFO(TAG, "WIFI_EVENT_STA_STOP");
            self->got_ip = false;
            break;
        default:
            break;
    }
}

void WiFiManager::ipEventHandler(void* arg, esp_event_base_t event_base, int32_t event_id, void* event_data) {
    (void)event_base;
    WiFiManager* self = static_cast<WiFiManager*>(arg);
    if (event_id == IP_EVENT_STA_GOT_IP) {
        auto* event = static_cast<ip_event_got_ip_t*>(event_data);
        self->got_ip = true;
        self->retry_count = 0;
        LOG_INFO(TAG, "Got IP address " IPSTR, IP2STR(&event->ip_info.ip));
        xEventGroupSetBits(self->event_group, BIT_GOT_IP);
    }
}
