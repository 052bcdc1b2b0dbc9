#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <main/utils/logger.hpp>
#include <main/config/config.hpp>
#include <main/network/status_server.hpp>
#include <main/storage/flash_storage.hpp>
#include <main/tasks/control_task.hpp>
#include <main/utils/time_sync.hpp>
#include <main/utils/watchdog.hpp>
#include <esp_event.h>
#include <esp_netif.h>
#include <nvs_flash.h>

extern "C" void app_main(void)
{
    Logger::setLevel(LogLevel::INFO);
    LOG_INFO("MAIN", "%s", "---Nursery irrigation controller started---");

    TimeSync::applyTimezone(Config::Time::timezone);

    // Wi-Fi driver keeps its calibration and credentials in NVS
    esp_err_t err = nvs_flash_init();
    if (err == ESP_ERR_NVS_NO_FREE_PAGES || err == ESP_ERR_NVS_NEW_VERSION_FOUND) {
        ESP_ERROR_CHECK(nvs_flash_erase());
        err = nvs_flash_init();
    }
    if (err != ESP_OK) {
        LOG_ERROR("MAIN", "NVS init failed: %d", static_cast<int>(err));
    }

    // Daily log lives on SPIFFS; without it rows are dropped with an error each day
    if (FlashStorage::mount()) {
        FlashStorage::logUsage();
    } else {
        LOG_ERROR("MAIN", "%s", "SPIFFS unavailable, daily log disabled");
    }

    Watchdog::init();

    // httpd needs the TCP/IP stack before Wi-Fi is up
    err = esp_netif_init();
    if (err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
        LOG_ERROR("MAIN", "esp_netif_init failed: %s", esp_err_to_name(err));
    }
    err = esp_event_loop_create_default();
    if (err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
        LOG_ERROR("MAIN", "Event loop create failed: %s", esp_err_to_name(err));
    }

    static StatusServer s_status_server(Config::Storage::daily_log_path);
    StatusServer* status_server = nullptr;
    if (Config::Features::enable_status_server) {
        if (s_status_server.start()) {
            status_server = &s_status_server;
        } else {
            LOG_WARN("MAIN", "%s", "Status server failed to start; continuing without it");
        }
    }

    ControlTask::create(status_server);

    // Main task has nothing to do after initialization - block forever
    for (;;) {
        vTaskDelay(portMAX_DELAY);
    }
}
