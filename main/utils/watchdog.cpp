#include <main/utils/watchdog.hpp>
#include <main/utils/logger.hpp>
#include <main/config/config.hpp>

namespace {
    static const char* TAG = "WATCHDOG";
}

namespace Watchdog {
    void init() {
        esp_task_wdt_config_t config = {
            .timeout_ms = Config::Watchdog::timeout_ms,
            .idle_core_mask = 0,  // Don't monitor idle tasks
            .trigger_panic = true
        };
        esp_err_t err = esp_task_wdt_reconfigure(&config);
        if (err == ESP_ERR_INVALID_STATE) {
            err = esp_task_wdt_init(&config);
        }
        if (err == ESP_OK) {
            LOG_INFO(TAG, "TWDT configured: %lu ms timeout", static_cast<unsigned long>(Config::Watchdog::timeout_ms));
        } else {
            LOG_ERROR(TAG, "TWDT config failed: %d", static_cast<int>(err));
        }
    }

    void subscribe() {
        esp_err_t err = esp_task_wdt_add(nullptr);
        if (err != ESP_OK) {
            LOG_WARN(TAG, "TWDT subscribe failed: %d", static_cast<int>(err));
        }
    }

    void unsubscribe() {
        esp_err_t err = esp_task_wdt_delete(nullptr);
        if (err != ESP_OK) {
            LOG_WARN(TAG, "TWDT unsubscribe failed: %d", static_cast<int>(err));
        }
    }

    void feed() {
        (void)esp_task_wdt_reset();
    }
}
