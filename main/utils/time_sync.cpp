#include <main/utils/time_sync.hpp>
#include <main/utils/logger.hpp>

#include <ctime>
#include <cstdlib>
#include <esp_sntp.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

namespace {
    static const char* TAG = "TIME_SYNC";
    static bool s_inited = false;

    static bool timeIsReasonable() {
        time_t now = 0;
        time(&now);
        // Anything before 2024-01-01 00:00:00 UTC means the RTC was never set
        return now >= 1704067200;
    }
}

namespace TimeSync {
    void applyTimezone(const char* posix_tz) {
        setenv("TZ", posix_tz, 1);
        tzset();
        LOG_INFO(TAG, "Timezone set to %s", posix_tz);
    }

    void init() {
        if (s_inited) {
            return;
        }
        esp_sntp_setoperatingmode(ESP_SNTP_OPMODE_POLL);
        esp_sntp_setservername(0, "pool.ntp.org");
        esp_sntp_setservername(1, "time.google.com");
        esp_sntp_set_time_sync_notification_cb([](struct timeval*){
            LOG_INFO(TAG, "%s", "SNTP time synchronized");
        });
        esp_sntp_init();
        s_inited = true;
        LOG_INFO(TAG, "%s", "SNTP initialized");
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

    bool waitForSync(unsigned int timeout_ms) {
        if (!s_inited) {
            init();
        }
        LOG_INFO(TAG, "Waiting for time sync (up to %u ms)...", timeout_ms);
        const unsigned int interval_ms = 100;
        unsigned int waited = 0;
        while (waited < timeout_ms) {
            if (isSynced()) {
                LOG_INFO(TAG, "%s", "Time sync OK");
                return true;
            }
            vTaskDelay(pdMS_TO_TICKS(interval_ms));
            waited += interval_ms;
        }
        bool ok = isSynced();
        if (!ok) {
            LOG_WARN(TAG, "%s", "Time sync timeout; day rollover waits for a valid clock");
        }
        return ok;
    }
}
