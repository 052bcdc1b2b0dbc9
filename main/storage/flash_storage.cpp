#include <main/storage/flash_storage.hpp>
#include <main/config/config.hpp>
#include <main/utils/logger.hpp>
#include <esp_spiffs.h>
#include <esp_err.h>

static const char* TAG = "FlashStorage";

namespace {
    static bool s_mounted = false;
}

namespace FlashStorage {
    bool mount() {
        if (s_mounted) {
            return true;
        }
        esp_vfs_spiffs_conf_t conf = {};
        conf.base_path = Config::Storage::base_path;
        conf.partition_label = Config::Storage::partition_label;
        conf.max_files = Config::Storage::max_files;
        conf.format_if_mount_failed = true;

        esp_err_t err = esp_vfs_spiffs_register(&conf);
        if (err != ESP_OK) {
            LOG_ERROR(TAG, "SPIFFS mount failed: %s", esp_err_to_name(err));
            return false;
        }
        s_mounted = true;
        logUsage();
        return true;
    }

    bool isMounted() {
        return s_mounted;
    }

    void logUsage() {
        size_t total = 0;
        size_t used = 0;
        esp_err_t err = esp_spiffs_info(Config::Storage::partition_label, &total, &used);
        if (err != ESP_OK) {
            LOG_WARN(TAG, "SPIFFS info failed: %s", esp_err_to_name(err));
            return;
        }
        LOG_INFO(TAG, "SPIFFS %s: %u of %u bytes used", Config::Storage::base_path,
                 static_cast<unsigned>(used), static_cast<unsigned>(total));
    }
}
