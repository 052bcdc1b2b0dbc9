#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstdint>
#include <main/secrets.hpp>
#include <main/models/config_source_kind.hpp>

namespace Config {
namespace Wifi {
    // Network credentials sourced from secrets.hpp (git-ignored)
    static constexpr const char* ssid = Secrets::WIFI_SSID;
    static constexpr const char* password = Secrets::WIFI_PASSWORD;

    // Behavior
    static constexpr int max_retry_count = 5;              // Driver-level reconnect attempts per connect() call
    static constexpr uint32_t connect_timeout_ms = 20000;  // Wait for an IP before connect() gives up
    static constexpr uint32_t time_sync_timeout_ms = 10000;
}

namespace Device {
    static constexpr const char* id = Secrets::DEVICE_ID;
}

namespace Time {
    // POSIX TZ string; day rollover and days-after-planting use local time
    static constexpr const char* timezone = "IST-5:30";
}

namespace Soil {
    static constexpr double field_capacity_pct = 42.0;
    static constexpr double wilting_point_pct  = 15.0;
    // Used when the very first sampling window yields nothing
    static constexpr double default_vwc_pct    = 25.0;
    static constexpr double min_valid_vwc_pct  = 0.0;
    static constexpr double max_valid_vwc_pct  = 100.0;
}

namespace Weather {
    static constexpr double latitude  = 13.0192526;
    static constexpr double longitude = 77.5630184;
    static constexpr const char* api_key = Secrets::WEATHER_API_KEY;
    // snprintf template: latitude, longitude, api key
    static constexpr const char* url_template =
        "http://api.openweathermap.org/data/2.5/weather?lat=%.7f&lon=%.7f&appid=%s&units=metric";
    static constexpr int timeout_ms = 25000;
    static constexpr int max_response_len = 2048;

    // Defaults for fields missing from the response
    static constexpr double default_temp_c        = 25.0;
    static constexpr double default_humidity_pct  = 60.0;
    static constexpr double default_cloud_pct     = 50.0;
    static constexpr int    default_day_of_year   = 180;

    // Clear-sky daily radiation budget (Wh/m2) scaled by cloud cover
    static constexpr double clear_sky_wh_m2 = 990.0;

    enum class SolarModel : uint8_t {
        DAYLIGHT_HOURS = 0,    // E = P * (1 - 0.75 F^3) * N
        DAYLIGHT_FRACTION = 1  // E = P * (1 - 0.75 F^3) * N / 12
    };
    static constexpr SolarModel solar_model = SolarModel::DAYLIGHT_HOURS;
}

namespace Control {
    static constexpr uint32_t tick_interval_ms          = 30000;
    static constexpr uint32_t sampling_window_ms        = 300000;
    static constexpr uint32_t sampling_poll_ms          = 100;
    static constexpr uint32_t status_interval_ms        = 60000;
    static constexpr uint32_t config_timeout_ms         = 600000;
    static constexpr uint32_t config_poll_ms            = 100;
    static constexpr uint32_t config_progress_log_ms    = 15000;
    static constexpr uint32_t reconnect_backoff_ms      = 5000;
    static constexpr uint32_t reconnect_failure_wait_ms = 60000;
    // Pump runs shorter than this are not worth switching on for
    static constexpr double   min_pump_run_s            = 0.5;
}

namespace Storage {
    static constexpr const char* base_path = "/spiffs";
    static constexpr const char* partition_label = "storage";
    static constexpr int max_files = 4;
    static constexpr const char* daily_log_path = "/spiffs/daily_log.csv";
}

namespace Http {
    static constexpr uint16_t port = 80;
    static constexpr int max_body_len = 512;
}

// Feature toggles to enable/disable subsystems at build time
namespace Features {
    static constexpr bool enable_status_server = true;
    // Where the planting configuration comes from at startup
    static constexpr ConfigSourceKind config_source = ConfigSourceKind::MQTT_TOPICS;
    // Accept POST /config while running
    static constexpr bool enable_live_reconfig = true;
}

// Task priority levels (higher number = higher priority, can preempt lower)
namespace TaskPriorities {
    // Control loop owns all irrigation state; nothing preempts it but the network stack
    static constexpr uint32_t CONTROL = 2;
    static constexpr uint32_t HTTP    = 1;
}

namespace Tasks {
namespace Control {
    static constexpr uint32_t stack_bytes = 8192;
}
}

namespace Watchdog {
    // Must exceed the longest blocking call (weather fetch, MQTT connect)
    static constexpr uint32_t timeout_ms = 60000;
}

namespace Mqtt {
    // Broker endpoint (from secrets)
    static constexpr const char* host = Secrets::MQTT_HOST;
    static constexpr int port = Secrets::MQTT_PORT;
    static constexpr const char* username = Secrets::MQTT_USERNAME;
    static constexpr const char* password = Secrets::MQTT_PASSWORD;
    static constexpr bool use_tls = true;

    // Session behavior
    static constexpr bool clean_session = true;
    static constexpr uint16_t keepalive_seconds = 7200;
    static constexpr int default_qos = 1;
    static constexpr uint32_t connect_timeout_ms = 15000;
    static constexpr int inbound_queue_len = 32;

    // LWT
    static constexpr bool lwt_enable = true;

    // MQTT topics shared with the soil sensor / pump node and the dashboard
    namespace Topics {
        static constexpr const char* SOIL_MOISTURE   = "esp32/soilMoisture";
        static constexpr const char* PUMP_COMMAND    = "esp32/pump/control";
        static constexpr const char* LOG             = "RPi/Pico/Log";
        static constexpr const char* PUMP_REMAINING  = "RPi/Pico/PumpRemainingTime";
        static constexpr const char* CONFIG_CROP          = "User/Input/Crop";
        static constexpr const char* CONFIG_PLANTING_DATE = "User/Input/Planting/Date";
        static constexpr const char* CONFIG_PLANT_COUNT   = "User/Input/Plants/Number";
        static constexpr const char* CONFIG_PLANT_SPACING = "User/Input/Plants/Spacing";
        static constexpr const char* CONFIG_ROW_SPACING   = "User/Input/Row/Spacing";
        static constexpr const char* CONFIG_PUMP_FLOW     = "User/Input/Pump/Flowrate";
        // Template (use with device ID via snprintf)
        static constexpr const char* STATUS = "nursery/%s/status";
    }

    namespace Payloads {
        static constexpr const char* PUMP_ON  = "PUMP_ON";
        static constexpr const char* PUMP_OFF = "PUMP_OFF";
    }
}
}

#endif // CONFIG_HPP
