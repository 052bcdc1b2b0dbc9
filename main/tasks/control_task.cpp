#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <cstdio>
#include <main/tasks/control_task.hpp>
#include <main/config/config.hpp>
#include <main/config/console_config_source.hpp>
#include <main/config/topic_config_source.hpp>
#include <main/control/control_loop.hpp>
#include <main/network/mqtt_client.hpp>
#include <main/network/status_server.hpp>
#include <main/network/weather_client.hpp>
#include <main/network/wifi_manager.hpp>
#include <main/storage/daily_log.hpp>
#include <main/utils/freertos_clock.hpp>
#include <main/utils/logger.hpp>
#include <main/utils/watchdog.hpp>

static const char* TAG = "CONTROL_TASK";

namespace {
    // Static instances (no heap)
    static WiFiManager s_wifi;
    static MqttClient s_mqtt;
    static WeatherClient s_weather;
    static DailyLogFile s_daily_log(Config::Storage::daily_log_path);
    static FreeRtosClock s_clock;
    static TopicConfigSource s_topic_config;
    static ConsoleConfigSource s_console_config(stdin, stdout);
    static StatusServer* s_status_server = nullptr;

    static StaticTask_t s_task_tcb;
    static StackType_t s_task_stack[Config::Tasks::Control::stack_bytes / sizeof(StackType_t)];

    static ConfigSource* selectStartupSource() {
        switch (Config::Features::config_source) {
            case ConfigSourceKind::CONSOLE:
                return &s_console_config;
            case ConfigSourceKind::HTTP:
                if (s_status_server != nullptr && s_status_server->isRunning()) {
                    return s_status_server;
                }
                LOG_WARN(TAG, "%s", "HTTP config source needs the status server; using MQTT topics");
                return &s_topic_config;
            case ConfigSourceKind::MQTT_TOPICS:
            default:
                return &s_topic_config;
        }
    }

    static void taskFunction(void* /*pvParameters*/) {
        Watchdog::subscribe();

        ConfigSource* startup = selectStartupSource();
        LOG_INFO(TAG, "Planting configuration source: %s", startup->name());

        static ControlLoop loop(LoopSettings::fromConfig(), s_wifi, s_mqtt, s_weather, s_daily_log, s_clock, *startup);
        if (s_status_server != nullptr && s_status_server->isRunning()) {
            loop.setStatusObserver(s_status_server);
            if (Config::Features::enable_live_reconfig) {
                loop.setLiveConfigSource(s_status_server);
            }
        }

        if (!loop.run()) {
            LOG_ERROR(TAG, "%s", "Controller halted; no irrigation will run until reset");
        }
        Watchdog::unsubscribe();
        vTaskDelete(nullptr);
    }
}

namespace ControlTask {
    void create(StatusServer* status_server) {
        s_status_server = status_server;
        TaskHandle_t handle = xTaskCreateStatic(taskFunction,
                                                "control",
                                                sizeof(s_task_stack) / sizeof(StackType_t),
                                                nullptr,
                                                Config::TaskPriorities::CONTROL,
                                                s_task_stack,
                                                &s_task_tcb);
        if (handle == nullptr) {
            LOG_ERROR(TAG, "%s", "Failed to create control task");
        }
    }
}
