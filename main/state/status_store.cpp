#include <main/state/status_store.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <freertos/portmacro.h>

namespace {
    struct StoreData {
        bool have_status;
        ControllerStatus status;
        bool have_config;
        PlantingConfig config;
    };
    static StoreData s_data {};
#if defined(CONFIG_FREERTOS_UNICORE) || defined(portMUX_INITIALIZER_UNLOCKED)
    static portMUX_TYPE s_mux = portMUX_INITIALIZER_UNLOCKED;
#endif

    inline void lock() {
#if defined(CONFIG_FREERTOS_UNICORE) || defined(portMUX_INITIALIZER_UNLOCKED)
        taskENTER_CRITICAL(&s_mux);
#else
        taskENTER_CRITICAL();
#endif
    }

    inline void unlock() {
#if defined(CONFIG_FREERTOS_UNICORE) || defined(portMUX_INITIALIZER_UNLOCKED)
        taskEXIT_CRITICAL(&s_mux);
#else
        taskEXIT_CRITICAL();
#endif
    }
}

namespace StatusStore {
    void init() {
        lock();
        s_data.have_status = false;
        s_data.have_config = false;
        unlock();
    }

    void publish(const ControllerStatus& status) {
        lock();
        s_data.status = status;
        s_data.have_status = true;
        unlock();
    }

    bool latest(ControllerStatus& out_status) {
        lock();
        bool have = s_data.have_status;
        if (have) {
            out_status = s_data.status;
        }
        unlock();
        return have;
    }

    void submitConfig(const PlantingConfig& config) {
        lock();
        s_data.config = config;
        s_data.have_config = true;
        unlock();
    }

    bool takeConfig(PlantingConfig& out_config) {
        lock();
        bool have = s_data.have_config;
        if (have) {
            out_config = s_data.config;
            s_data.have_config = false;
        }
        unlock();
        return have;
    }
}
