#include <main/utils/freertos_clock.hpp>
#include <main/utils/watchdog.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <esp_timer.h>

namespace {
    static constexpr uint32_t SLEEP_SLICE_MS = 1000;
}

uint64_t FreeRtosClock::monotonicMs() const {
    return static_cast<uint64_t>(esp_timer_get_time()) / 1000ULL;
}

time_t FreeRtosClock::wallTime() const {
    return time(nullptr);
}

void FreeRtosClock::sleepMs(uint32_t ms) {
    while (ms > 0) {
        uint32_t slice = ms > SLEEP_SLICE_MS ? SLEEP_SLICE_MS : ms;
        TickType_t ticks = pdMS_TO_TICKS(slice);
        vTaskDelay(ticks > 0 ? ticks : 1);
        Watchdog::feed();
        ms -= slice;
    }
}
