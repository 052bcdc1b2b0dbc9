#ifndef FREERTOS_CLOCK_HPP
#define FREERTOS_CLOCK_HPP

#include <main/control/collaborators.hpp>

// esp_timer for monotonic time, the C library for wall time, vTaskDelay for
// sleeping. Long sleeps are cut into slices that feed the task watchdog.
class FreeRtosClock : public Clock {
public:
    uint64_t monotonicMs() const override;
    time_t wallTime() const override;
    void sleepMs(uint32_t ms) override;
};

#endif // FREERTOS_CLOCK_HPP
