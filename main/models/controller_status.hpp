#ifndef CONTROLLER_STATUS_HPP
#define CONTROLLER_STATUS_HPP

#include <cstdint>
#include <main/models/planting_config.hpp>
#include <main/models/daily_state.hpp>

enum class LoopPhase : uint8_t {
    CONNECTING = 0,
    CONFIG_PENDING = 1,
    RUNNING = 2,
    HALTED = 3
};

// Copyable snapshot of the control loop, handed to observers after each tick
struct ControllerStatus {
    LoopPhase      phase;
    bool           has_config;
    PlantingConfig config;
    double         total_area_m2;
    DailyState     daily;
    bool           pump_running;
    double         pump_target_s;
    double         pump_remaining_s;
    bool           network_connected;
    bool           bus_connected;
    uint64_t       uptime_ms;
};

#endif // CONTROLLER_STATUS_HPP
