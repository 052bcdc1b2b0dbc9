#ifndef STATUS_STORE_HPP
#define STATUS_STORE_HPP

#include <main/models/controller_status.hpp>
#include <main/models/planting_config.hpp>

// Hand-over point between the control task and the HTTP server task.
// The control task publishes snapshots and takes submitted configurations;
// HTTP handlers read snapshots and submit configurations.
namespace StatusStore {
    void init();

    void publish(const ControllerStatus& status);
    // false until the first publish()
    bool latest(ControllerStatus& out_status);

    // A newer submission replaces one that was not taken yet
    void submitConfig(const PlantingConfig& config);
    bool takeConfig(PlantingConfig& out_config);
}

#endif // STATUS_STORE_HPP
