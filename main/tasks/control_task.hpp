#ifndef CONTROL_TASK_HPP
#define CONTROL_TASK_HPP

class StatusServer;

namespace ControlTask {
    // Create the task that owns the irrigation control loop.
    // status_server may be null; when given it receives status snapshots and,
    // if live reconfiguration is enabled, supplies POST /config updates.
    void create(StatusServer* status_server);
}

#endif // CONTROL_TASK_HPP
