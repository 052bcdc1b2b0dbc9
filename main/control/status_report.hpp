#ifndef STATUS_REPORT_HPP
#define STATUS_REPORT_HPP

#include <cstddef>
#include <main/models/controller_status.hpp>

namespace StatusReport {
    const char* phaseName(LoopPhase phase);

    // Status document for the retained MQTT topic and GET /status.
    // Returns the mjson_snprintf result (length that would have been written).
    int toJson(const ControllerStatus& status, const char* device_id, char* out, std::size_t out_size);

    // Multi-line STATUS block at INFO level
    void log(const ControllerStatus& status);
}

#endif // STATUS_REPORT_HPP
