#ifndef CROP_PROFILE_HPP
#define CROP_PROFILE_HPP

#include <cstddef>
#include <cstdint>

enum class CropId : uint8_t {
    ONION = 0,
    MAIZE = 1
};

// One (day-after-planting, value) knot of a piecewise-linear curve
struct ControlPoint {
    int    day;
    double value;
};

// Build-time crop curves. Both sequences are non-empty and strictly
// increasing by day.
struct CropProfile {
    CropId              id;
    const char*         name;
    const ControlPoint* kc;
    std::size_t         kc_count;
    const ControlPoint* root_depth_m;
    std::size_t         root_depth_count;
};

#endif // CROP_PROFILE_HPP
