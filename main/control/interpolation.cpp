#include <main/control/interpolation.hpp>

namespace Interpolation {
    double interpolate(int day, const ControlPoint* points, std::size_t count) {
        const ControlPoint& first = points[0];
        const ControlPoint& last = points[count - 1];
        if (day <= first.day) {
            return first.value;
        }
        if (day >= last.day) {
            return last.value;
        }
        for (std::size_t i = 0; i + 1 < count; ++i) {
            const ControlPoint& p0 = points[i];
            const ControlPoint& p1 = points[i + 1];
            if (p0.day <= day && day <= p1.day) {
                if (p1.day == p0.day) {
                    return p0.value;
                }
                return p0.value + (p1.value - p0.value) *
                       static_cast<double>(day - p0.day) / static_cast<double>(p1.day - p0.day);
            }
        }
        // Unreachable for sorted tables
        return last.value;
    }
}
