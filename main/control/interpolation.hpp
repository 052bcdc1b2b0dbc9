#ifndef INTERPOLATION_HPP
#define INTERPOLATION_HPP

#include <cstddef>
#include <main/models/crop_profile.hpp>

namespace Interpolation {
    // Piecewise-linear lookup over day-sorted control points.
    // Days before the first point or after the last one clamp to that point's value.
    // points must be non-empty.
    double interpolate(int day, const ControlPoint* points, std::size_t count);

    template<std::size_t N>
    double interpolate(int day, const ControlPoint (&points)[N]) {
        return interpolate(day, points, N);
    }

    // Build-time check for profile tables
    constexpr bool isStrictlyIncreasing(const ControlPoint* points, std::size_t count) {
        if (count == 0) {
            return false;
        }
        for (std::size_t i = 1; i < count; ++i) {
            if (points[i].day <= points[i - 1].day) {
                return false;
            }
        }
        return true;
    }
}

#endif // INTERPOLATION_HPP
