#include <main/weather/solar.hpp>
#include <algorithm>
#include <cmath>

namespace {
    constexpr double kPi = 3.14159265358979323846;
    constexpr double kWhToMj = 0.0036;

    double radians(double degrees) {
        return degrees * kPi / 180.0;
    }
}

namespace Solar {
    double potentialDaylightHours(double latitude_deg, int day_of_year) {
        const int doy = std::max(1, std::min(day_of_year, 366));
        const double phi = radians(latitude_deg);
        const double declination = radians(-23.45) * std::cos(2.0 * kPi * (doy + 10) / 365.0);
        double cos_omega = -std::tan(phi) * std::tan(declination);
        cos_omega = std::max(-1.0, std::min(1.0, cos_omega));
        if (cos_omega >= 1.0) {
            return 0.0;
        }
        if (cos_omega <= -1.0) {
            return 24.0;
        }
        return (24.0 / kPi) * std::acos(cos_omega);
    }

    double estimateEnergyMj(double cloud_pct, double daylight_hours,
                            Config::Weather::SolarModel model, double clear_sky_wh_m2) {
        const double f = std::max(0.0, std::min(1.0, cloud_pct / 100.0));
        double energy_wh = clear_sky_wh_m2 * (1.0 - 0.75 * f * f * f) * daylight_hours;
        if (model == Config::Weather::SolarModel::DAYLIGHT_FRACTION) {
            energy_wh /= 12.0;
        }
        return std::round(energy_wh * kWhToMj * 100.0) / 100.0;
    }
}
