#ifndef SOLAR_HPP
#define SOLAR_HPP

#include <main/config/config.hpp>

namespace Solar {
    // Potential daylight hours from the declination angle. day_of_year is
    // clamped to 1..366; polar night yields 0 h and polar day 24 h.
    double potentialDaylightHours(double latitude_deg, int day_of_year);

    // Daily solar energy (MJ/m2/day, rounded to 2 decimals) estimated from
    // cloud cover. cloud_pct is clamped to 0..100.
    double estimateEnergyMj(double cloud_pct, double daylight_hours,
                            Config::Weather::SolarModel model = Config::Weather::solar_model,
                            double clear_sky_wh_m2 = Config::Weather::clear_sky_wh_m2);
}

#endif // SOLAR_HPP
