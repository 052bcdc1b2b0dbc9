#ifndef DAILY_STATE_HPP
#define DAILY_STATE_HPP

#include <cstdint>
#include <main/models/weather_sample.hpp>

// Values derived once per calendar-day rollover (Kc/root zone also on reconfiguration)
struct DailyState {
    int32_t       day_index = 0;
    double        kc_today = 0.0;
    double        root_zone_mm = 0.0;
    bool          has_mean_vwc = false;
    double        mean_vwc = 0.0;        // survives days without samples
    bool          has_weather = false;
    WeatherSample last_weather {};       // survives fetch failures
    double        last_et0 = 0.0;        // survives fetch/inference failures, always >= 0
    double        available_water_mm = 0.0;
    double        etc_mm = 0.0;
    double        pump_duration_s = 0.0;
    char          last_date_processed[11] = {0}; // YYYY-MM-DD, empty before first rollover
};

struct PumpState {
    bool     running = false;
    uint64_t start_ms = 0;          // monotonic
    double   target_duration_s = 0.0;
};

#endif // DAILY_STATE_HPP
