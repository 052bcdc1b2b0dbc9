#ifndef WEATHER_SAMPLE_HPP
#define WEATHER_SAMPLE_HPP

// Model features in the order the ET0 network was trained on
struct WeatherSample {
    double tmax_c;
    double relative_humidity_pct;
    double solar_energy_mj_m2_day;
};

#endif // WEATHER_SAMPLE_HPP
