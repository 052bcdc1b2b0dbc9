#ifndef WEATHER_PARSER_HPP
#define WEATHER_PARSER_HPP

#include <ctime>
#include <main/models/error_code.hpp>
#include <main/models/weather_sample.hpp>

namespace WeatherParser {
    // Fields read from an OpenWeatherMap "current weather" document
    struct Observation {
        double tmax_c;
        double humidity_pct;
        double cloud_pct;
        int    day_of_year;
        double daylight_hours;
    };

    // Missing fields fall back to documented defaults; `now` stands in for a
    // missing "dt". PARSE_ERROR only when the body is not a JSON object.
    ErrorCode parse(const char* body, int length, double latitude_deg, time_t now,
                    WeatherSample& out_sample, Observation* out_observation = nullptr);
}

#endif // WEATHER_PARSER_HPP
