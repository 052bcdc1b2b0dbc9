#include <main/weather/weather_parser.hpp>
#include <main/config/config.hpp>
#include <main/weather/solar.hpp>
#include <main/utils/logger.hpp>
#include <mjson.h>
#include <algorithm>

static const char* TAG = "WeatherParser";

namespace WeatherParser {
    ErrorCode parse(const char* body, int length, double latitude_deg, time_t now,
                    WeatherSample& out_sample, Observation* out_observation) {
        if (body == nullptr || length <= 0) {
            return ErrorCode::PARSE_ERROR;
        }
        const char* object = nullptr;
        int object_len = 0;
        if (mjson_find(body, length, "$", &object, &object_len) != MJSON_TOK_OBJECT) {
            LOG_ERROR(TAG, "Weather response is not a JSON object (%d bytes)", length);
            return ErrorCode::PARSE_ERROR;
        }

        Observation obs{};
        double temp = Config::Weather::default_temp_c;
        (void)mjson_get_number(body, length, "$.main.temp", &temp);
        obs.tmax_c = temp;
        (void)mjson_get_number(body, length, "$.main.temp_max", &obs.tmax_c);

        obs.humidity_pct = Config::Weather::default_humidity_pct;
        (void)mjson_get_number(body, length, "$.main.humidity", &obs.humidity_pct);

        obs.cloud_pct = Config::Weather::default_cloud_pct;
        (void)mjson_get_number(body, length, "$.clouds.all", &obs.cloud_pct);

        double dt = static_cast<double>(now);
        (void)mjson_get_number(body, length, "$.dt", &dt);
        time_t stamp = static_cast<time_t>(dt);
        struct tm tm_utc;
        if (gmtime_r(&stamp, &tm_utc) != nullptr) {
            obs.day_of_year = std::max(1, std::min(tm_utc.tm_yday + 1, 366));
        } else {
            LOG_WARN(TAG, "Bad timestamp %.0f, using day %d", dt, Config::Weather::default_day_of_year);
            obs.day_of_year = Config::Weather::default_day_of_year;
        }

        obs.daylight_hours = Solar::potentialDaylightHours(latitude_deg, obs.day_of_year);

        out_sample.tmax_c = obs.tmax_c;
        out_sample.relative_humidity_pct = obs.humidity_pct;
        out_sample.solar_energy_mj_m2_day = Solar::estimateEnergyMj(obs.cloud_pct, obs.daylight_hours);
        LOG_DEBUG(TAG, "Parsed Tmax=%.1f RH=%.0f clouds=%.0f DOY=%d N=%.2fh E=%.2fMJ",
                  obs.tmax_c, obs.humidity_pct, obs.cloud_pct, obs.day_of_year,
                  obs.daylight_hours, out_sample.solar_energy_mj_m2_day);
        if (out_observation != nullptr) {
            *out_observation = obs;
        }
        return ErrorCode::OK;
    }
}
