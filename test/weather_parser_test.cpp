#include <gtest/gtest.h>
#include <string>
#include <main/config/config.hpp>
#include <main/weather/solar.hpp>
#include <main/weather/weather_parser.hpp>
#include "fakes.hpp"

namespace {
    ErrorCode parseText(const std::string& body, time_t now, WeatherSample& sample, WeatherParser::Observation* obs) {
        return WeatherParser::parse(body.c_str(), static_cast<int>(body.size()), Config::Weather::latitude,
                                    now, sample, obs);
    }
}

TEST(Solar, DaylightAtEquatorIsTwelveHours) {
    EXPECT_NEAR(Solar::potentialDaylightHours(0.0, 80), 12.0, 1e-9);
    EXPECT_NEAR(Solar::potentialDaylightHours(0.0, 260), 12.0, 1e-9);
}

TEST(Solar, PolarDayAndNight) {
    EXPECT_DOUBLE_EQ(Solar::potentialDaylightHours(80.0, 172), 24.0);
    EXPECT_DOUBLE_EQ(Solar::potentialDaylightHours(80.0, 355), 0.0);
    // Out of range days are clamped rather than rejected
    EXPECT_DOUBLE_EQ(Solar::potentialDaylightHours(80.0, 900), Solar::potentialDaylightHours(80.0, 366));
}

TEST(Solar, NorthernSummerDaysAreLonger) {
    const double lat = Config::Weather::latitude;
    EXPECT_GT(Solar::potentialDaylightHours(lat, 172), 12.0);
    EXPECT_LT(Solar::potentialDaylightHours(lat, 355), 12.0);
}

TEST(Solar, EnergyFromCloudCover) {
    using Model = Config::Weather::SolarModel;
    EXPECT_DOUBLE_EQ(Solar::estimateEnergyMj(0.0, 12.0, Model::DAYLIGHT_HOURS, 990.0), 42.77);
    EXPECT_DOUBLE_EQ(Solar::estimateEnergyMj(100.0, 12.0, Model::DAYLIGHT_HOURS, 990.0), 10.69);
    EXPECT_DOUBLE_EQ(Solar::estimateEnergyMj(0.0, 12.0, Model::DAYLIGHT_FRACTION, 990.0), 3.56);
    // Cloud cover outside 0..100 is clamped
    EXPECT_DOUBLE_EQ(Solar::estimateEnergyMj(250.0, 12.0, Model::DAYLIGHT_HOURS, 990.0), 10.69);
    EXPECT_DOUBLE_EQ(Solar::estimateEnergyMj(-5.0, 12.0, Model::DAYLIGHT_HOURS, 990.0), 42.77);
}

TEST(WeatherParser, ReadsCurrentWeatherDocument) {
    const std::string body =
        R"({"coord":{"lon":77.56,"lat":13.02},"main":{"temp":27.1,"temp_max":29.5,"humidity":64},)"
        R"("clouds":{"all":40},"dt":1717243200,"name":"Bengaluru"})";
    WeatherSample sample{};
    WeatherParser::Observation obs{};
    ASSERT_EQ(parseText(body, 0, sample, &obs), ErrorCode::OK);

    EXPECT_DOUBLE_EQ(sample.tmax_c, 29.5);
    EXPECT_DOUBLE_EQ(sample.relative_humidity_pct, 64.0);
    EXPECT_DOUBLE_EQ(obs.cloud_pct, 40.0);
    EXPECT_EQ(obs.day_of_year, 153);
    EXPECT_GT(obs.daylight_hours, 12.0);
    EXPECT_LT(obs.daylight_hours, 13.5);
    EXPECT_DOUBLE_EQ(sample.solar_energy_mj_m2_day, Solar::estimateEnergyMj(40.0, obs.daylight_hours));
}

TEST(WeatherParser, MissingFieldsUseDefaults) {
    WeatherSample sample{};
    WeatherParser::Observation obs{};
    ASSERT_EQ(parseText(R"({"main":{"temp":31.0}})", kJune1st2024, sample, &obs), ErrorCode::OK);
    EXPECT_DOUBLE_EQ(sample.tmax_c, 31.0);
    EXPECT_DOUBLE_EQ(sample.relative_humidity_pct, Config::Weather::default_humidity_pct);
    EXPECT_DOUBLE_EQ(obs.cloud_pct, Config::Weather::default_cloud_pct);
    EXPECT_EQ(obs.day_of_year, 153);

    ASSERT_EQ(parseText("{}", kJune1st2024, sample, &obs), ErrorCode::OK);
    EXPECT_DOUBLE_EQ(sample.tmax_c, Config::Weather::default_temp_c);
}

TEST(WeatherParser, RejectsNonObjects) {
    WeatherSample sample{1.0, 2.0, 3.0};
    EXPECT_EQ(parseText("not json at all", 0, sample, nullptr), ErrorCode::PARSE_ERROR);
    EXPECT_EQ(parseText("[1,2,3]", 0, sample, nullptr), ErrorCode::PARSE_ERROR);
    EXPECT_EQ(WeatherParser::parse(nullptr, 0, 0.0, 0, sample, nullptr), ErrorCode::PARSE_ERROR);
    EXPECT_DOUBLE_EQ(sample.tmax_c, 1.0);
}
