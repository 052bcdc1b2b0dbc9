#ifndef WEATHER_CLIENT_HPP
#define WEATHER_CLIENT_HPP

#include <main/config/config.hpp>
#include <main/control/collaborators.hpp>

// OpenWeatherMap "current weather" over esp_http_client. One request at a
// time; the response body lands in a fixed buffer.
class WeatherClient : public WeatherSource {
public:
    WeatherClient();
    WeatherClient(double latitude_deg, double longitude_deg, const char* api_key);

    ErrorCode fetch(WeatherSample& out_sample) override;

private:
    double latitude_deg;
    double longitude_deg;
    char url[256];
    char body[Config::Weather::max_response_len + 1];
};

#endif // WEATHER_CLIENT_HPP
