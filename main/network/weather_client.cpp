#include <main/network/weather_client.hpp>
#include <main/weather/weather_parser.hpp>
#include <main/utils/logger.hpp>
#include <esp_http_client.h>
#include <ctime>
#include <cstdio>

static const char* TAG = "WeatherClient";

WeatherClient::WeatherClient()
    : WeatherClient(Config::Weather::latitude, Config::Weather::longitude, Config::Weather::api_key) {}

WeatherClient::WeatherClient(double latitude_deg, double longitude_deg, const char* api_key)
    : latitude_deg(latitude_deg),
      longitude_deg(longitude_deg),
      url{},
      body{} {
    std::snprintf(url, sizeof(url), Config::Weather::url_template, latitude_deg, longitude_deg, api_key);
}

ErrorCode WeatherClient::fetch(WeatherSample& out_sample) {
    esp_http_client_config_t cfg = {};
    cfg.url = url;
    cfg.method = HTTP_METHOD_GET;
    cfg.timeout_ms = Config::Weather::timeout_ms;

    esp_http_client_handle_t client = esp_http_client_init(&cfg);
    if (client == nullptr) {
        LOG_ERROR(TAG, "%s", "esp_http_client_init failed");
        return ErrorCode::TRANSPORT_ERROR;
    }

    LOG_INFO(TAG, "GET weather for %.4f,%.4f", latitude_deg, longitude_deg);
    esp_err_t err = esp_http_client_open(client, 0);
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "HTTP open failed: %s", esp_err_to_name(err));
        (void)esp_http_client_cleanup(client);
        return ErrorCode::TRANSPORT_ERROR;
    }

    (void)esp_http_client_fetch_headers(client);
    const int status = esp_http_client_get_status_code(client);

    int total = 0;
    while (total < static_cast<int>(sizeof(body)) - 1) {
        int n = esp_http_client_read(client, body + total, static_cast<int>(sizeof(body)) - 1 - total);
        if (n < 0) {
            LOG_ERROR(TAG, "HTTP read failed after %d bytes", total);
            (void)esp_http_client_close(client);
            (void)esp_http_client_cleanup(client);
            return ErrorCode::TRANSPORT_ERROR;
        }
        if (n == 0) {
            break;
        }
        total += n;
    }
    body[total] = '\0';
    (void)esp_http_client_close(client);
    (void)esp_http_client_cleanup(client);

    if (status != 200) {
        LOG_ERROR(TAG, "Weather API status %d: %.120s", status, body);
        return ErrorCode::TRANSPORT_ERROR;
    }

    WeatherParser::Observation obs{};
    ErrorCode parse_err = WeatherParser::parse(body, total, latitude_deg, time(nullptr), out_sample, &obs);
    if (parse_err != ErrorCode::OK) {
        return parse_err;
    }
    LOG_INFO(TAG, "Weather parsed: Tmax=%.1f RH=%.0f clouds=%.0f DOY=%d N=%.2fh E=%.2f MJ/m2/day",
             obs.tmax_c, obs.humidity_pct, obs.cloud_pct, obs.day_of_year, obs.daylight_hours,
             out_sample.solar_energy_mj_m2_day);
    return ErrorCode::OK;
}
