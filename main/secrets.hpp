// Deployment credentials. Replace the placeholders locally and keep the
// filled-in copy out of version control.
#ifndef SECRETS_HPP
#define SECRETS_HPP

namespace Secrets {
    static constexpr const char* WIFI_SSID = "YOUR_WIFI_SSID";
    static constexpr const char* WIFI_PASSWORD = "YOUR_WIFI_PASSWORD";

    static constexpr const char* DEVICE_ID = "nursery-01";

    static constexpr const char* MQTT_HOST = "YOUR_BROKER.s1.eu.hivemq.cloud";
    static constexpr int MQTT_PORT = 8883;
    static constexpr const char* MQTT_USERNAME = "YOUR_MQTT_USER";
    static constexpr const char* MQTT_PASSWORD = "YOUR_MQTT_PASSWORD";

    static constexpr const char* WEATHER_API_KEY = "YOUR_OPENWEATHERMAP_KEY";
}

#endif // SECRETS_HPP
