#ifndef CONFIG_SOURCE_KIND_HPP
#define CONFIG_SOURCE_KIND_HPP

#include <cstdint>

// Where the planting configuration is read from at startup
enum class ConfigSourceKind : uint8_t {
    MQTT_TOPICS = 0,
    CONSOLE     = 1,
    HTTP        = 2
};

#endif // CONFIG_SOURCE_KIND_HPP
