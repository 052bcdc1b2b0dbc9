#ifndef CONFIG_JSON_HPP
#define CONFIG_JSON_HPP

#include <cstddef>
#include <main/models/error_code.hpp>
#include <main/models/planting_config.hpp>

namespace ConfigJson {
    // Parses a POST /config body:
    //   {"crop":"onion","plant_date":"2024-05-01","ps":20,"rs":30,"plants":100,"flow":9}
    // "plants" and "flow" may be omitted when `current` is given; they then
    // keep the current values. On failure a short reason is written to `reason`.
    ErrorCode parse(const char* body, int length, const PlantingConfig* current,
                    PlantingConfig& out_config, char* reason, std::size_t reason_size);

    // Same keys as parse() accepts
    int format(const PlantingConfig& config, char* out, std::size_t out_size);
}

#endif // CONFIG_JSON_HPP
