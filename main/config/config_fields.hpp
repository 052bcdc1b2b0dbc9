#ifndef CONFIG_FIELDS_HPP
#define CONFIG_FIELDS_HPP

#include <main/models/error_code.hpp>
#include <main/models/planting_config.hpp>

// Parsing and validation shared by every configuration source
namespace ConfigFields {
    ErrorCode parseCrop(const char* text, CropId& out_crop);
    ErrorCode parsePlantCount(const char* text, int32_t& out_count);
    // Finite and strictly positive
    ErrorCode parsePositive(const char* text, double& out_value);

    ErrorCode validate(const PlantingConfig& config);
}

#endif // CONFIG_FIELDS_HPP
