#ifndef PLANTING_CONFIG_HPP
#define PLANTING_CONFIG_HPP

#include <cstdint>
#include <main/models/crop_profile.hpp>

struct PlantingDate {
    int year;
    int month; // 1..12
    int day;   // 1..31
};

// Nursery layout and pump; replaced as a whole, never edited field by field
struct PlantingConfig {
    CropId       crop;
    PlantingDate planting_date;
    int32_t      plant_count;
    double       plant_spacing_cm;
    double       row_spacing_cm;
    double       pump_flow_lph;

    double areaPerPlantM2() const {
        return (plant_spacing_cm / 100.0) * (row_spacing_cm / 100.0);
    }

    double totalAreaM2() const {
        return areaPerPlantM2() * static_cast<double>(plant_count);
    }
};

#endif // PLANTING_CONFIG_HPP
