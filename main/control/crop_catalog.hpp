#ifndef CROP_CATALOG_HPP
#define CROP_CATALOG_HPP

#include <main/models/crop_profile.hpp>

namespace CropCatalog {
    const CropProfile& profile(CropId id);

    // Case-insensitive; surrounding whitespace ignored. Returns nullptr for unknown crops.
    const CropProfile* findByName(const char* name);

    const char* name(CropId id);

    // Crop coefficient for the given day after planting
    double kcForDay(CropId id, int day);

    // Root-zone depth in millimetres for the given day after planting
    double rootZoneMmForDay(CropId id, int day);
}

#endif // CROP_CATALOG_HPP
