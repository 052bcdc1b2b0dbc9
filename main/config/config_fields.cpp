#include <main/config/config_fields.hpp>
#include <main/control/crop_catalog.hpp>
#include <main/control/day_clock.hpp>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>

namespace {
    bool onlyTrailingSpace(const char* end) {
        while (*end != '\0') {
            if (!std::isspace(static_cast<unsigned char>(*end))) {
                return false;
            }
            ++end;
        }
        return true;
    }
}

namespace ConfigFields {
    ErrorCode parseCrop(const char* text, CropId& out_crop) {
        const CropProfile* profile = CropCatalog::findByName(text);
        if (profile == nullptr) {
            return ErrorCode::INVALID_CONFIG;
        }
        out_crop = profile->id;
        return ErrorCode::OK;
    }

    ErrorCode parsePlantCount(const char* text, int32_t& out_count) {
        if (text == nullptr) {
            return ErrorCode::INVALID_CONFIG;
        }
        char* end = nullptr;
        errno = 0;
        long value = std::strtol(text, &end, 10);
        if (end == text || errno == ERANGE || !onlyTrailingSpace(end)) {
            return ErrorCode::INVALID_CONFIG;
        }
        if (value <= 0 || value > INT32_MAX) {
            return ErrorCode::INVALID_CONFIG;
        }
        out_count = static_cast<int32_t>(value);
        return ErrorCode::OK;
    }

    ErrorCode parsePositive(const char* text, double& out_value) {
        if (text == nullptr) {
            return ErrorCode::INVALID_CONFIG;
        }
        char* end = nullptr;
        double value = std::strtod(text, &end);
        if (end == text || !onlyTrailingSpace(end) || !std::isfinite(value) || value <= 0.0) {
            return ErrorCode::INVALID_CONFIG;
        }
        out_value = value;
        return ErrorCode::OK;
    }

    ErrorCode validate(const PlantingConfig& config) {
        if (config.crop != CropId::ONION && config.crop != CropId::MAIZE) {
            return ErrorCode::INVALID_CONFIG;
        }
        if (DayClock::validateDate(config.planting_date) != ErrorCode::OK) {
            return ErrorCode::INVALID_DATE;
        }
        if (config.plant_count <= 0) {
            return ErrorCode::INVALID_CONFIG;
        }
        if (!(config.plant_spacing_cm > 0.0) || !(config.row_spacing_cm > 0.0) || !(config.pump_flow_lph > 0.0)) {
            return ErrorCode::INVALID_CONFIG;
        }
        if (!std::isfinite(config.plant_spacing_cm) || !std::isfinite(config.row_spacing_cm) ||
            !std::isfinite(config.pump_flow_lph)) {
            return ErrorCode::INVALID_CONFIG;
        }
        return ErrorCode::OK;
    }
}
