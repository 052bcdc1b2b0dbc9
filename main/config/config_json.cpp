#include <main/config/config_json.hpp>
#include <main/config/config_fields.hpp>
#include <main/control/crop_catalog.hpp>
#include <main/control/day_clock.hpp>
#include <mjson.h>
#include <cmath>
#include <cstdio>

namespace {
    ErrorCode fail(ErrorCode code, const char* message, char* reason, std::size_t reason_size) {
        if (reason != nullptr && reason_size > 0) {
            std::snprintf(reason, reason_size, "%s", message);
        }
        return code;
    }
}

namespace ConfigJson {
    ErrorCode parse(const char* body, int length, const PlantingConfig* current,
                    PlantingConfig& out_config, char* reason, std::size_t reason_size) {
        if (body == nullptr || length <= 0) {
            return fail(ErrorCode::PARSE_ERROR, "empty body", reason, reason_size);
        }

        PlantingConfig cfg{};
        if (current != nullptr) {
            cfg = *current;
        }

        char text[32];
        if (mjson_get_string(body, length, "$.crop", text, sizeof(text)) <= 0) {
            return fail(ErrorCode::INVALID_CONFIG, "missing crop", reason, reason_size);
        }
        if (ConfigFields::parseCrop(text, cfg.crop) != ErrorCode::OK) {
            return fail(ErrorCode::INVALID_CONFIG, "unknown crop", reason, reason_size);
        }

        if (mjson_get_string(body, length, "$.plant_date", text, sizeof(text)) <= 0) {
            return fail(ErrorCode::INVALID_CONFIG, "missing plant_date", reason, reason_size);
        }
        if (DayClock::parseDate(text, cfg.planting_date) != ErrorCode::OK) {
            return fail(ErrorCode::INVALID_DATE, "invalid plant_date", reason, reason_size);
        }

        double value = 0.0;
        if (mjson_get_number(body, length, "$.ps", &value) == 0) {
            return fail(ErrorCode::INVALID_CONFIG, "missing ps", reason, reason_size);
        }
        cfg.plant_spacing_cm = value;

        if (mjson_get_number(body, length, "$.rs", &value) == 0) {
            return fail(ErrorCode::INVALID_CONFIG, "missing rs", reason, reason_size);
        }
        cfg.row_spacing_cm = value;

        if (mjson_get_number(body, length, "$.plants", &value) != 0) {
            if (value != std::floor(value) || value <= 0.0 || value > 2147483647.0) {
                return fail(ErrorCode::INVALID_CONFIG, "plants must be a positive integer", reason, reason_size);
            }
            cfg.plant_count = static_cast<int32_t>(value);
        } else if (current == nullptr) {
            return fail(ErrorCode::INVALID_CONFIG, "missing plants", reason, reason_size);
        }

        if (mjson_get_number(body, length, "$.flow", &value) != 0) {
            cfg.pump_flow_lph = value;
        } else if (current == nullptr) {
            return fail(ErrorCode::INVALID_CONFIG, "missing flow", reason, reason_size);
        }

        if (ConfigFields::validate(cfg) != ErrorCode::OK) {
            return fail(ErrorCode::INVALID_CONFIG, "values must be positive", reason, reason_size);
        }
        out_config = cfg;
        return ErrorCode::OK;
    }

    int format(const PlantingConfig& config, char* out, std::size_t out_size) {
        char date[16];
        std::snprintf(date, sizeof(date), "%04d-%02d-%02d",
                      config.planting_date.year, config.planting_date.month, config.planting_date.day);
        return mjson_snprintf(out, out_size,
                              "{%Q:%Q,%Q:%Q,%Q:%g,%Q:%g,%Q:%d,%Q:%g}",
                              "crop", CropCatalog::name(config.crop),
                              "plant_date", date,
                              "ps", config.plant_spacing_cm,
                              "rs", config.row_spacing_cm,
                              "plants", static_cast<int>(config.plant_count),
                              "flow", config.pump_flow_lph);
    }
}
