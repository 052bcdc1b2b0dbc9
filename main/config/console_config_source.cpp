#include <main/config/console_config_source.hpp>
#include <main/config/config_fields.hpp>
#include <main/control/day_clock.hpp>
#include <main/utils/logger.hpp>
#include <cstring>

static const char* TAG = "ConsoleConfig";

namespace {
    const char* promptText(uint8_t step) {
        switch (step) {
            case 0: return "  Crop (onion/maize): ";
            case 1: return "  Planting date (YYYY MM DD): ";
            case 2: return "  Number of plants: ";
            case 3: return "  Plant spacing (cm): ";
            case 4: return "  Row spacing (cm): ";
            case 5: return "  Pump flow rate (Liters/Hour): ";
            default: return "";
        }
    }

    const char* stepName(uint8_t step) {
        switch (step) {
            case 0: return "crop";
            case 1: return "planting_date";
            case 2: return "plant_count";
            case 3: return "plant_spacing";
            case 4: return "row_spacing";
            case 5: return "pump_flow";
            default: return "";
        }
    }
}

ConsoleConfigSource::ConsoleConfigSource(FILE* in, FILE* out)
    : in(in),
      out(out),
      step(Step::CROP),
      prompted(false),
      delivered(false),
      pending{},
      line{} {}

void ConsoleConfigSource::prompt() {
    if (out == nullptr) {
        return;
    }
    if (step == Step::CROP) {
        std::fputs("Enter planting configuration:\n", out);
    }
    std::fputs(promptText(static_cast<uint8_t>(step)), out);
    std::fflush(out);
}

bool ConsoleConfigSource::acceptLine(const char* text) {
    ErrorCode err = ErrorCode::INVALID_CONFIG;
    switch (step) {
        case Step::CROP:          err = ConfigFields::parseCrop(text, pending.crop); break;
        case Step::PLANTING_DATE: err = DayClock::parseDate(text, pending.planting_date); break;
        case Step::PLANT_COUNT:   err = ConfigFields::parsePlantCount(text, pending.plant_count); break;
        case Step::PLANT_SPACING: err = ConfigFields::parsePositive(text, pending.plant_spacing_cm); break;
        case Step::ROW_SPACING:   err = ConfigFields::parsePositive(text, pending.row_spacing_cm); break;
        case Step::PUMP_FLOW:     err = ConfigFields::parsePositive(text, pending.pump_flow_lph); break;
        case Step::DONE:          return true;
    }
    if (err != ErrorCode::OK) {
        LOG_ERROR(TAG, "Invalid %s '%s' (%s)", stepName(static_cast<uint8_t>(step)), text, errorCodeName(err));
        return false;
    }
    return true;
}

bool ConsoleConfigSource::poll(PlantingConfig& out_config) {
    if (delivered || in == nullptr) {
        return false;
    }
    while (step != Step::DONE) {
        if (!prompted) {
            prompt();
            prompted = true;
        }
        if (std::fgets(line, sizeof(line), in) == nullptr) {
            std::clearerr(in);
            return false;
        }
        line[std::strcspn(line, "\r\n")] = '\0';
        if (acceptLine(line)) {
            step = static_cast<Step>(static_cast<uint8_t>(step) + 1U);
        }
        prompted = false;
    }
    out_config = pending;
    delivered = true;
    LOG_INFO(TAG, "%s", "Configuration entered on console");
    return true;
}

void ConsoleConfigSource::describeMissing(char* out_text, std::size_t out_size) const {
    if (out_size == 0) {
        return;
    }
    if (step == Step::DONE) {
        out_text[0] = '\0';
        return;
    }
    std::snprintf(out_text, out_size, "waiting for %s", stepName(static_cast<uint8_t>(step)));
}
