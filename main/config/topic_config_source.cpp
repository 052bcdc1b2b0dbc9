#include <main/config/topic_config_source.hpp>
#include <main/config/config_fields.hpp>
#include <main/control/day_clock.hpp>
#include <main/control/message_decoder.hpp>
#include <main/utils/logger.hpp>
#include <cstdio>
#include <cstring>

static const char* TAG = "TopicConfig";

namespace {
    struct FieldName {
        uint8_t bit;
        const char* name;
    };

    const FieldName kFieldNames[] = {
        { TopicConfigSource::FIELD_CROP,          "crop" },
        { TopicConfigSource::FIELD_PLANTING_DATE, "planting_date" },
        { TopicConfigSource::FIELD_PLANT_COUNT,   "plant_count" },
        { TopicConfigSource::FIELD_PLANT_SPACING, "plant_spacing" },
        { TopicConfigSource::FIELD_ROW_SPACING,   "row_spacing" },
        { TopicConfigSource::FIELD_PUMP_FLOW,     "pump_flow" },
    };
}

TopicConfigSource::TopicConfigSource()
    : pending{},
      received(0),
      delivered(false) {}

ErrorCode TopicConfigSource::apply(const InboundMessage& message) {
    ErrorCode err = ErrorCode::INVALID_CONFIG;
    uint8_t bit = 0;

    switch (message.kind) {
        case MessageKind::CONFIG_CROP:
            err = ConfigFields::parseCrop(message.payload, pending.crop);
            bit = FIELD_CROP;
            break;
        case MessageKind::CONFIG_PLANTING_DATE:
            err = DayClock::parseDate(message.payload, pending.planting_date);
            bit = FIELD_PLANTING_DATE;
            break;
        case MessageKind::CONFIG_PLANT_COUNT:
            err = ConfigFields::parsePlantCount(message.payload, pending.plant_count);
            bit = FIELD_PLANT_COUNT;
            break;
        case MessageKind::CONFIG_PLANT_SPACING:
            err = ConfigFields::parsePositive(message.payload, pending.plant_spacing_cm);
            bit = FIELD_PLANT_SPACING;
            break;
        case MessageKind::CONFIG_ROW_SPACING:
            err = ConfigFields::parsePositive(message.payload, pending.row_spacing_cm);
            bit = FIELD_ROW_SPACING;
            break;
        case MessageKind::CONFIG_PUMP_FLOW:
            err = ConfigFields::parsePositive(message.payload, pending.pump_flow_lph);
            bit = FIELD_PUMP_FLOW;
            break;
        case MessageKind::SOIL_READING:
        case MessageKind::UNKNOWN:
            return ErrorCode::OK;
    }

    if (err != ErrorCode::OK) {
        LOG_ERROR(TAG, "Rejected %s='%s' (%s)", MessageDecoder::kindName(message.kind),
                  message.payload, errorCodeName(err));
        return err;
    }
    received |= bit;
    LOG_INFO(TAG, "Received %s='%s'", MessageDecoder::kindName(message.kind), message.payload);
    return ErrorCode::OK;
}

void TopicConfigSource::onMessage(const InboundMessage& message) {
    (void)apply(message);
}

bool TopicConfigSource::poll(PlantingConfig& out_config) {
    if (delivered || !isComplete()) {
        return false;
    }
    out_config = pending;
    delivered = true;
    return true;
}

void TopicConfigSource::describeMissing(char* out, std::size_t out_size) const {
    if (out_size == 0) {
        return;
    }
    out[0] = '\0';
    std::size_t used = 0;
    for (const FieldName& field : kFieldNames) {
        if ((received & field.bit) != 0) {
            continue;
        }
        int n = std::snprintf(out + used, out_size - used, "%s%s", used == 0 ? "" : ",", field.name);
        if (n < 0 || static_cast<std::size_t>(n) >= out_size - used) {
            break;
        }
        used += static_cast<std::size_t>(n);
    }
}
