#include <main/control/message_decoder.hpp>
#include <main/config/config.hpp>
#include <cctype>
#include <cstring>

namespace {
    struct TopicRoute {
        const char* topic;
        MessageKind kind;
    };

    const TopicRoute kRoutes[] = {
        { Config::Mqtt::Topics::SOIL_MOISTURE,        MessageKind::SOIL_READING },
        { Config::Mqtt::Topics::CONFIG_CROP,          MessageKind::CONFIG_CROP },
        { Config::Mqtt::Topics::CONFIG_PLANTING_DATE, MessageKind::CONFIG_PLANTING_DATE },
        { Config::Mqtt::Topics::CONFIG_PLANT_COUNT,   MessageKind::CONFIG_PLANT_COUNT },
        { Config::Mqtt::Topics::CONFIG_PLANT_SPACING, MessageKind::CONFIG_PLANT_SPACING },
        { Config::Mqtt::Topics::CONFIG_ROW_SPACING,   MessageKind::CONFIG_ROW_SPACING },
        { Config::Mqtt::Topics::CONFIG_PUMP_FLOW,     MessageKind::CONFIG_PUMP_FLOW },
    };
}

namespace MessageDecoder {
    InboundMessage decode(const char* topic, const uint8_t* payload, int length) {
        InboundMessage msg{};
        msg.kind = MessageKind::UNKNOWN;
        if (topic != nullptr) {
            for (const TopicRoute& route : kRoutes) {
                if (std::strcmp(topic, route.topic) == 0) {
                    msg.kind = route.kind;
                    break;
                }
            }
        }

        if (payload == nullptr || length <= 0) {
            msg.payload[0] = '\0';
            return msg;
        }
        int start = 0;
        int end = length;
        while (start < end && std::isspace(payload[start])) {
            ++start;
        }
        while (end > start && std::isspace(payload[end - 1])) {
            --end;
        }
        int copy_len = end - start;
        if (copy_len > static_cast<int>(sizeof(msg.payload)) - 1) {
            copy_len = static_cast<int>(sizeof(msg.payload)) - 1;
        }
        std::memcpy(msg.payload, payload + start, static_cast<size_t>(copy_len));
        msg.payload[copy_len] = '\0';
        return msg;
    }

    const char* kindName(MessageKind kind) {
        switch (kind) {
            case MessageKind::SOIL_READING:         return "soil_reading";
            case MessageKind::CONFIG_CROP:          return "crop";
            case MessageKind::CONFIG_PLANTING_DATE: return "planting_date";
            case MessageKind::CONFIG_PLANT_COUNT:   return "plant_count";
            case MessageKind::CONFIG_PLANT_SPACING: return "plant_spacing";
            case MessageKind::CONFIG_ROW_SPACING:   return "row_spacing";
            case MessageKind::CONFIG_PUMP_FLOW:     return "pump_flow";
            case MessageKind::UNKNOWN:              return "unknown";
        }
        return "unknown";
    }
}
