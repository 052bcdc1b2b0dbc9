#ifndef INBOUND_MESSAGE_HPP
#define INBOUND_MESSAGE_HPP

#include <cstdint>

enum class MessageKind : uint8_t {
    SOIL_READING = 0,
    CONFIG_CROP,
    CONFIG_PLANTING_DATE,
    CONFIG_PLANT_COUNT,
    CONFIG_PLANT_SPACING,
    CONFIG_ROW_SPACING,
    CONFIG_PUMP_FLOW,
    UNKNOWN
};

// Topic already resolved to a kind; payload trimmed and null-terminated
struct InboundMessage {
    MessageKind kind;
    char        payload[64];
};

#endif // INBOUND_MESSAGE_HPP
