#ifndef TOPIC_CONFIG_SOURCE_HPP
#define TOPIC_CONFIG_SOURCE_HPP

#include <cstdint>
#include <main/control/collaborators.hpp>

// Collects the six User/Input/... topics into one PlantingConfig.
// A field counts as received only after it validated; later messages
// for the same field overwrite it.
class TopicConfigSource : public ConfigSource {
public:
    enum Field : uint8_t {
        FIELD_CROP          = 1U << 0,
        FIELD_PLANTING_DATE = 1U << 1,
        FIELD_PLANT_COUNT   = 1U << 2,
        FIELD_PLANT_SPACING = 1U << 3,
        FIELD_ROW_SPACING   = 1U << 4,
        FIELD_PUMP_FLOW     = 1U << 5,
        FIELD_ALL           = 0x3F
    };

    TopicConfigSource();

    const char* name() const override { return "mqtt-topics"; }
    void onMessage(const InboundMessage& message) override;
    bool poll(PlantingConfig& out_config) override;
    void describeMissing(char* out, std::size_t out_size) const override;

    ErrorCode apply(const InboundMessage& message);
    bool isComplete() const { return received == FIELD_ALL; }
    uint8_t receivedFields() const { return received; }

private:
    PlantingConfig pending;
    uint8_t received;
    bool delivered;
};

#endif // TOPIC_CONFIG_SOURCE_HPP
