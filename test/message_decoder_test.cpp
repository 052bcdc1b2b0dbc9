#include <gtest/gtest.h>
#include <cstring>
#include <string>
#include <main/config/config.hpp>
#include <main/control/message_decoder.hpp>

namespace {
    InboundMessage decodeText(const char* topic, const std::string& payload) {
        return MessageDecoder::decode(topic, reinterpret_cast<const uint8_t*>(payload.data()),
                                      static_cast<int>(payload.size()));
    }
}

TEST(MessageDecoder, RoutesKnownTopics) {
    using namespace Config::Mqtt;
    EXPECT_EQ(decodeText(Topics::SOIL_MOISTURE, "31").kind, MessageKind::SOIL_READING);
    EXPECT_EQ(decodeText(Topics::CONFIG_CROP, "onion").kind, MessageKind::CONFIG_CROP);
    EXPECT_EQ(decodeText(Topics::CONFIG_PLANTING_DATE, "2024-01-01").kind, MessageKind::CONFIG_PLANTING_DATE);
    EXPECT_EQ(decodeText(Topics::CONFIG_PLANT_COUNT, "100").kind, MessageKind::CONFIG_PLANT_COUNT);
    EXPECT_EQ(decodeText(Topics::CONFIG_PLANT_SPACING, "20").kind, MessageKind::CONFIG_PLANT_SPACING);
    EXPECT_EQ(decodeText(Topics::CONFIG_ROW_SPACING, "30").kind, MessageKind::CONFIG_ROW_SPACING);
    EXPECT_EQ(decodeText(Topics::CONFIG_PUMP_FLOW, "9").kind, MessageKind::CONFIG_PUMP_FLOW);
    EXPECT_EQ(decodeText("some/other/topic", "x").kind, MessageKind::UNKNOWN);
    EXPECT_EQ(decodeText(nullptr, "x").kind, MessageKind::UNKNOWN);
}

TEST(MessageDecoder, TrimsPayload) {
    InboundMessage msg = decodeText(Config::Mqtt::Topics::SOIL_MOISTURE, "  27.5\r\n");
    EXPECT_STREQ(msg.payload, "27.5");
}

TEST(MessageDecoder, TruncatesLongPayloads) {
    std::string longText(200, 'a');
    InboundMessage msg = decodeText(Config::Mqtt::Topics::CONFIG_CROP, longText);
    EXPECT_EQ(std::strlen(msg.payload), sizeof(msg.payload) - 1);
}

TEST(MessageDecoder, EmptyPayload) {
    InboundMessage msg = MessageDecoder::decode(Config::Mqtt::Topics::CONFIG_CROP, nullptr, 0);
    EXPECT_EQ(msg.kind, MessageKind::CONFIG_CROP);
    EXPECT_STREQ(msg.payload, "");
}

TEST(MessageDecoder, KindNames) {
    EXPECT_STREQ(MessageDecoder::kindName(MessageKind::CONFIG_PLANTING_DATE), "planting_date");
}
