#include <gtest/gtest.h>
#include <cstdio>
#include <cstring>
#include <string>
#include <main/config/config.hpp>
#include <main/config/config_fields.hpp>
#include <main/config/console_config_source.hpp>
#include <main/config/topic_config_source.hpp>
#include <main/control/message_decoder.hpp>
#include "fakes.hpp"

namespace {
    InboundMessage message(const char* topic, const char* payload) {
        return MessageDecoder::decode(topic, reinterpret_cast<const uint8_t*>(payload),
                                      static_cast<int>(std::strlen(payload)));
    }

    std::string readAll(FILE* f) {
        std::string text;
        std::rewind(f);
        char buf[128];
        size_t n = 0;
        while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
            text.append(buf, n);
        }
        return text;
    }

    size_t occurrences(const std::string& haystack, const std::string& needle) {
        size_t count = 0;
        for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
            ++count;
        }
        return count;
    }
}

TEST(ConfigFields, ParsesCropNames) {
    CropId crop = CropId::ONION;
    EXPECT_EQ(ConfigFields::parseCrop("Maize", crop), ErrorCode::OK);
    EXPECT_EQ(crop, CropId::MAIZE);
    EXPECT_EQ(ConfigFields::parseCrop("rice", crop), ErrorCode::INVALID_CONFIG);
    EXPECT_EQ(crop, CropId::MAIZE);
}

TEST(ConfigFields, PlantCountMustBePositiveInteger) {
    int32_t count = 7;
    EXPECT_EQ(ConfigFields::parsePlantCount("120", count), ErrorCode::OK);
    EXPECT_EQ(count, 120);
    EXPECT_EQ(ConfigFields::parsePlantCount("0", count), ErrorCode::INVALID_CONFIG);
    EXPECT_EQ(ConfigFields::parsePlantCount("-4", count), ErrorCode::INVALID_CONFIG);
    EXPECT_EQ(ConfigFields::parsePlantCount("12.5", count), ErrorCode::INVALID_CONFIG);
    EXPECT_EQ(ConfigFields::parsePlantCount("many", count), ErrorCode::INVALID_CONFIG);
    EXPECT_EQ(ConfigFields::parsePlantCount("99999999999", count), ErrorCode::INVALID_CONFIG);
    EXPECT_EQ(count, 120);
}

TEST(ConfigFields, PositiveNumbers) {
    double value = 1.0;
    EXPECT_EQ(ConfigFields::parsePositive("22.5", value), ErrorCode::OK);
    EXPECT_DOUBLE_EQ(value, 22.5);
    EXPECT_EQ(ConfigFields::parsePositive("0", value), ErrorCode::INVALID_CONFIG);
    EXPECT_EQ(ConfigFields::parsePositive("-3", value), ErrorCode::INVALID_CONFIG);
    EXPECT_EQ(ConfigFields::parsePositive("inf", value), ErrorCode::INVALID_CONFIG);
    EXPECT_EQ(ConfigFields::parsePositive("", value), ErrorCode::INVALID_CONFIG);
    EXPECT_DOUBLE_EQ(value, 22.5);
}

TEST(ConfigFields, ValidateWholeConfig) {
    useUtc();
    PlantingConfig cfg = onionConfig();
    EXPECT_EQ(ConfigFields::validate(cfg), ErrorCode::OK);
    EXPECT_NEAR(cfg.totalAreaM2(), 6.0, 1e-9);

    PlantingConfig bad_date = cfg;
    bad_date.planting_date = PlantingDate{2023, 2, 30};
    EXPECT_EQ(ConfigFields::validate(bad_date), ErrorCode::INVALID_DATE);

    PlantingConfig no_flow = cfg;
    no_flow.pump_flow_lph = 0.0;
    EXPECT_EQ(ConfigFields::validate(no_flow), ErrorCode::INVALID_CONFIG);
}

TEST(TopicConfigSource, CompletesOnceAllSixFieldsArrive) {
    using namespace Config::Mqtt;
    useUtc();
    TopicConfigSource source;
    PlantingConfig cfg{};

    source.onMessage(message(Topics::CONFIG_CROP, "onion"));
    source.onMessage(message(Topics::CONFIG_PLANTING_DATE, "2024-01-01"));
    source.onMessage(message(Topics::CONFIG_PLANT_COUNT, "100"));
    EXPECT_FALSE(source.poll(cfg));

    char missing[96];
    source.describeMissing(missing, sizeof(missing));
    EXPECT_STREQ(missing, "plant_spacing,row_spacing,pump_flow");

    source.onMessage(message(Topics::CONFIG_PLANT_SPACING, "20"));
    source.onMessage(message(Topics::CONFIG_ROW_SPACING, "30"));
    source.onMessage(message(Topics::CONFIG_PUMP_FLOW, "9"));
    EXPECT_TRUE(source.isComplete());

    ASSERT_TRUE(source.poll(cfg));
    EXPECT_EQ(cfg.crop, CropId::ONION);
    EXPECT_EQ(cfg.planting_date.year, 2024);
    EXPECT_EQ(cfg.plant_count, 100);
    EXPECT_DOUBLE_EQ(cfg.plant_spacing_cm, 20.0);
    EXPECT_DOUBLE_EQ(cfg.row_spacing_cm, 30.0);
    EXPECT_DOUBLE_EQ(cfg.pump_flow_lph, 9.0);

    // Delivered exactly once
    EXPECT_FALSE(source.poll(cfg));
}

TEST(TopicConfigSource, InvalidValuesDoNotCount) {
    using namespace Config::Mqtt;
    TopicConfigSource source;
    EXPECT_EQ(source.apply(message(Topics::CONFIG_CROP, "cabbage")), ErrorCode::INVALID_CONFIG);
    EXPECT_EQ(source.apply(message(Topics::CONFIG_PLANTING_DATE, "2024-02-31")), ErrorCode::INVALID_DATE);
    EXPECT_EQ(source.apply(message(Topics::CONFIG_PLANT_COUNT, "0")), ErrorCode::INVALID_CONFIG);
    EXPECT_EQ(source.apply(message(Topics::CONFIG_PUMP_FLOW, "-2")), ErrorCode::INVALID_CONFIG);
    EXPECT_EQ(source.receivedFields(), 0u);

    // Later valid value for the same field is accepted
    EXPECT_EQ(source.apply(message(Topics::CONFIG_CROP, "MAIZE")), ErrorCode::OK);
    EXPECT_EQ(source.receivedFields(), static_cast<uint8_t>(TopicConfigSource::FIELD_CROP));
}

TEST(TopicConfigSource, SoilReadingsAreNotConfig) {
    TopicConfigSource source;
    EXPECT_EQ(source.apply(message(Config::Mqtt::Topics::SOIL_MOISTURE, "30")), ErrorCode::OK);
    EXPECT_EQ(source.receivedFields(), 0u);
}

TEST(ConsoleConfigSource, PromptsAndRepromptsOnInvalidInput) {
    useUtc();
    FILE* in = std::tmpfile();
    FILE* out = std::tmpfile();
    ASSERT_NE(in, nullptr);
    ASSERT_NE(out, nullptr);
    std::fputs("tomato\nonion\n2024 01 01\n100\n20\n30\n9\n", in);
    std::rewind(in);

    ConsoleConfigSource source(in, out);
    PlantingConfig cfg{};
    ASSERT_TRUE(source.poll(cfg));
    EXPECT_EQ(cfg.crop, CropId::ONION);
    EXPECT_EQ(cfg.planting_date.month, 1);
    EXPECT_EQ(cfg.plant_count, 100);
    EXPECT_DOUBLE_EQ(cfg.pump_flow_lph, 9.0);
    EXPECT_FALSE(source.poll(cfg));

    const std::string prompts = readAll(out);
    EXPECT_EQ(occurrences(prompts, "Enter planting configuration:"), 2u);
    EXPECT_EQ(occurrences(prompts, "Crop (onion/maize): "), 2u);
    EXPECT_EQ(occurrences(prompts, "Pump flow rate (Liters/Hour): "), 1u);

    std::fclose(in);
    std::fclose(out);
}

TEST(ConsoleConfigSource, WaitsForMoreInputWithoutBlocking) {
    useUtc();
    FILE* in = std::tmpfile();
    ASSERT_NE(in, nullptr);
    std::fputs("maize\n2024-03-10\n", in);
    std::rewind(in);

    ConsoleConfigSource source(in, nullptr);
    PlantingConfig cfg{};
    EXPECT_FALSE(source.poll(cfg));

    char missing[64];
    source.describeMissing(missing, sizeof(missing));
    EXPECT_STREQ(missing, "waiting for plant_count");

    const long pos = std::ftell(in);
    std::fseek(in, 0, SEEK_END);
    std::fputs("50\n25\n60\n12.5\n", in);
    std::fseek(in, pos, SEEK_SET);

    ASSERT_TRUE(source.poll(cfg));
    EXPECT_EQ(cfg.crop, CropId::MAIZE);
    EXPECT_EQ(cfg.plant_count, 50);
    EXPECT_DOUBLE_EQ(cfg.row_spacing_cm, 60.0);
    EXPECT_DOUBLE_EQ(cfg.pump_flow_lph, 12.5);
    std::fclose(in);
}
