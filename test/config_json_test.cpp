#include <gtest/gtest.h>
#include <cstring>
#include <string>
#include <main/config/config_json.hpp>
#include "fakes.hpp"

namespace {
    ErrorCode parseBody(const std::string& body, const PlantingConfig* current, PlantingConfig& out, char* reason) {
        return ConfigJson::parse(body.c_str(), static_cast<int>(body.size()), current, out, reason, 64);
    }
}

class ConfigJsonTest : public ::testing::Test {
protected:
    void SetUp() override { useUtc(); }
    char reason[64] = {0};
    PlantingConfig out{};
};

TEST_F(ConfigJsonTest, ParsesCompleteBody) {
    ASSERT_EQ(parseBody(R"({"crop":"maize","plant_date":"2024-05-01","ps":25,"rs":60,"plants":40,"flow":12.5})",
                        nullptr, out, reason), ErrorCode::OK);
    EXPECT_EQ(out.crop, CropId::MAIZE);
    EXPECT_EQ(out.planting_date.year, 2024);
    EXPECT_EQ(out.planting_date.month, 5);
    EXPECT_EQ(out.planting_date.day, 1);
    EXPECT_DOUBLE_EQ(out.plant_spacing_cm, 25.0);
    EXPECT_DOUBLE_EQ(out.row_spacing_cm, 60.0);
    EXPECT_EQ(out.plant_count, 40);
    EXPECT_DOUBLE_EQ(out.pump_flow_lph, 12.5);
}

TEST_F(ConfigJsonTest, PlantsAndFlowFallBackToCurrentConfig) {
    const PlantingConfig current = onionConfig(9.0);
    ASSERT_EQ(parseBody(R"({"crop":"onion","plant_date":"2024-02-01","ps":10,"rs":15})",
                        &current, out, reason), ErrorCode::OK);
    EXPECT_EQ(out.plant_count, current.plant_count);
    EXPECT_DOUBLE_EQ(out.pump_flow_lph, 9.0);
    EXPECT_DOUBLE_EQ(out.plant_spacing_cm, 10.0);
    EXPECT_EQ(out.planting_date.month, 2);
}

TEST_F(ConfigJsonTest, PlantsAndFlowRequiredWithoutCurrentConfig) {
    EXPECT_EQ(parseBody(R"({"crop":"onion","plant_date":"2024-02-01","ps":10,"rs":15,"flow":3})",
                        nullptr, out, reason), ErrorCode::INVALID_CONFIG);
    EXPECT_STREQ(reason, "missing plants");
    EXPECT_EQ(parseBody(R"({"crop":"onion","plant_date":"2024-02-01","ps":10,"rs":15,"plants":3})",
                        nullptr, out, reason), ErrorCode::INVALID_CONFIG);
    EXPECT_STREQ(reason, "missing flow");
}

TEST_F(ConfigJsonTest, RejectsBadValues) {
    EXPECT_EQ(parseBody(R"({"crop":"rice","plant_date":"2024-02-01","ps":10,"rs":15,"plants":3,"flow":2})",
                        nullptr, out, reason), ErrorCode::INVALID_CONFIG);
    EXPECT_STREQ(reason, "unknown crop");

    EXPECT_EQ(parseBody(R"({"crop":"onion","plant_date":"2024-02-30","ps":10,"rs":15,"plants":3,"flow":2})",
                        nullptr, out, reason), ErrorCode::INVALID_DATE);

    EXPECT_EQ(parseBody(R"({"crop":"onion","plant_date":"2024-02-01","ps":-10,"rs":15,"plants":3,"flow":2})",
                        nullptr, out, reason), ErrorCode::INVALID_CONFIG);

    EXPECT_EQ(parseBody(R"({"crop":"onion","plant_date":"2024-02-01","ps":10,"rs":15,"plants":2.5,"flow":2})",
                        nullptr, out, reason), ErrorCode::INVALID_CONFIG);
    EXPECT_STREQ(reason, "plants must be a positive integer");

    EXPECT_EQ(parseBody(R"({"plant_date":"2024-02-01"})", nullptr, out, reason), ErrorCode::INVALID_CONFIG);
    EXPECT_STREQ(reason, "missing crop");
}

TEST_F(ConfigJsonTest, EmptyBodyIsAParseError) {
    EXPECT_EQ(ConfigJson::parse("", 0, nullptr, out, reason, sizeof(reason)), ErrorCode::PARSE_ERROR);
    EXPECT_EQ(ConfigJson::parse(nullptr, 10, nullptr, out, reason, sizeof(reason)), ErrorCode::PARSE_ERROR);
}

TEST_F(ConfigJsonTest, FormattedConfigIsAcceptedBack) {
    const PlantingConfig cfg = onionConfig(9.0);
    char json[192];
    int n = ConfigJson::format(cfg, json, sizeof(json));
    ASSERT_GT(n, 0);
    ASSERT_LT(static_cast<size_t>(n), sizeof(json));
    EXPECT_NE(std::strstr(json, "\"plant_date\":\"2024-01-01\""), nullptr);

    ASSERT_EQ(ConfigJson::parse(json, n, nullptr, out, reason, sizeof(reason)), ErrorCode::OK);
    EXPECT_EQ(out.crop, cfg.crop);
    EXPECT_EQ(out.plant_count, cfg.plant_count);
    EXPECT_DOUBLE_EQ(out.pump_flow_lph, cfg.pump_flow_lph);
}
