#include <gtest/gtest.h>
#include <main/control/soil_sampler.hpp>

TEST(SoilSampler, IgnoresReadingsOutsideWindow) {
    SoilSampler sampler(5000, 0.0, 100.0);
    EXPECT_FALSE(sampler.isActive());
    EXPECT_EQ(sampler.offer("30"), ErrorCode::OK);
    EXPECT_EQ(sampler.sampleCount(), 0u);
}

TEST(SoilSampler, WindowClosesAtDeadline) {
    SoilSampler sampler(5000, 0.0, 100.0);
    sampler.begin(1000);
    EXPECT_TRUE(sampler.isWindowOpen(1000));
    EXPECT_TRUE(sampler.isWindowOpen(5999));
    EXPECT_FALSE(sampler.isWindowOpen(6000));
    (void)sampler.finish();
    EXPECT_FALSE(sampler.isWindowOpen(1500));
}

TEST(SoilSampler, AveragesValidReadingsOnly) {
    SoilSampler sampler(5000, 0.0, 100.0);
    sampler.begin(0);
    EXPECT_EQ(sampler.offer("25"), ErrorCode::OK);
    EXPECT_EQ(sampler.offer(" 30.5 "), ErrorCode::OK);
    EXPECT_EQ(sampler.offer("abc"), ErrorCode::PARSE_ERROR);
    EXPECT_EQ(sampler.offer("12x"), ErrorCode::PARSE_ERROR);
    EXPECT_EQ(sampler.offer("150"), ErrorCode::PARSE_ERROR);
    EXPECT_EQ(sampler.offer("-1"), ErrorCode::PARSE_ERROR);
    EXPECT_EQ(sampler.offer(""), ErrorCode::PARSE_ERROR);
    EXPECT_EQ(sampler.offer(nullptr), ErrorCode::PARSE_ERROR);
    EXPECT_EQ(sampler.offer("27.75"), ErrorCode::OK);

    SoilSampleSummary summary = sampler.finish();
    EXPECT_EQ(summary.count, 3u);
    EXPECT_NEAR(summary.mean_vwc_pct, (25.0 + 30.5 + 27.75) / 3.0, 1e-12);
    EXPECT_FALSE(sampler.isActive());
}

TEST(SoilSampler, EmptyWindowReportsNoSamples) {
    SoilSampler sampler(1000, 0.0, 100.0);
    sampler.begin(0);
    SoilSampleSummary summary = sampler.finish();
    EXPECT_EQ(summary.count, 0u);
}

TEST(SoilSampler, NewWindowStartsEmpty) {
    SoilSampler sampler(1000, 0.0, 100.0);
    sampler.begin(0);
    (void)sampler.offer("40");
    (void)sampler.finish();
    sampler.begin(86400000);
    EXPECT_EQ(sampler.sampleCount(), 0u);
    (void)sampler.offer("20");
    EXPECT_DOUBLE_EQ(sampler.finish().mean_vwc_pct, 20.0);
}

TEST(SoilSampler, FullBufferDropsExtraReadings) {
    SoilSampler sampler(1000, 0.0, 100.0);
    sampler.begin(0);
    for (std::size_t i = 0; i < SOIL_SAMPLER_CAPACITY; ++i) {
        ASSERT_EQ(sampler.offer("10"), ErrorCode::OK);
    }
    EXPECT_EQ(sampler.offer("90"), ErrorCode::OK);
    SoilSampleSummary summary = sampler.finish();
    EXPECT_EQ(summary.count, static_cast<std::size_t>(SOIL_SAMPLER_CAPACITY));
    EXPECT_DOUBLE_EQ(summary.mean_vwc_pct, 10.0);
}
