#include "replication/progress.hpp"
#include "manual_clock.hpp"
#include "common/logger.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace std::chrono_literals;
using namespace zsend::replication;

// ── Fixture ───────────────────────────────────────────────────────────────────

class ProgressMeterTest : public ::testing::Test {
protected:
    void SetUp() override {
        zsend::init_default_logger(spdlog::level::warn);
        logger_ = spdlog::default_logger();
    }

    std::shared_ptr<spdlog::logger> logger_;
    ManualClock clock_;
};

// ── Counting ──────────────────────────────────────────────────────────────────

TEST_F(ProgressMeterTest, CountsBytes) {
    ProgressMeter meter("full:s1", 4096, logger_, clock_);
    meter.add(1000);
    meter.add(24);
    EXPECT_EQ(meter.bytes(), 1024u);
    EXPECT_EQ(meter.sample().bytes, 1024u);
}

TEST_F(ProgressMeterTest, ReportsAtMostOncePerInterval) {
    ProgressMeter meter("full:s1", 0, logger_, clock_, 2000ms);

    meter.add(10);
    meter.add(10);
    EXPECT_EQ(meter.reports(), 0u);

    clock_.advance(1999ms);
    meter.add(10);
    EXPECT_EQ(meter.reports(), 0u);

    clock_.advance(1ms);
    meter.add(10);
    EXPECT_EQ(meter.reports(), 1u);

    clock_.advance(500ms);
    meter.add(10);
    EXPECT_EQ(meter.reports(), 1u);

    clock_.advance(1500ms);
    meter.add(10);
    EXPECT_EQ(meter.reports(), 2u);
}

TEST_F(ProgressMeterTest, FinishAlwaysReports) {
    ProgressMeter meter("incremental:s1->s2", 100, logger_, clock_);
    meter.add(100);
    meter.finish();
    EXPECT_EQ(meter.reports(), 1u);
}

// ── Samples ───────────────────────────────────────────────────────────────────

TEST_F(ProgressMeterTest, RatePercentAndEta) {
    ProgressMeter meter("full:s1", 4000, logger_, clock_);
    meter.add(1000);
    clock_.advance(1000ms);

    const auto s = meter.sample();
    EXPECT_EQ(s.elapsed, 1000ms);
    EXPECT_DOUBLE_EQ(s.rate, 1000.0);
    ASSERT_TRUE(s.percent.has_value());
    EXPECT_DOUBLE_EQ(*s.percent, 25.0);
    ASSERT_TRUE(s.eta.has_value());
    EXPECT_EQ(*s.eta, 3s);
}

TEST_F(ProgressMeterTest, NoEstimateMeansNoPercent) {
    ProgressMeter meter("full:s1", 0, logger_, clock_);
    meter.add(500);
    clock_.advance(500ms);

    const auto s = meter.sample();
    EXPECT_FALSE(s.percent.has_value());
    EXPECT_FALSE(s.eta.has_value());
    EXPECT_DOUBLE_EQ(s.rate, 1000.0);
}

TEST_F(ProgressMeterTest, CountMayRunPastEstimate) {
    ProgressMeter meter("full:s1", 1000, logger_, clock_);
    meter.add(1500);
    clock_.advance(1s);

    const auto s = meter.sample();
    EXPECT_EQ(s.bytes, 1500u);
    ASSERT_TRUE(s.percent.has_value());
    EXPECT_DOUBLE_EQ(*s.percent, 150.0);
    ASSERT_TRUE(s.eta.has_value());
    EXPECT_EQ(*s.eta, 0s);
}

TEST_F(ProgressMeterTest, NoTimeElapsedMeansNoRate) {
    ProgressMeter meter("full:s1", 1000, logger_, clock_);
    meter.add(10);
    const auto s = meter.sample();
    EXPECT_DOUBLE_EQ(s.rate, 0.0);
    EXPECT_FALSE(s.eta.has_value());
}

// ── Formatting ────────────────────────────────────────────────────────────────

TEST(ProgressFormat, Bytes) {
    EXPECT_EQ(format_bytes(0), "0 B");
    EXPECT_EQ(format_bytes(1023), "1023 B");
    EXPECT_EQ(format_bytes(1024), "1.0 KiB");
    EXPECT_EQ(format_bytes(1536), "1.5 KiB");
    EXPECT_EQ(format_bytes(1024ull * 1024), "1.0 MiB");
    EXPECT_EQ(format_bytes(5ull * 1024 * 1024 * 1024), "5.0 GiB");
}

TEST(ProgressFormat, Duration) {
    EXPECT_EQ(format_duration(0s), "0:00");
    EXPECT_EQ(format_duration(125s), "2:05");
    EXPECT_EQ(format_duration(3725s), "1:02:05");
}
