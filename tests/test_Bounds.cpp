/*
 * MicrogridControl — Bounds merger tests
 * (c) 2025 MicrogridControl contributors
 */
#include <limits>

#include <gtest/gtest.h>

#include "fakes/ManualTimeSource.hpp"
#include "include/Bounds.hpp"
#include "include/ControlError.hpp"

namespace mgc {
namespace {

using fakes::ManualTimeSource;
using std::chrono::seconds;

TEST(MergeBounds, MergesOverlappingIntervals) {
    const auto out = mergeBounds({{0, 10}, {20, 30}, {5, 15}});
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0], (Bound{0, 15}));
    EXPECT_EQ(out[1], (Bound{20, 30}));
}

TEST(MergeBounds, TouchingIntervalsMerge) {
    const auto out = mergeBounds({{10, 20}, {0, 10}});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], (Bound{0, 20}));
}

TEST(MergeBounds, ContainedAndPointIntervals) {
    const auto out = mergeBounds({{0, 100}, {10, 20}, {150, 150}});
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0], (Bound{0, 100}));
    EXPECT_EQ(out[1], (Bound{150, 150}));
}

TEST(MergeBounds, OutputIsSortedAndDisjoint) {
    const auto out = mergeBounds({{50, 60}, {-10, -5}, {0, 1}, {55, 70}, {-6, 0}});
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0], (Bound{-10, 1}));
    EXPECT_EQ(out[1], (Bound{50, 70}));
}

class BoundsMergerTest : public ::testing::Test {
protected:
    ManualTimeSource clock;
    BoundsMerger     merger{clock};
};

TEST_F(BoundsMergerTest, MergesAcrossCalls) {
    merger.addBounds(1, Metric::AcActivePower, {{0, 10}, {20, 30}});
    merger.addBounds(1, Metric::AcActivePower, {{5, 15}});

    const auto active = merger.activeBounds(1, Metric::AcActivePower);
    ASSERT_EQ(active.size(), 2u);
    EXPECT_EQ(active[0], (Bound{0, 15}));
    EXPECT_EQ(active[1], (Bound{20, 30}));
}

TEST_F(BoundsMergerTest, ExpiresAtValidityDuration) {
    const TimePoint t0 = clock.now();
    const TimePoint exp = merger.addBounds(1, Metric::DcVoltage, {{700, 800}}, ValidityDuration::OneMinute);
    EXPECT_EQ(exp, t0 + seconds(60));

    clock.advance(seconds(59));
    EXPECT_TRUE(merger.validate(1, Metric::DcVoltage, 750));

    clock.advance(seconds(1));
    EXPECT_FALSE(merger.validate(1, Metric::DcVoltage, 750));
    EXPECT_TRUE(merger.activeBounds(1, Metric::DcVoltage).empty());
}

TEST_F(BoundsMergerTest, UnspecifiedValidityIsFiveSeconds) {
    const TimePoint t0 = clock.now();
    EXPECT_EQ(merger.addBounds(1, Metric::AcCurrent, {{0, 16}}), t0 + seconds(5));
}

TEST_F(BoundsMergerTest, AddRefreshesSharedExpiry) {
    merger.addBounds(1, Metric::AcVoltage, {{220, 240}}, ValidityDuration::FiveSeconds);
    clock.advance(seconds(4));
    const TimePoint exp = merger.addBounds(1, Metric::AcVoltage, {{100, 120}}, ValidityDuration::FiveSeconds);

    EXPECT_EQ(merger.expiry(1, Metric::AcVoltage), exp);
    clock.advance(seconds(4));
    // Older interval lives as long as the newest addition.
    EXPECT_TRUE(merger.validate(1, Metric::AcVoltage, 230));
    EXPECT_TRUE(merger.validate(1, Metric::AcVoltage, 110));
}

TEST_F(BoundsMergerTest, ExpiredSetIsReplacedNotMerged) {
    merger.addBounds(1, Metric::Temperature, {{0, 50}});
    clock.advance(seconds(10));
    merger.addBounds(1, Metric::Temperature, {{60, 70}});

    const auto active = merger.activeBounds(1, Metric::Temperature);
    ASSERT_EQ(active.size(), 1u);
    EXPECT_EQ(active[0], (Bound{60, 70}));
}

TEST_F(BoundsMergerTest, EmptyInputIsNoop) {
    const TimePoint t0 = clock.now();
    EXPECT_EQ(merger.addBounds(1, Metric::DcCurrent, {}), t0);
    EXPECT_FALSE(merger.expiry(1, Metric::DcCurrent).has_value());

    const TimePoint exp = merger.addBounds(1, Metric::DcCurrent, {{-5, 5}});
    clock.advance(seconds(2));
    EXPECT_EQ(merger.addBounds(1, Metric::DcCurrent, {}), exp);
}

TEST_F(BoundsMergerTest, RejectsMalformedInput) {
    try {
        merger.addBounds(7, Metric::AcCurrent, {{10, 5}});
        FAIL() << "inverted bound accepted";
    } catch (const ControlError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidArgument);
        EXPECT_EQ(e.componentId(), 7u);
    }

    try {
        merger.addBounds(7, Metric::Unspecified, {{0, 1}});
        FAIL() << "unspecified metric accepted";
    } catch (const ControlError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidArgument);
    }

    EXPECT_THROW(merger.addBounds(7, Metric::AcCurrent, {{0, std::numeric_limits<double>::infinity()}}),
                 ControlError);
    EXPECT_TRUE(merger.activeBounds(7, Metric::AcCurrent).empty());
}

TEST_F(BoundsMergerTest, ZeroPowerAlwaysWithinBounds) {
    EXPECT_TRUE(merger.validate(1, Metric::AcActivePower, 0.0));
    EXPECT_TRUE(merger.validate(1, Metric::DcPower, 0.0));

    merger.addBounds(1, Metric::AcActivePower, {{1000, 2000}});
    EXPECT_TRUE(merger.validate(1, Metric::AcActivePower, 0.0));
    EXPECT_FALSE(merger.validate(1, Metric::AcActivePower, 500.0));
    EXPECT_TRUE(merger.validate(1, Metric::AcActivePower, 2000.0));
}

TEST_F(BoundsMergerTest, NonPowerMetricWithoutBoundsFails) {
    EXPECT_FALSE(merger.validate(1, Metric::Temperature, 0.0));
    EXPECT_FALSE(merger.validate(1, Metric::BatterySocPct, 50.0));
}

TEST_F(BoundsMergerTest, SetsAreKeyedPerComponentAndMetric) {
    merger.addBounds(1, Metric::AcCurrent, {{0, 10}});
    merger.addBounds(2, Metric::AcCurrent, {{20, 30}});
    merger.addBounds(1, Metric::AcVoltage, {{200, 250}});

    EXPECT_TRUE(merger.validate(1, Metric::AcCurrent, 5));
    EXPECT_FALSE(merger.validate(2, Metric::AcCurrent, 5));
    EXPECT_FALSE(merger.validate(1, Metric::AcVoltage, 5));

    const auto snap = merger.snapshot(1);
    ASSERT_EQ(snap.size(), 2u);
    EXPECT_EQ(snap[0].first, Metric::AcCurrent);
    EXPECT_EQ(snap[1].first, Metric::AcVoltage);
}

TEST_F(BoundsMergerTest, SweepDropsOnlyExpiredSets) {
    merger.addBounds(1, Metric::AcCurrent, {{0, 10}}, ValidityDuration::FiveSeconds);
    merger.addBounds(2, Metric::AcCurrent, {{0, 10}}, ValidityDuration::FiveMinutes);

    clock.advance(seconds(6));
    EXPECT_EQ(merger.sweep(), 1u);
    EXPECT_TRUE(merger.snapshot(1).empty());
    EXPECT_EQ(merger.snapshot(2).size(), 1u);
    EXPECT_EQ(merger.sweep(), 0u);
}

TEST(MetricNames, RoundTripAndUnknown) {
    EXPECT_EQ(metricFromString("ac_active_power"), Metric::AcActivePower);
    EXPECT_EQ(metricFromString(" DC_Voltage "), Metric::DcVoltage);
    EXPECT_FALSE(metricFromString("bogus").has_value());
    EXPECT_STREQ(toString(Metric::BatterySocPct), "battery_soc_pct");
}

TEST(ValidityNames, Parse) {
    EXPECT_EQ(validityFromString("15m"), ValidityDuration::FifteenMinutes);
    EXPECT_EQ(validityFromString("60s"), ValidityDuration::OneMinute);
    EXPECT_EQ(validityFromString("300s"), ValidityDuration::FiveMinutes);
    EXPECT_EQ(validityFromString("900s"), ValidityDuration::FifteenMinutes);
    EXPECT_FALSE(validityFromString("30s").has_value());
    EXPECT_FALSE(validityFromString("2h").has_value());
    EXPECT_EQ(toDuration(ValidityDuration::FiveMinutes), Duration(300000));
}

} // namespace
} // namespace mgc
