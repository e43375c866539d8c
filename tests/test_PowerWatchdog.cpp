/*
 * MicrogridControl — Power watchdog tests
 * (c) 2025 MicrogridControl contributors
 */
#include <chrono>
#include <thread>

#include <gtest/gtest.h>

#include "fakes/FakeDriver.hpp"
#include "fakes/ManualTimeSource.hpp"
#include "include/ComponentLocks.hpp"
#include "include/ControlError.hpp"
#include "include/PowerWatchdog.hpp"

namespace mgc {
namespace {

using fakes::DriverCall;
using fakes::FakeDriver;
using fakes::ManualTimeSource;
using std::chrono::milliseconds;
using std::chrono::seconds;

TEST(FloorToResolution, FloorsMagnitudeKeepingSign) {
    EXPECT_DOUBLE_EQ(PowerWatchdog::floorToResolution(123.0, 50.0), 100.0);
    EXPECT_DOUBLE_EQ(PowerWatchdog::floorToResolution(-123.0, 50.0), -100.0);
    EXPECT_DOUBLE_EQ(PowerWatchdog::floorToResolution(150.0, 50.0), 150.0);
    EXPECT_DOUBLE_EQ(PowerWatchdog::floorToResolution(49.9, 50.0), 0.0);
    EXPECT_DOUBLE_EQ(PowerWatchdog::floorToResolution(0.3, 0.1), 0.3);
}

TEST(FloorToResolution, ZeroResolutionPassesThrough) {
    EXPECT_DOUBLE_EQ(PowerWatchdog::floorToResolution(123.456, 0.0), 123.456);
}

TEST(CheckedLifetime, BoundsAndDefault) {
    EXPECT_EQ(PowerWatchdog::checkedLifetime(1, std::nullopt), Duration(60000));
    EXPECT_EQ(PowerWatchdog::checkedLifetime(1, Duration(10000)), Duration(10000));
    EXPECT_EQ(PowerWatchdog::checkedLifetime(1, Duration(900000)), Duration(900000));

    try {
        PowerWatchdog::checkedLifetime(4, Duration(9999));
        FAIL() << "short lifetime accepted";
    } catch (const ControlError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidArgument);
        EXPECT_EQ(e.componentId(), 4u);
    }
    EXPECT_THROW(PowerWatchdog::checkedLifetime(4, Duration(900001)), ControlError);
}

class PowerWatchdogTest : public ::testing::Test {
protected:
    void SetUp() override {
        driver.add(fakes::inverterInfo(1));
        driver.add(fakes::inverterInfo(2));
        locks.add(1);
        locks.add(2);
    }

    FakeDriver       driver;
    ComponentLocks   locks;
    ManualTimeSource clock;
    PowerWatchdog    watchdog{driver, locks, clock};
};

TEST_F(PowerWatchdogTest, SetPowerFloorsAndRecords) {
    const TimePoint t0 = clock.now();
    const TimePoint exp = watchdog.setPower(1, PowerKind::Active, 1234.0, seconds(10), 100.0);

    EXPECT_EQ(exp, t0 + seconds(10));
    auto cmd = watchdog.command(1, PowerKind::Active);
    ASSERT_TRUE(cmd.has_value());
    EXPECT_DOUBLE_EQ(cmd->magnitude, 1200.0);
    EXPECT_EQ(cmd->expiresAt, exp);
    EXPECT_DOUBLE_EQ(driver.hardware(1).activePowerW, 1200.0);
    EXPECT_FALSE(watchdog.command(1, PowerKind::Reactive).has_value());
}

TEST_F(PowerWatchdogTest, RevertsAfterLifetimeAndNotBefore) {
    watchdog.setPower(1, PowerKind::Active, 500.0, seconds(10), 100.0);

    clock.advance(milliseconds(9999));
    EXPECT_EQ(watchdog.expireDue(), 0u);
    EXPECT_DOUBLE_EQ(driver.hardware(1).activePowerW, 500.0);

    clock.advance(milliseconds(1));
    EXPECT_EQ(watchdog.expireDue(), 1u);
    EXPECT_DOUBLE_EQ(driver.hardware(1).activePowerW, 0.0);
    EXPECT_FALSE(watchdog.command(1, PowerKind::Active).has_value());

    auto last = driver.lastCall();
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->op, DriverCall::Op::SetPower);
    EXPECT_DOUBLE_EQ(last->value, 0.0);
}

TEST_F(PowerWatchdogTest, RefreshSupersedesPendingRevert) {
    watchdog.setPower(1, PowerKind::Active, 500.0, seconds(10), 100.0);
    clock.advance(seconds(8));
    watchdog.setPower(1, PowerKind::Active, 700.0, seconds(10), 100.0);

    clock.advance(seconds(3));   // first deadline passed, second not
    EXPECT_EQ(watchdog.expireDue(), 0u);
    EXPECT_DOUBLE_EQ(driver.hardware(1).activePowerW, 700.0);

    clock.advance(seconds(7));
    EXPECT_EQ(watchdog.expireDue(), 1u);
    EXPECT_DOUBLE_EQ(driver.hardware(1).activePowerW, 0.0);
}

TEST_F(PowerWatchdogTest, KindsAreIndependent) {
    watchdog.setPower(1, PowerKind::Active, 1000.0, seconds(10), 100.0);
    watchdog.setPower(1, PowerKind::Reactive, 300.0, seconds(20), 50.0);

    clock.advance(seconds(10));
    EXPECT_EQ(watchdog.expireDue(), 1u);
    EXPECT_DOUBLE_EQ(driver.hardware(1).activePowerW, 0.0);
    EXPECT_DOUBLE_EQ(driver.hardware(1).reactivePowerVar, 300.0);
    EXPECT_TRUE(watchdog.command(1, PowerKind::Reactive).has_value());
}

TEST_F(PowerWatchdogTest, DriverFailureKeepsPreviousCommand) {
    const TimePoint first = watchdog.setPower(1, PowerKind::Active, 400.0, seconds(10), 100.0);
    driver.failOn(DriverCall::Op::SetPower, 1);

    try {
        watchdog.setPower(1, PowerKind::Active, 900.0, seconds(30), 100.0);
        FAIL() << "driver failure not reported";
    } catch (const ControlError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DriverError);
    }

    auto cmd = watchdog.command(1, PowerKind::Active);
    ASSERT_TRUE(cmd.has_value());
    EXPECT_DOUBLE_EQ(cmd->magnitude, 400.0);
    EXPECT_EQ(cmd->expiresAt, first);
}

TEST_F(PowerWatchdogTest, FailedRevertIsRetried) {
    watchdog.setPower(1, PowerKind::Active, 400.0, seconds(10), 100.0);
    driver.failOn(DriverCall::Op::SetPower, 1);

    clock.advance(seconds(10));
    EXPECT_EQ(watchdog.expireDue(), 0u);
    EXPECT_TRUE(watchdog.command(1, PowerKind::Active).has_value());
    ASSERT_TRUE(watchdog.nextDeadline().has_value());
    EXPECT_EQ(*watchdog.nextDeadline(), clock.now() + PowerWatchdog::kRevertRetry);

    driver.failOn(DriverCall::Op::SetPower, 1, false);
    clock.advance(seconds(1));
    EXPECT_EQ(watchdog.expireDue(), 1u);
    EXPECT_DOUBLE_EQ(driver.hardware(1).activePowerW, 0.0);
    EXPECT_FALSE(watchdog.command(1, PowerKind::Active).has_value());
}

TEST_F(PowerWatchdogTest, ClearCancelsRevertWithoutDriverCall) {
    watchdog.setPower(1, PowerKind::Active, 400.0, seconds(10), 100.0);
    driver.clearCalls();

    watchdog.clear(1, PowerKind::Active);
    clock.advance(seconds(20));
    EXPECT_EQ(watchdog.expireDue(), 0u);
    EXPECT_EQ(driver.commandCount(), 0u);
}

TEST_F(PowerWatchdogTest, RevertNowZeroesAndForgetsCommand) {
    watchdog.setPower(1, PowerKind::Reactive, 200.0, seconds(60), 50.0);
    driver.clearCalls();

    {
        auto guard = locks.acquire(1);
        EXPECT_TRUE(watchdog.revertNow(1, PowerKind::Reactive));
        EXPECT_FALSE(watchdog.revertNow(1, PowerKind::Active));   // nothing live
    }
    EXPECT_EQ(driver.powerCalls(1, PowerKind::Reactive), 1u);
    EXPECT_DOUBLE_EQ(driver.hardware(1).reactivePowerVar, 0.0);
    EXPECT_FALSE(watchdog.command(1, PowerKind::Reactive).has_value());

    clock.advance(seconds(61));
    EXPECT_EQ(watchdog.expireDue(), 0u);
    EXPECT_EQ(driver.commandCount(), 1u);
}

TEST_F(PowerWatchdogTest, FailedRevertNowStaysArmed) {
    watchdog.setPower(1, PowerKind::Active, 400.0, seconds(60), 100.0);
    driver.failOn(DriverCall::Op::SetPower, 1);

    {
        auto guard = locks.acquire(1);
        EXPECT_FALSE(watchdog.revertNow(1, PowerKind::Active));
    }
    EXPECT_TRUE(watchdog.command(1, PowerKind::Active).has_value());
    ASSERT_TRUE(watchdog.nextDeadline().has_value());
    EXPECT_EQ(*watchdog.nextDeadline(), clock.now() + PowerWatchdog::kRevertRetry);

    driver.failOn(DriverCall::Op::SetPower, 1, false);
    clock.advance(seconds(1));
    EXPECT_EQ(watchdog.expireDue(), 1u);
    EXPECT_DOUBLE_EQ(driver.hardware(1).activePowerW, 0.0);
}

TEST_F(PowerWatchdogTest, RevertAllDrivesEveryCommandToZero) {
    watchdog.setPower(1, PowerKind::Active, 400.0, seconds(60), 100.0);
    watchdog.setPower(2, PowerKind::Reactive, 200.0, seconds(60), 50.0);

    EXPECT_EQ(watchdog.revertAll(), 2u);
    EXPECT_DOUBLE_EQ(driver.hardware(1).activePowerW, 0.0);
    EXPECT_DOUBLE_EQ(driver.hardware(2).reactivePowerVar, 0.0);
    EXPECT_FALSE(watchdog.command(1, PowerKind::Active).has_value());
    EXPECT_FALSE(watchdog.command(2, PowerKind::Reactive).has_value());
}

TEST_F(PowerWatchdogTest, StopDropsPendingReverts) {
    watchdog.setPower(1, PowerKind::Active, 400.0, seconds(10), 100.0);
    watchdog.stop();
    EXPECT_FALSE(watchdog.command(1, PowerKind::Active).has_value());
    EXPECT_FALSE(watchdog.nextDeadline().has_value());
}

TEST_F(PowerWatchdogTest, DispatcherRevertsInBackground) {
    watchdog.start(milliseconds(5));
    watchdog.setPower(1, PowerKind::Active, 800.0, seconds(10), 100.0);
    clock.advance(seconds(11));

    const auto deadline = std::chrono::steady_clock::now() + seconds(5);
    while (watchdog.command(1, PowerKind::Active).has_value() &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(milliseconds(5));
    }
    EXPECT_FALSE(watchdog.command(1, PowerKind::Active).has_value());
    EXPECT_DOUBLE_EQ(driver.hardware(1).activePowerW, 0.0);
    watchdog.stop();
}

} // namespace
} // namespace mgc
