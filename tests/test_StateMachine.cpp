/*
 * MicrogridControl — Component state machine tests
 * (c) 2025 MicrogridControl contributors
 */
#include <gtest/gtest.h>

#include "fakes/FakeDriver.hpp"
#include "include/ActionPlan.hpp"
#include "include/ControlError.hpp"
#include "include/StateMachine.hpp"

namespace mgc {
namespace {

using fakes::DriverCall;
using fakes::FakeDriver;

class StateMachineTest : public ::testing::Test {
protected:
    /* Registers the component and lets the machine infer its initial state. */
    void add(const ComponentInfo& info, const HardwareState& hw = {}) {
        driver.add(info, hw);
        machine.registerComponent(info);
        ASSERT_TRUE(machine.refresh(info.id));
        driver.clearCalls();
    }

    LifecycleState state(ComponentId id) const { return machine.record(id).lifecycle; }

    static HardwareState operationalInverter(double activeW = 0.0) {
        HardwareState hw;
        hw.acRelayClosed = true;
        hw.dcRelayClosed = true;
        hw.activePowerW  = activeW;
        return hw;
    }

    /* Runs `fn` and returns the ControlError it raises. */
    template <typename Fn>
    static ControlError expectError(Fn&& fn) {
        try {
            fn();
        } catch (const ControlError& e) {
            return e;
        }
        ADD_FAILURE() << "no ControlError raised";
        return ControlError(ErrorCode::NotFound, 0, "none");
    }

    FakeDriver            driver;
    ComponentStateMachine machine{driver};
};

TEST_F(StateMachineTest, InfersInitialStateFromHardware) {
    add(fakes::inverterInfo(1));
    add(fakes::inverterInfo(2), operationalInverter());
    HardwareState dcOnly;
    dcOnly.dcRelayClosed = true;
    add(fakes::inverterInfo(3), dcOnly);

    EXPECT_EQ(state(1), LifecycleState::Stopped);
    EXPECT_EQ(state(2), LifecycleState::Operational);
    EXPECT_EQ(state(3), LifecycleState::Standby);
}

TEST_F(StateMachineTest, InverterStartClosesDcThenAc) {
    add(fakes::inverterInfo(1));
    machine.start(1);

    EXPECT_EQ(state(1), LifecycleState::Operational);
    const auto calls = driver.calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].relay, RelayKind::Dc);
    EXPECT_TRUE(calls[0].closed);
    EXPECT_EQ(calls[1].relay, RelayKind::Ac);
    EXPECT_TRUE(calls[1].closed);
}

TEST_F(StateMachineTest, StartIsIdempotent) {
    add(fakes::inverterInfo(1));
    machine.start(1);
    driver.clearCalls();

    machine.start(1);
    EXPECT_EQ(state(1), LifecycleState::Operational);
    EXPECT_EQ(driver.commandCount(), 0u);
}

TEST_F(StateMachineTest, InverterWithoutDcRelaySkipsDcStep) {
    add(fakes::inverterInfo(1, /*dcRelay=*/false));
    machine.start(1);

    EXPECT_EQ(state(1), LifecycleState::Operational);
    const auto calls = driver.calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].relay, RelayKind::Ac);
}

TEST_F(StateMachineTest, MissingRequiredCapabilityRejectsPlan) {
    ComponentInfo info = fakes::inverterInfo(1);
    info.features.hasAcRelay = false;
    add(info);

    const ControlError e = expectError([&] { machine.start(1); });
    EXPECT_EQ(e.code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(driver.commandCount(), 0u);
}

TEST_F(StateMachineTest, InverterStandbyZeroesPowerAndOpensAc) {
    add(fakes::inverterInfo(1), operationalInverter(1500.0));
    machine.standby(1);

    EXPECT_EQ(state(1), LifecycleState::Standby);
    const auto calls = driver.calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].op, DriverCall::Op::SetPower);
    EXPECT_DOUBLE_EQ(calls[0].value, 0.0);
    EXPECT_EQ(calls[1].op, DriverCall::Op::SetRelay);
    EXPECT_EQ(calls[1].relay, RelayKind::Ac);
    EXPECT_FALSE(calls[1].closed);
    EXPECT_TRUE(driver.hardware(1).dcRelayClosed);
}

TEST_F(StateMachineTest, StandbyZeroesLiveSetpointsEvenWhenOutputReadsZero) {
    add(fakes::inverterInfo(1), operationalInverter(0.0));
    PowerSetpoints live;
    live.activeW     = 500.0;
    live.reactiveVar = -150.0;
    machine.noteCommanded(1, live);

    machine.standby(1);
    EXPECT_EQ(state(1), LifecycleState::Standby);
    EXPECT_EQ(driver.powerCalls(1, PowerKind::Active), 1u);
    EXPECT_EQ(driver.powerCalls(1, PowerKind::Reactive), 1u);
    const PowerSetpoints after = machine.record(1).commanded;
    EXPECT_DOUBLE_EQ(after.activeW, 0.0);
    EXPECT_DOUBLE_EQ(after.reactiveVar, 0.0);
}

TEST_F(StateMachineTest, BatteryStopRefusedWhileSetpointLive) {
    HardwareState hw;
    hw.dcRelayClosed = true;
    add(fakes::batteryInfo(2), hw);
    PowerSetpoints live;
    live.activeW = 300.0;
    machine.noteCommanded(2, live);

    EXPECT_EQ(expectError([&] { machine.stop(2); }).code(), ErrorCode::PreconditionFailed);
    EXPECT_EQ(driver.commandCount(), 0u);
}

TEST_F(StateMachineTest, StandbyFromStoppedIsInvalidState) {
    add(fakes::inverterInfo(1));
    const ControlError e = expectError([&] { machine.standby(1); });
    EXPECT_EQ(e.code(), ErrorCode::InvalidState);
    EXPECT_EQ(driver.commandCount(), 0u);
}

TEST_F(StateMachineTest, InverterStopPassesThroughStandby) {
    add(fakes::inverterInfo(1), operationalInverter(800.0));
    machine.stop(1);

    EXPECT_EQ(state(1), LifecycleState::Stopped);
    const auto calls = driver.calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[0].op, DriverCall::Op::SetPower);
    EXPECT_EQ(calls[1].relay, RelayKind::Ac);
    EXPECT_FALSE(calls[1].closed);
    EXPECT_EQ(calls[2].relay, RelayKind::Dc);
    EXPECT_FALSE(calls[2].closed);
}

TEST_F(StateMachineTest, InverterStopFromStandbyOnlyOpensDc) {
    HardwareState dcOnly;
    dcOnly.dcRelayClosed = true;
    add(fakes::inverterInfo(1), dcOnly);
    machine.stop(1);

    EXPECT_EQ(state(1), LifecycleState::Stopped);
    const auto calls = driver.calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].relay, RelayKind::Dc);
}

TEST_F(StateMachineTest, BatteryStopWithPowerFlowingFailsPrecondition) {
    HardwareState hw;
    hw.dcRelayClosed = true;
    hw.activePowerW  = 500.0;
    add(fakes::batteryInfo(2), hw);
    ASSERT_EQ(state(2), LifecycleState::Operational);

    const ControlError e = expectError([&] { machine.stop(2); });
    EXPECT_EQ(e.code(), ErrorCode::PreconditionFailed);
    EXPECT_EQ(e.step(), "verify power == 0");
    EXPECT_EQ(driver.commandCount(), 0u);
    EXPECT_EQ(state(2), LifecycleState::Operational);
}

TEST_F(StateMachineTest, BatteryStartStop) {
    add(fakes::batteryInfo(2));
    machine.start(2);
    EXPECT_EQ(state(2), LifecycleState::Operational);
    EXPECT_TRUE(driver.hardware(2).dcRelayClosed);

    machine.stop(2);
    EXPECT_EQ(state(2), LifecycleState::Stopped);
    EXPECT_FALSE(driver.hardware(2).dcRelayClosed);
}

TEST_F(StateMachineTest, CategoryWithoutPlanIsInvalidArgument) {
    add(fakes::batteryInfo(2));
    EXPECT_EQ(expectError([&] { machine.standby(2); }).code(), ErrorCode::InvalidArgument);

    ComponentInfo other;
    other.id = 9;
    other.category = ComponentCategory::Other;
    add(other);
    EXPECT_EQ(state(9), LifecycleState::Unknown);
    EXPECT_EQ(expectError([&] { machine.start(9); }).code(), ErrorCode::InvalidArgument);
}

TEST_F(StateMachineTest, RelayComponentDrivesMainRelay) {
    add(fakes::relayInfo(3));
    machine.start(3);
    EXPECT_EQ(state(3), LifecycleState::Operational);
    EXPECT_TRUE(driver.hardware(3).acRelayClosed);

    machine.stop(3);
    EXPECT_EQ(state(3), LifecycleState::Stopped);
    EXPECT_FALSE(driver.hardware(3).acRelayClosed);
}

TEST_F(StateMachineTest, PartialFailureKeepsCompletedSteps) {
    add(fakes::inverterInfo(1));
    driver.failRelay(1, RelayKind::Ac, true);

    const ControlError e = expectError([&] { machine.start(1); });
    EXPECT_EQ(e.code(), ErrorCode::DriverError);
    EXPECT_EQ(e.step(), "close AC relay");
    EXPECT_EQ(state(1), LifecycleState::Stopped);
    EXPECT_TRUE(machine.record(1).hw.dcRelayClosed);

    // A retry resumes after the DC step that already completed.
    driver.clearFailures();
    driver.clearCalls();
    machine.start(1);
    EXPECT_EQ(state(1), LifecycleState::Operational);
    ASSERT_EQ(driver.commandCount(), 1u);
    EXPECT_EQ(driver.lastCall()->relay, RelayKind::Ac);
}

TEST_F(StateMachineTest, PrechargeSettlesWhenDcCloses) {
    add(fakes::prechargeInfo(5));
    machine.start(5);

    ComponentRecord rec = machine.record(5);
    EXPECT_EQ(rec.lifecycle, LifecycleState::Stopped);
    ASSERT_TRUE(rec.pending.has_value());
    EXPECT_EQ(*rec.pending, LifecycleState::Operational);

    // Still charging: nothing settles.
    ASSERT_TRUE(machine.refresh(5));
    EXPECT_TRUE(machine.record(5).pending.has_value());

    driver.completePrecharge(5);
    ASSERT_TRUE(machine.refresh(5));
    rec = machine.record(5);
    EXPECT_EQ(rec.lifecycle, LifecycleState::Operational);
    EXPECT_FALSE(rec.pending.has_value());
}

TEST_F(StateMachineTest, StopCancelsRunningPrecharge) {
    add(fakes::prechargeInfo(5));
    machine.start(5);
    driver.clearCalls();

    machine.stop(5);
    const ComponentRecord rec = machine.record(5);
    EXPECT_EQ(rec.lifecycle, LifecycleState::Stopped);
    EXPECT_FALSE(rec.pending.has_value());
    EXPECT_FALSE(driver.hardware(5).prechargeActive);
    ASSERT_EQ(driver.commandCount(), 1u);
    EXPECT_EQ(driver.lastCall()->relay, RelayKind::Dc);
}

TEST_F(StateMachineTest, AsyncHardwareReportSettlesPending) {
    add(fakes::prechargeInfo(5));
    machine.start(5);

    HardwareState done;
    done.dcRelayClosed = true;
    machine.onHardwareState(5, done);
    EXPECT_EQ(state(5), LifecycleState::Operational);
}

TEST_F(StateMachineTest, ReportedFaultMovesToError) {
    add(fakes::inverterInfo(1), operationalInverter());
    driver.setError(1, ErrorState::Recoverable);
    ASSERT_TRUE(machine.refresh(1));

    EXPECT_EQ(state(1), LifecycleState::Error);
    EXPECT_EQ(machine.record(1).error, ErrorState::Recoverable);
}

TEST_F(StateMachineTest, AckRecoverableErrorLandsInRecoveryState) {
    add(fakes::inverterInfo(1), operationalInverter());
    add(fakes::batteryInfo(2));
    driver.setError(1, ErrorState::Recoverable);
    driver.setError(2, ErrorState::Recoverable);
    ASSERT_TRUE(machine.refresh(1));
    ASSERT_TRUE(machine.refresh(2));

    machine.ackError(1);
    machine.ackError(2);
    EXPECT_EQ(state(1), LifecycleState::Standby);
    EXPECT_EQ(state(2), LifecycleState::Stopped);
    EXPECT_EQ(machine.record(1).error, ErrorState::None);
}

TEST_F(StateMachineTest, AckFatalErrorIsRejected) {
    add(fakes::inverterInfo(1), operationalInverter());
    driver.setError(1, ErrorState::Fatal);
    ASSERT_TRUE(machine.refresh(1));
    driver.clearCalls();

    const ControlError e = expectError([&] { machine.ackError(1); });
    EXPECT_EQ(e.code(), ErrorCode::PreconditionFailed);
    EXPECT_EQ(state(1), LifecycleState::Error);
    EXPECT_EQ(driver.commandCount(), 0u);
}

TEST_F(StateMachineTest, AckWithoutErrorIsInvalidState) {
    add(fakes::inverterInfo(1));
    EXPECT_EQ(expectError([&] { machine.ackError(1); }).code(), ErrorCode::InvalidState);
}

TEST_F(StateMachineTest, UnreachableComponentIsUnavailable) {
    add(fakes::inverterInfo(1));
    driver.setUnreachable(1, true);

    EXPECT_FALSE(machine.refresh(1));
    EXPECT_FALSE(machine.record(1).reachable);
    EXPECT_EQ(expectError([&] { machine.start(1); }).code(), ErrorCode::Unavailable);
    EXPECT_EQ(driver.commandCount(), 0u);

    driver.setUnreachable(1, false);
    EXPECT_TRUE(machine.refresh(1));
    machine.start(1);
    EXPECT_EQ(state(1), LifecycleState::Operational);
}

TEST_F(StateMachineTest, UnknownComponentIsNotFound) {
    EXPECT_EQ(expectError([&] { machine.start(42); }).code(), ErrorCode::NotFound);
    EXPECT_EQ(expectError([&] { machine.record(42); }).code(), ErrorCode::NotFound);
    EXPECT_FALSE(machine.contains(42));
}

TEST(ActionPlans, RecoveryAndInference) {
    EXPECT_EQ(recoveryStateFor(ComponentCategory::Inverter), LifecycleState::Standby);
    EXPECT_EQ(recoveryStateFor(ComponentCategory::Relay), LifecycleState::Stopped);

    Features dcOnly;
    dcOnly.hasDcRelay = true;
    HardwareState closed;
    closed.dcRelayClosed = true;
    EXPECT_EQ(inferLifecycle(ComponentCategory::Relay, dcOnly, closed), LifecycleState::Operational);
    EXPECT_EQ(inferLifecycle(ComponentCategory::Other, dcOnly, closed), LifecycleState::Unknown);

    EXPECT_TRUE(findPlan(ComponentCategory::Battery, Transition::Standby) == nullptr);
    EXPECT_TRUE(findPlan(ComponentCategory::Inverter, Transition::Stop) != nullptr);
}

} // namespace
} // namespace mgc
