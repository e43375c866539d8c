/*
 * MicrogridControl — Action plans (static table)
 * - Ordered step lists per (component category, lifecycle transition)
 * (c) 2025 MicrogridControl contributors
 */
#pragma once

#include <vector>

#include "Types.hpp"

namespace mgc {

enum class StepKind {
    CloseDcRelay,
    CloseAcRelay,
    OpenAcRelay,
    OpenDcRelay,
    CloseMainRelay,     // plain relay components
    OpenMainRelay,
    SetPowerZero,       // active and reactive setpoints 0
    VerifyAcDcClosed,   // guard: PreconditionFailed when not met
    VerifyPowerZero,    // guard: PreconditionFailed when not met
    BeginPrecharge,     // asynchronous, completion closes the DC relay
    EnterStandby        // runs the category's Standby plan unless standby is already reached
};

struct PlanStep {
    StepKind    kind;
    const char* name;
    Capability  needs;
    bool        skipIfMissing;   // false: a missing capability rejects the whole plan
};

struct ActionPlan {
    ComponentCategory     category;
    Transition            transition;
    std::vector<PlanStep> steps;
};

/* nullptr when the category has no plan for the transition. */
const ActionPlan* findPlan(ComponentCategory category, Transition transition);

/* Verify* steps report PreconditionFailed instead of DriverError. */
inline bool isGuard(StepKind k) {
    return k == StepKind::VerifyAcDcClosed || k == StepKind::VerifyPowerZero;
}

/* Lifecycle a component lands in after AckComponentError. */
LifecycleState recoveryStateFor(ComponentCategory category);

/* Lifecycle implied by a hardware snapshot (used while the state is still Unknown). */
LifecycleState inferLifecycle(ComponentCategory category, const Features& f, const HardwareState& hw);

} // namespace mgc
