/*
 * MicrogridControl — Action plans (static table)
 * (c) 2025 MicrogridControl contributors
 */
#include "include/ActionPlan.hpp"

namespace mgc {

namespace {

using C = ComponentCategory;
using T = Transition;
using S = StepKind;
using K = Capability;

const std::vector<ActionPlan>& planTable() {
    static const std::vector<ActionPlan> kPlans = {
        {C::Inverter, T::Start, {
            {S::CloseDcRelay,     "close DC relay",        K::DcRelay,     true},
            {S::CloseAcRelay,     "close AC relay",        K::AcRelay,     false},
            {S::SetPowerZero,     "set power 0",           K::ActivePower, true},
        }},
        {C::Inverter, T::Standby, {
            {S::VerifyAcDcClosed, "verify AC+DC closed",   K::AcRelay,     false},
            {S::SetPowerZero,     "set power 0",           K::ActivePower, true},
            {S::OpenAcRelay,      "open AC relay",         K::AcRelay,     false},
        }},
        {C::Inverter, T::Stop, {
            {S::EnterStandby,     "enter standby",         K::None,        false},
            {S::OpenDcRelay,      "open DC relay",         K::DcRelay,     true},
        }},
        {C::Battery, T::Start, {
            {S::CloseDcRelay,     "close DC relay",        K::DcRelay,     false},
        }},
        {C::Battery, T::Stop, {
            {S::VerifyPowerZero,  "verify power == 0",     K::None,        false},
            {S::OpenDcRelay,      "open DC relay",         K::DcRelay,     false},
        }},
        {C::Relay, T::Start, {
            {S::CloseMainRelay,   "close relay",           K::None,        false},
        }},
        {C::Relay, T::Stop, {
            {S::OpenMainRelay,    "open relay",            K::None,        false},
        }},
        {C::PrechargeModule, T::Start, {
            {S::BeginPrecharge,   "begin precharge",       K::Precharge,   false},
        }},
        {C::PrechargeModule, T::Stop, {
            {S::OpenDcRelay,      "open DC relay",         K::DcRelay,     false},
        }},
    };
    return kPlans;
}

} // namespace

const ActionPlan* findPlan(ComponentCategory category, Transition transition) {
    for (const auto& p : planTable()) {
        if (p.category == category && p.transition == transition) return &p;
    }
    return nullptr;
}

LifecycleState recoveryStateFor(ComponentCategory category) {
    // Inverters come back in cold standby, everything else fully stopped.
    return category == ComponentCategory::Inverter ? LifecycleState::Standby
                                                   : LifecycleState::Stopped;
}

LifecycleState inferLifecycle(ComponentCategory category, const Features& f, const HardwareState& hw) {
    switch (category) {
        case ComponentCategory::Inverter: {
            const bool dcOk = !f.hasDcRelay || hw.dcRelayClosed;
            if (hw.acRelayClosed && dcOk) return LifecycleState::Operational;
            if (f.hasDcRelay && hw.dcRelayClosed) return LifecycleState::Standby;
            return LifecycleState::Stopped;
        }
        case ComponentCategory::Battery:
        case ComponentCategory::PrechargeModule:
            return hw.dcRelayClosed ? LifecycleState::Operational : LifecycleState::Stopped;
        case ComponentCategory::Relay:
            return hw.relayClosed(mainRelayOf(f)) ? LifecycleState::Operational : LifecycleState::Stopped;
        case ComponentCategory::Other:
            break;
    }
    return LifecycleState::Unknown;
}

} // namespace mgc
