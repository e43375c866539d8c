/*
 * MicrogridControl — Command sequencer (implementation)
 * (c) 2025 MicrogridControl contributors
 */
#include "include/CommandSequencer.hpp"
#include "include/ControlError.hpp"
#include "include/Log.hpp"

#include <string>

namespace mgc {

CommandSequencer::CommandSequencer(IComponentDriver& driver)
: driver_(driver) {}

static bool powerIsZero(PowerKind kind, const Features& f, const HardwareState& hw,
                        const PowerSetpoints& commanded) {
    const Capability cap = kind == PowerKind::Active ? Capability::ActivePower : Capability::ReactivePower;
    if (!f.has(cap)) return true;   // nothing the driver could command
    return hw.power(kind) == 0.0 && commanded.of(kind) == 0.0;
}

bool CommandSequencer::satisfied(StepKind kind, const Features& f, const HardwareState& hw,
                                 const PowerSetpoints& commanded) {
    switch (kind) {
        case StepKind::CloseDcRelay:     return hw.dcRelayClosed;
        case StepKind::CloseAcRelay:     return hw.acRelayClosed;
        case StepKind::OpenAcRelay:      return !hw.acRelayClosed;
        case StepKind::OpenDcRelay:      return !hw.dcRelayClosed && !hw.prechargeActive;
        case StepKind::CloseMainRelay:   return hw.relayClosed(mainRelayOf(f));
        case StepKind::OpenMainRelay:    return !hw.relayClosed(mainRelayOf(f));
        case StepKind::SetPowerZero:
            return powerIsZero(PowerKind::Active, f, hw, commanded) &&
                   powerIsZero(PowerKind::Reactive, f, hw, commanded);
        case StepKind::VerifyAcDcClosed: return hw.acRelayClosed && (!f.hasDcRelay || hw.dcRelayClosed);
        case StepKind::VerifyPowerZero:  return hw.activePowerW == 0.0 && commanded.activeW == 0.0;
        case StepKind::BeginPrecharge:   return hw.dcRelayClosed || hw.prechargeActive;
        case StepKind::EnterStandby:     return !hw.acRelayClosed;
    }
    return false;
}

SequenceOutcome CommandSequencer::run(ComponentId id, ComponentCategory category, const Features& features,
                                      const ActionPlan& plan, HardwareState& hw, PowerSetpoints& commanded) {
    checkCapabilities_(id, category, features, plan);

    SequenceOutcome out;
    LOG_DEBUG("sequencer: %llu %s/%s begin (%zu steps)",
              (unsigned long long)id, toString(category), toString(plan.transition), plan.steps.size());
    runSteps_(id, category, features, plan, hw, commanded, out);
    LOG_DEBUG("sequencer: %llu %s/%s done (executed=%zu skipped=%zu pending=%s)",
              (unsigned long long)id, toString(category), toString(plan.transition),
              out.executed, out.skipped, out.pending ? "yes" : "no");
    return out;
}

void CommandSequencer::checkCapabilities_(ComponentId id, ComponentCategory category, const Features& f,
                                          const ActionPlan& plan) const {
    for (const auto& step : plan.steps) {
        if (step.kind == StepKind::EnterStandby) {
            const ActionPlan* sub = findPlan(category, Transition::Standby);
            if (!sub) {
                throw ControlError(ErrorCode::InvalidArgument, id,
                                   std::string(toString(category)) + " has no standby plan", step.name);
            }
            checkCapabilities_(id, category, f, *sub);
            continue;
        }
        if (!step.skipIfMissing && !f.has(step.needs)) {
            throw ControlError(ErrorCode::InvalidArgument, id,
                               std::string("component lacks capability '") + toString(step.needs) +
                               "' required by step '" + step.name + "'",
                               step.name);
        }
    }
}

void CommandSequencer::runSteps_(ComponentId id, ComponentCategory category, const Features& f,
                                 const ActionPlan& plan, HardwareState& hw, PowerSetpoints& commanded,
                                 SequenceOutcome& out) {
    for (const auto& step : plan.steps) {
        if (!f.has(step.needs)) {
            LOG_DEBUG("sequencer: %llu skip '%s' (no %s)",
                      (unsigned long long)id, step.name, toString(step.needs));
            ++out.skipped;
            continue;
        }

        if (satisfied(step.kind, f, hw, commanded)) {
            if (step.kind == StepKind::BeginPrecharge && hw.prechargeActive && !hw.dcRelayClosed) {
                out.pending = true;
            }
            LOG_DEBUG("sequencer: %llu skip '%s' (already satisfied)", (unsigned long long)id, step.name);
            ++out.skipped;
            continue;
        }

        if (isGuard(step.kind)) {
            LOG_WARN("sequencer: %llu precondition '%s' not met", (unsigned long long)id, step.name);
            throw ControlError(ErrorCode::PreconditionFailed, id,
                               std::string("precondition failed: ") + step.name, step.name);
        }

        execute_(id, category, f, step, hw, commanded, out);
    }
}

void CommandSequencer::relay_(ComponentId id, const PlanStep& step, RelayKind relay, bool closed,
                              HardwareState& hw) {
    std::string err;
    if (!driver_.setRelay(id, relay, closed, err)) {
        LOG_ERROR("sequencer: %llu step '%s' failed: %s", (unsigned long long)id, step.name, err.c_str());
        throw ControlError(ErrorCode::DriverError, id,
                           std::string("step '") + step.name + "' failed: " + err, step.name);
    }
    if (relay == RelayKind::Ac) hw.acRelayClosed = closed;
    else                        hw.dcRelayClosed = closed;
    if (relay == RelayKind::Dc && !closed) hw.prechargeActive = false;
    LOG_INFO("sequencer: %llu %s", (unsigned long long)id, step.name);
}

void CommandSequencer::zeroPower_(ComponentId id, const PlanStep& step, PowerKind kind,
                                  HardwareState& hw, PowerSetpoints& commanded) {
    std::string err;
    if (!driver_.setPower(id, kind, 0.0, err)) {
        LOG_ERROR("sequencer: %llu step '%s' (%s) failed: %s",
                  (unsigned long long)id, step.name, toString(kind), err.c_str());
        throw ControlError(ErrorCode::DriverError, id,
                           std::string("step '") + step.name + "' failed: " + err, step.name);
    }
    if (kind == PowerKind::Active) hw.activePowerW = 0.0;
    else                           hw.reactivePowerVar = 0.0;
    commanded.of(kind) = 0.0;
    LOG_INFO("sequencer: %llu %s (%s)", (unsigned long long)id, step.name, toString(kind));
}

void CommandSequencer::execute_(ComponentId id, ComponentCategory category, const Features& f,
                                const PlanStep& step, HardwareState& hw, PowerSetpoints& commanded,
                                SequenceOutcome& out) {
    std::string err;
    switch (step.kind) {
        case StepKind::CloseDcRelay:   relay_(id, step, RelayKind::Dc, true,  hw); break;
        case StepKind::CloseAcRelay:   relay_(id, step, RelayKind::Ac, true,  hw); break;
        case StepKind::OpenAcRelay:    relay_(id, step, RelayKind::Ac, false, hw); break;
        case StepKind::OpenDcRelay:    relay_(id, step, RelayKind::Dc, false, hw); break;
        case StepKind::CloseMainRelay: relay_(id, step, mainRelayOf(f), true,  hw); break;
        case StepKind::OpenMainRelay:  relay_(id, step, mainRelayOf(f), false, hw); break;

        case StepKind::SetPowerZero:
            // Reactive output is zeroed too, or it would come back with the next start.
            for (PowerKind kind : {PowerKind::Active, PowerKind::Reactive}) {
                if (!powerIsZero(kind, f, hw, commanded)) {
                    zeroPower_(id, step, kind, hw, commanded);
                    ++out.executed;
                }
            }
            return;

        case StepKind::BeginPrecharge:
            if (!driver_.startPrecharge(id, err)) {
                LOG_ERROR("sequencer: %llu step '%s' failed: %s", (unsigned long long)id, step.name, err.c_str());
                throw ControlError(ErrorCode::DriverError, id,
                                   std::string("step '") + step.name + "' failed: " + err, step.name);
            }
            hw.prechargeActive = true;
            out.pending = true;
            LOG_INFO("sequencer: %llu %s (completion pending)", (unsigned long long)id, step.name);
            break;

        case StepKind::EnterStandby: {
            // Presence was checked up-front in checkCapabilities_.
            const ActionPlan* sub = findPlan(category, Transition::Standby);
            LOG_DEBUG("sequencer: %llu %s via standby plan", (unsigned long long)id, step.name);
            runSteps_(id, category, f, *sub, hw, commanded, out);
            return; // sub-steps are counted individually
        }

        case StepKind::VerifyAcDcClosed:
        case StepKind::VerifyPowerZero:
            return; // guards never reach execute_
    }
    ++out.executed;
}

} // namespace mgc
