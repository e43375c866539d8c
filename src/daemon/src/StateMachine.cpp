/*
 * MicrogridControl — Component state machine (implementation)
 * (c) 2025 MicrogridControl contributors
 *
 * Notes:
 * - Order of checks per transition: unknown id (NotFound), unreachable
 *   (Unavailable), missing plan (InvalidArgument), already there (no-op),
 *   wrong source state (InvalidState). Only then is the driver touched.
 * - A failed plan leaves the lifecycle where it was; the hardware snapshot
 *   reflects every step that did complete, so a retry resumes from there.
 */
#include "include/StateMachine.hpp"
#include "include/ActionPlan.hpp"
#include "include/ControlError.hpp"
#include "include/Log.hpp"

namespace mgc {

ComponentStateMachine::ComponentStateMachine(IComponentDriver& driver)
: driver_(driver), sequencer_(driver) {}

void ComponentStateMachine::registerComponent(const ComponentInfo& info) {
    std::lock_guard<std::mutex> lock(tableMtx_);
    auto& slot = records_[info.id];
    if (!slot) {
        slot = std::make_unique<ComponentRecord>();
        LOG_INFO("state: registered %llu (%s '%s')",
                 (unsigned long long)info.id, toString(info.category), info.name.c_str());
    }
    slot->info = info;
}

bool ComponentStateMachine::contains(ComponentId id) const {
    std::lock_guard<std::mutex> lock(tableMtx_);
    return records_.count(id) != 0;
}

std::vector<ComponentId> ComponentStateMachine::ids() const {
    std::lock_guard<std::mutex> lock(tableMtx_);
    std::vector<ComponentId> out;
    out.reserve(records_.size());
    for (const auto& kv : records_) out.push_back(kv.first);
    return out;
}

ComponentRecord& ComponentStateMachine::find_(ComponentId id) {
    std::lock_guard<std::mutex> lock(tableMtx_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        throw ControlError(ErrorCode::NotFound, id, "component " + std::to_string(id) + " not found");
    }
    return *it->second;
}

ComponentRecord ComponentStateMachine::record(ComponentId id) const {
    std::lock_guard<std::mutex> lock(tableMtx_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        throw ControlError(ErrorCode::NotFound, id, "component " + std::to_string(id) + " not found");
    }
    return *it->second;
}

static void requireReachable(const ComponentRecord& rec) {
    if (!rec.reachable) {
        throw ControlError(ErrorCode::Unavailable, rec.info.id,
                           "component " + std::to_string(rec.info.id) + " is unreachable");
    }
}

static const ActionPlan& requirePlan(const ComponentRecord& rec, Transition t) {
    const ActionPlan* plan = findPlan(rec.info.category, t);
    if (!plan) {
        throw ControlError(ErrorCode::InvalidArgument, rec.info.id,
                           std::string(toString(rec.info.category)) + " does not support " + toString(t));
    }
    return *plan;
}

void ComponentStateMachine::readHardware_(ComponentRecord& rec) {
    auto hw = driver_.getHardwareState(rec.info.id);
    if (!hw) {
        rec.reachable = false;
        LOG_WARN("state: %llu unreachable", (unsigned long long)rec.info.id);
        throw ControlError(ErrorCode::Unavailable, rec.info.id,
                           "component " + std::to_string(rec.info.id) + " is unreachable");
    }
    rec.hw = *hw;
    rec.reachable = true;
}

void ComponentStateMachine::runPlan_(ComponentRecord& rec, Transition t) {
    const ActionPlan& plan = requirePlan(rec, t);
    readHardware_(rec);
    const SequenceOutcome out = sequencer_.run(rec.info.id, rec.info.category, rec.info.features, plan,
                                               rec.hw, rec.commanded);

    const LifecycleState target =
        t == Transition::Start   ? LifecycleState::Operational :
        t == Transition::Standby ? LifecycleState::Standby     : LifecycleState::Stopped;

    if (out.pending) {
        rec.pending = target;
        LOG_INFO("state: %llu %s -> %s in transition",
                 (unsigned long long)rec.info.id, toString(rec.lifecycle), toString(target));
        return;
    }

    LOG_INFO("state: %llu %s -> %s (%zu command(s))",
             (unsigned long long)rec.info.id, toString(rec.lifecycle), toString(target), out.executed);
    rec.lifecycle = target;
    rec.pending.reset();
}

void ComponentStateMachine::start(ComponentId id) {
    ComponentRecord& rec = find_(id);
    requireReachable(rec);
    requirePlan(rec, Transition::Start);

    if (rec.lifecycle == LifecycleState::Operational) {
        LOG_DEBUG("state: %llu start: already operational", (unsigned long long)id);
        return;
    }
    runPlan_(rec, Transition::Start);
}

void ComponentStateMachine::standby(ComponentId id) {
    ComponentRecord& rec = find_(id);
    requireReachable(rec);
    requirePlan(rec, Transition::Standby);

    if (rec.lifecycle == LifecycleState::Standby && !rec.pending) {
        LOG_DEBUG("state: %llu standby: already in standby", (unsigned long long)id);
        return;
    }
    if (rec.lifecycle != LifecycleState::Operational) {
        throw ControlError(ErrorCode::InvalidState, id,
                           std::string("standby not allowed from ") + toString(rec.lifecycle));
    }
    runPlan_(rec, Transition::Standby);
}

void ComponentStateMachine::stop(ComponentId id) {
    ComponentRecord& rec = find_(id);
    requireReachable(rec);
    requirePlan(rec, Transition::Stop);

    if (rec.lifecycle == LifecycleState::Stopped && !rec.pending) {
        LOG_DEBUG("state: %llu stop: already stopped", (unsigned long long)id);
        return;
    }
    runPlan_(rec, Transition::Stop);
}

void ComponentStateMachine::ackError(ComponentId id) {
    ComponentRecord& rec = find_(id);
    requireReachable(rec);

    if (rec.lifecycle != LifecycleState::Error) {
        throw ControlError(ErrorCode::InvalidState, id,
                           std::string("no error to acknowledge (state ") + toString(rec.lifecycle) + ")");
    }

    auto es = driver_.getErrorState(id);
    if (!es) {
        rec.reachable = false;
        throw ControlError(ErrorCode::Unavailable, id,
                           "component " + std::to_string(id) + " is unreachable");
    }
    if (*es == ErrorState::Fatal) {
        rec.error = *es;
        throw ControlError(ErrorCode::PreconditionFailed, id, "error is fatal and cannot be acknowledged",
                           "verify error recoverable");
    }

    std::string err;
    if (!driver_.ackError(id, err)) {
        LOG_ERROR("state: %llu ack error failed: %s", (unsigned long long)id, err.c_str());
        throw ControlError(ErrorCode::DriverError, id, "ack error failed: " + err, "ack error");
    }

    const LifecycleState next = recoveryStateFor(rec.info.category);
    LOG_INFO("state: %llu error acknowledged -> %s", (unsigned long long)id, toString(next));
    rec.error     = ErrorState::None;
    rec.lifecycle = next;
    rec.pending.reset();
}

void ComponentStateMachine::settle_(ComponentRecord& rec) {
    if (rec.pending && *rec.pending == LifecycleState::Operational && !rec.hw.prechargeActive) {
        if (rec.hw.dcRelayClosed) {
            LOG_INFO("state: %llu %s -> operational (settled)",
                     (unsigned long long)rec.info.id, toString(rec.lifecycle));
            rec.lifecycle = LifecycleState::Operational;
        } else {
            LOG_WARN("state: %llu transition to operational did not complete", (unsigned long long)rec.info.id);
        }
        rec.pending.reset();
    }

    if (rec.lifecycle == LifecycleState::Unknown) {
        const LifecycleState inferred = inferLifecycle(rec.info.category, rec.info.features, rec.hw);
        if (inferred != LifecycleState::Unknown) {
            LOG_DEBUG("state: %llu initial state %s", (unsigned long long)rec.info.id, toString(inferred));
            rec.lifecycle = inferred;
        }
    }
}

bool ComponentStateMachine::refresh(ComponentId id) {
    ComponentRecord& rec = find_(id);

    auto hw = driver_.getHardwareState(id);
    if (!hw) {
        if (rec.reachable) LOG_WARN("state: %llu became unreachable", (unsigned long long)id);
        rec.reachable = false;
        return false;
    }
    if (!rec.reachable) LOG_INFO("state: %llu reachable again", (unsigned long long)id);
    rec.reachable = true;
    rec.hw = *hw;

    if (auto es = driver_.getErrorState(id)) {
        rec.error = *es;
        if (*es != ErrorState::None && rec.lifecycle != LifecycleState::Error) {
            LOG_WARN("state: %llu reports %s error (%s -> error)",
                     (unsigned long long)id, toString(*es), toString(rec.lifecycle));
            rec.lifecycle = LifecycleState::Error;
            rec.pending.reset();
        }
    }

    settle_(rec);
    return true;
}

void ComponentStateMachine::onHardwareState(ComponentId id, const HardwareState& hw) {
    ComponentRecord& rec = find_(id);
    rec.hw = hw;
    rec.reachable = true;
    settle_(rec);
}

void ComponentStateMachine::notePower(ComponentId id, PowerKind kind, double value) {
    ComponentRecord& rec = find_(id);
    if (kind == PowerKind::Active) rec.hw.activePowerW = value;
    else                           rec.hw.reactivePowerVar = value;
    rec.commanded.of(kind) = value;
}

void ComponentStateMachine::noteCommanded(ComponentId id, const PowerSetpoints& sp) {
    find_(id).commanded = sp;
}

} // namespace mgc
