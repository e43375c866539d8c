/*
 * MicrogridControl — Control session (implementation)
 * (c) 2025 MicrogridControl contributors
 */
#include "include/ControlSession.hpp"
#include "include/ControlError.hpp"
#include "include/Log.hpp"
#include "include/Utils.hpp"

namespace mgc {

using nlohmann::json;

ControlSession::ControlSession(IComponentDriver& driver, const TimeSource& clock)
: driver_(driver),
  clock_(clock),
  machine_(driver),
  bounds_(clock),
  watchdog_(driver, locks_, clock)
{
    LOG_TRACE("session: ctor");
}

ControlSession::~ControlSession() {
    shutdown();
}

size_t ControlSession::discover() {
    const auto inventory = driver_.listComponents();
    for (const auto& info : inventory) {
        registerComponent(info);
    }
    LOG_INFO("session: discovered %zu component(s)", inventory.size());
    return inventory.size();
}

void ControlSession::registerComponent(const ComponentInfo& info) {
    locks_.add(info.id);
    auto guard = locks_.acquire(info.id);
    machine_.registerComponent(info);
    (void)machine_.refresh(info.id);
}

void ControlSession::start(Duration maxSleep) {
    shutDown_.store(false);
    watchdog_.start(maxSleep);
    LOG_INFO("session: started");
}

void ControlSession::shutdown() {
    if (shutDown_.exchange(true)) return;
    const size_t reverted = watchdog_.revertAll();
    if (reverted) LOG_INFO("session: reverted %zu live setpoint(s) to 0", reverted);
    watchdog_.stop();
    LOG_INFO("session: shutdown complete");
}

// -----------------------------------------------------------------------------
// bounds
// -----------------------------------------------------------------------------

TimePoint ControlSession::addComponentBounds(ComponentId id, Metric metric, const std::vector<Bound>& bounds,
                                             ValidityDuration validity) {
    LOG_TRACE("session: addComponentBounds %llu %s n=%zu",
              (unsigned long long)id, toString(metric), bounds.size());
    auto guard = locks_.acquire(id);
    return bounds_.addBounds(id, metric, bounds, validity);
}

bool ControlSession::onSample(ComponentId id, Metric metric, double value) {
    auto guard = locks_.acquire(id);
    const bool ok = bounds_.validate(id, metric, value);
    if (!ok) {
        LOG_WARN("session: %llu %s=%.3f outside active bounds",
                 (unsigned long long)id, toString(metric), value);
    }
    return ok;
}

size_t ControlSession::sweepBounds() {
    return bounds_.sweep();
}

// -----------------------------------------------------------------------------
// power
// -----------------------------------------------------------------------------

TimePoint ControlSession::setPower_(ComponentId id, PowerKind kind, double magnitude,
                                    std::optional<Duration> lifetime) {
    LOG_TRACE("session: setPower %llu %s %.3f", (unsigned long long)id, toString(kind), magnitude);

    // Argument checks that need no component state come first.
    (void)PowerWatchdog::checkedLifetime(id, lifetime);

    auto guard = locks_.acquire(id);
    const ComponentRecord rec = machine_.record(id);
    if (!rec.reachable) {
        throw ControlError(ErrorCode::Unavailable, id, "component " + std::to_string(id) + " is unreachable");
    }
    const auto resolution = rec.info.features.resolutionFor(kind);
    if (!resolution) {
        throw ControlError(ErrorCode::InvalidArgument, id,
                           std::string("component does not support ") + toString(kind) + " power");
    }

    const TimePoint until = watchdog_.setPower(id, kind, magnitude, lifetime, *resolution);
    if (auto cmd = watchdog_.command(id, kind)) {
        machine_.notePower(id, kind, cmd->magnitude);
    }
    return until;
}

TimePoint ControlSession::setComponentPowerActive(ComponentId id, double watts, std::optional<Duration> lifetime) {
    return setPower_(id, PowerKind::Active, watts, lifetime);
}

TimePoint ControlSession::setComponentPowerReactive(ComponentId id, double var, std::optional<Duration> lifetime) {
    return setPower_(id, PowerKind::Reactive, var, lifetime);
}

void ControlSession::syncCommanded_(ComponentId id) {
    PowerSetpoints sp;
    for (PowerKind kind : {PowerKind::Active, PowerKind::Reactive}) {
        if (auto cmd = watchdog_.command(id, kind)) sp.of(kind) = cmd->magnitude;
    }
    machine_.noteCommanded(id, sp);
}

void ControlSession::settleCommands_(ComponentId id, bool withdraw) {
    const ComponentRecord rec = machine_.record(id);
    for (PowerKind kind : {PowerKind::Active, PowerKind::Reactive}) {
        auto cmd = watchdog_.command(id, kind);
        if (!cmd) continue;
        const bool zeroedByPlan = cmd->magnitude != 0.0 && rec.commanded.of(kind) == 0.0;
        if (zeroedByPlan || (withdraw && cmd->magnitude == 0.0)) {
            watchdog_.clear(id, kind);   // the driver already holds 0
        } else if (withdraw) {
            (void)watchdog_.revertNow(id, kind);
        }
    }
}

// -----------------------------------------------------------------------------
// lifecycle
// -----------------------------------------------------------------------------

template <typename Fn>
void ControlSession::transition_(ComponentId id, bool withdraw, Fn&& fn) {
    auto guard = locks_.acquire(id);
    syncCommanded_(id);
    try {
        fn();
    } catch (const ControlError&) {
        settleCommands_(id, false);
        throw;
    }
    settleCommands_(id, withdraw);
}

void ControlSession::startComponent(ComponentId id) {
    LOG_TRACE("session: start %llu", (unsigned long long)id);
    transition_(id, false, [&] { machine_.start(id); });
}

void ControlSession::putComponentInStandby(ComponentId id) {
    LOG_TRACE("session: standby %llu", (unsigned long long)id);
    transition_(id, true, [&] { machine_.standby(id); });
}

void ControlSession::stopComponent(ComponentId id) {
    LOG_TRACE("session: stop %llu", (unsigned long long)id);
    transition_(id, true, [&] { machine_.stop(id); });
}

void ControlSession::ackComponentError(ComponentId id) {
    LOG_TRACE("session: ackError %llu", (unsigned long long)id);
    auto guard = locks_.acquire(id);
    machine_.ackError(id);
}

// -----------------------------------------------------------------------------
// hardware reports / polling
// -----------------------------------------------------------------------------

void ControlSession::onHardwareState(ComponentId id, const HardwareState& hw) {
    auto guard = locks_.acquire(id);
    machine_.onHardwareState(id, hw);
}

size_t ControlSession::pollHardware() {
    size_t reachable = 0;
    for (ComponentId id : machine_.ids()) {
        auto guard = locks_.acquire(id);
        if (machine_.refresh(id)) ++reachable;
    }
    LOG_TRACE("session: poll done (%zu reachable)", reachable);
    return reachable;
}

// -----------------------------------------------------------------------------
// status
// -----------------------------------------------------------------------------

ComponentStatus ControlSession::status(ComponentId id) {
    auto guard = locks_.acquire(id);
    ComponentStatus s;
    s.record          = machine_.record(id);
    s.activeCommand   = watchdog_.command(id, PowerKind::Active);
    s.reactiveCommand = watchdog_.command(id, PowerKind::Reactive);
    s.bounds          = bounds_.snapshot(id);
    return s;
}

std::vector<ComponentId> ControlSession::componentIds() const {
    return machine_.ids();
}

static json commandJson(const std::optional<PowerCommand>& c) {
    if (!c) return nullptr;
    return json{{"power", c->magnitude}, {"validUntil", util::to_iso8601(c->expiresAt)}};
}

void to_json(json& j, const ComponentStatus& s) {
    const ComponentRecord& r = s.record;
    json bounds = json::object();
    for (const auto& mb : s.bounds) {
        bounds[toString(mb.first)] = mb.second;
    }
    j = json{
        {"componentId", r.info.id},
        {"name",        r.info.name},
        {"category",    toString(r.info.category)},
        {"features",    r.info.features},
        {"state",       toString(r.lifecycle)},
        {"pending",     r.pending ? json(toString(*r.pending)) : json(nullptr)},
        {"reachable",   r.reachable},
        {"error",       toString(r.error)},
        {"hardware",    r.hw},
        {"power",       json{{"active",   commandJson(s.activeCommand)},
                             {"reactive", commandJson(s.reactiveCommand)}}},
        {"bounds",      bounds}
    };
}

} // namespace mgc
