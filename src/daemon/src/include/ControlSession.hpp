/*
 * MicrogridControl — Control session (facade)
 * - Entry point for the RPC layer; composes state machine, bounds and power watchdog
 * (c) 2025 MicrogridControl contributors
 */
#pragma once

#include <atomic>
#include <optional>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "Types.hpp"
#include "Bounds.hpp"
#include "ComponentDriver.hpp"
#include "ComponentLocks.hpp"
#include "PowerWatchdog.hpp"
#include "StateMachine.hpp"
#include "TimeSource.hpp"

namespace mgc {

/* Everything the status query reports for one component. */
struct ComponentStatus {
    ComponentRecord                                    record;
    std::optional<PowerCommand>                        activeCommand;
    std::optional<PowerCommand>                        reactiveCommand;
    std::vector<std::pair<Metric, std::vector<Bound>>> bounds;
};

void to_json(nlohmann::json& j, const ComponentStatus& s);

/*
 * One running control plane. Owns the three engines; every operation runs
 * under the target component's lock so requests for one component are
 * serialized while different components proceed in parallel.
 * All operations throw ControlError.
 */
class ControlSession {
public:
    ControlSession(IComponentDriver& driver, const TimeSource& clock);
    ~ControlSession();

    ControlSession(const ControlSession&) = delete;
    ControlSession& operator=(const ControlSession&) = delete;

    /* Registers every component the driver lists; returns the count. */
    size_t discover();
    void   registerComponent(const ComponentInfo& info);

    /* Starts background expiry; `maxSleep` bounds the dispatcher wait. */
    void start(Duration maxSleep = Duration(50));

    /* Drives live setpoints back to 0 and cancels every pending timer (idempotent). */
    void shutdown();

    TimePoint addComponentBounds(ComponentId id, Metric metric, const std::vector<Bound>& bounds,
                                 ValidityDuration validity = ValidityDuration::Unspecified);

    TimePoint setComponentPowerActive(ComponentId id, double watts,
                                      std::optional<Duration> lifetime = std::nullopt);
    TimePoint setComponentPowerReactive(ComponentId id, double var,
                                        std::optional<Duration> lifetime = std::nullopt);

    void startComponent(ComponentId id);
    void putComponentInStandby(ComponentId id);
    void stopComponent(ComponentId id);
    void ackComponentError(ComponentId id);

    /* Inbound measurement; returns whether it lies within the active bounds. */
    bool onSample(ComponentId id, Metric metric, double value);

    /* Asynchronous hardware report from the driver side. */
    void onHardwareState(ComponentId id, const HardwareState& hw);

    /* Re-reads every component (unreachable/error/settling); returns reachable count. */
    size_t pollHardware();

    /* Proactive removal of expired bounds. */
    size_t sweepBounds();

    ComponentStatus status(ComponentId id);
    std::vector<ComponentId> componentIds() const;

    // Engine access for tests and the daemon loop
    ComponentStateMachine& stateMachine() noexcept { return machine_; }
    BoundsMerger&          bounds()       noexcept { return bounds_; }
    PowerWatchdog&         watchdog()     noexcept { return watchdog_; }

private:
    TimePoint setPower_(ComponentId id, PowerKind kind, double magnitude, std::optional<Duration> lifetime);
    void      syncCommanded_(ComponentId id);
    void      settleCommands_(ComponentId id, bool withdraw);
    template <typename Fn>
    void      transition_(ComponentId id, bool withdraw, Fn&& fn);

    IComponentDriver&     driver_;
    const TimeSource&     clock_;
    ComponentLocks        locks_;
    ComponentStateMachine machine_;
    BoundsMerger          bounds_;
    PowerWatchdog         watchdog_;
    std::atomic<bool>     shutDown_{false};
};

} // namespace mgc
