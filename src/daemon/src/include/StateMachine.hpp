/*
 * MicrogridControl — Component state machine (header)
 * - Lifecycle per component; validates transitions and drives the sequencer
 * (c) 2025 MicrogridControl contributors
 */
#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "Types.hpp"
#include "ComponentDriver.hpp"
#include "CommandSequencer.hpp"

namespace mgc {

struct ComponentRecord {
    ComponentInfo   info;
    LifecycleState  lifecycle{LifecycleState::Unknown};
    HardwareState   hw;
    ErrorState      error{ErrorState::None};
    bool            reachable{true};
    PowerSetpoints  commanded;

    // Target of an asynchronous transition that has not settled yet.
    std::optional<LifecycleState> pending;
};

/*
 * Every mutating call expects the caller to hold the component's lock
 * (ComponentLocks); the machine itself only guards its record table.
 */
class ComponentStateMachine {
public:
    explicit ComponentStateMachine(IComponentDriver& driver);

    /* Adds a discovered component; re-registering keeps the lifecycle. */
    void registerComponent(const ComponentInfo& info);

    bool                   contains(ComponentId id) const;
    std::vector<ComponentId> ids() const;

    /* Copy of the record; throws ControlError(NotFound). */
    ComponentRecord record(ComponentId id) const;

    void start(ComponentId id);
    void standby(ComponentId id);
    void stop(ComponentId id);
    void ackError(ComponentId id);

    /*
     * Re-reads hardware and error state from the driver: infers the lifecycle
     * of Unknown components, moves reported faults to Error and settles
     * pending asynchronous transitions. Returns false when unreachable.
     */
    bool refresh(ComponentId id);

    /* Applies an asynchronous hardware report. */
    void onHardwareState(ComponentId id, const HardwareState& hw);

    /* Records a power setpoint the driver accepted. */
    void notePower(ComponentId id, PowerKind kind, double value);

    /* Replaces the live setpoints the plans have to drive to 0 before a relay opens. */
    void noteCommanded(ComponentId id, const PowerSetpoints& sp);

private:
    ComponentRecord& find_(ComponentId id);
    void             readHardware_(ComponentRecord& rec);
    void             runPlan_(ComponentRecord& rec, Transition t);
    void             settle_(ComponentRecord& rec);

    IComponentDriver& driver_;
    CommandSequencer  sequencer_;

    // Records are never removed while the session lives; pointers stay valid.
    mutable std::mutex tableMtx_;
    std::map<ComponentId, std::unique_ptr<ComponentRecord>> records_;
};

} // namespace mgc
