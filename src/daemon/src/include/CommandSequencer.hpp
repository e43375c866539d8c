/*
 * MicrogridControl — Command sequencer (header)
 * - Executes an action plan step by step against the driver, skipping satisfied steps
 * (c) 2025 MicrogridControl contributors
 */
#pragma once

#include "ActionPlan.hpp"
#include "ComponentDriver.hpp"
#include "Types.hpp"

namespace mgc {

struct SequenceOutcome {
    size_t executed{0};      // driver commands issued
    size_t skipped{0};       // steps already satisfied or lacking an optional capability
    bool   pending{false};   // an asynchronous step is still in flight (precharge)
};

class CommandSequencer {
public:
    explicit CommandSequencer(IComponentDriver& driver);

    /*
     * Runs `plan` for component `id`. `hw` must hold a fresh hardware read;
     * it is updated after every confirmed step so a failure leaves it at the
     * last completed step (no rollback). `commanded` holds the live
     * setpoints; a power-zero step resets the kinds it drove to 0.
     *
     * Throws ControlError:
     *  - InvalidArgument    a non-optional step needs a capability the component lacks
     *  - PreconditionFailed a Verify step does not hold
     *  - DriverError        a driver command failed (step name attached)
     */
    SequenceOutcome run(ComponentId id, ComponentCategory category, const Features& features,
                        const ActionPlan& plan, HardwareState& hw, PowerSetpoints& commanded);

    /* True when the step has nothing left to do for this snapshot. */
    static bool satisfied(StepKind kind, const Features& f, const HardwareState& hw,
                          const PowerSetpoints& commanded);

private:
    void checkCapabilities_(ComponentId id, ComponentCategory category, const Features& f,
                            const ActionPlan& plan) const;
    void runSteps_(ComponentId id, ComponentCategory category, const Features& f, const ActionPlan& plan,
                   HardwareState& hw, PowerSetpoints& commanded, SequenceOutcome& out);
    void execute_(ComponentId id, ComponentCategory category, const Features& f, const PlanStep& step,
                  HardwareState& hw, PowerSetpoints& commanded, SequenceOutcome& out);
    void zeroPower_(ComponentId id, const PlanStep& step, PowerKind kind,
                    HardwareState& hw, PowerSetpoints& commanded);
    void relay_(ComponentId id, const PlanStep& step, RelayKind relay, bool closed, HardwareState& hw);

    IComponentDriver& driver_;
};

} // namespace mgc
