/*
 * MicrogridControl — Power command watchdog (header)
 * - One live setpoint per (component, power kind), reverted to 0 W/VAr when not refreshed
 * (c) 2025 MicrogridControl contributors
 */
#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <utility>
#include <vector>

#include "Types.hpp"
#include "TimeSource.hpp"
#include "ComponentDriver.hpp"
#include "ComponentLocks.hpp"

namespace mgc {

struct PowerCommand {
    ComponentId id{0};
    PowerKind   kind{PowerKind::Active};
    double      magnitude{0.0};
    TimePoint   expiresAt{};
};

class PowerWatchdog {
public:
    static constexpr std::chrono::seconds kMinLifetime{10};
    static constexpr std::chrono::minutes kMaxLifetime{15};
    static constexpr std::chrono::seconds kDefaultLifetime{60};
    static constexpr std::chrono::seconds kRevertRetry{1};

    PowerWatchdog(IComponentDriver& driver, ComponentLocks& locks, const TimeSource& clock);
    ~PowerWatchdog();

    PowerWatchdog(const PowerWatchdog&) = delete;
    PowerWatchdog& operator=(const PowerWatchdog&) = delete;

    /* Starts the dispatcher thread; `maxSleep` bounds how long it waits between checks. */
    void start(Duration maxSleep = Duration(50));

    /* Joins the dispatcher and drops every pending revert (session teardown). */
    void stop();

    /* Throws ControlError(InvalidArgument) unless lifetime lies in [10 s, 15 min]. */
    static Duration checkedLifetime(ComponentId id, std::optional<Duration> lifetime);

    /* |magnitude| floored to a multiple of `resolution`, sign preserved. */
    static double floorToResolution(double magnitude, double resolution);

    /*
     * Caller holds the component lock.
     * Floors the magnitude, issues the driver setpoint and, on success,
     * replaces any live command for (id, kind) and (re)arms its revert.
     * On driver failure throws ControlError(DriverError) and keeps the
     * previous command. Returns the new expiry.
     */
    TimePoint setPower(ComponentId id, PowerKind kind, double magnitude,
                       std::optional<Duration> lifetime, double resolution);

    /* Caller holds the component lock. Forgets the command without touching hardware. */
    void clear(ComponentId id, PowerKind kind);

    /*
     * Caller holds the component lock. Drives the live command to 0 right
     * away; when the driver refuses, the command stays armed and the revert
     * is retried by the dispatcher. False when nothing was reverted.
     */
    bool revertNow(ComponentId id, PowerKind kind);

    std::optional<PowerCommand> command(ComponentId id, PowerKind kind) const;
    std::optional<TimePoint>    nextDeadline() const;

    /* Reverts every command whose deadline has passed; returns how many were reverted. */
    size_t expireDue();

    /* Drives every live command to 0 right away (shutdown). Caller holds no component lock. */
    size_t revertAll();

private:
    using Key = std::pair<ComponentId, PowerKind>;

    struct Entry {
        PowerCommand  cmd;
        std::uint64_t generation{0};
        TimePoint     deadline{};   // moves forward when a revert has to be retried
    };

    struct Pending {
        TimePoint     deadline;
        Key           key;
        std::uint64_t generation;
        bool operator>(const Pending& o) const { return deadline > o.deadline; }
    };

    void loop_();
    bool revert_(const Pending& p);
    bool revertHeld_(const Pending& p, const char* why);

    IComponentDriver& driver_;
    ComponentLocks&   locks_;
    const TimeSource& clock_;

    mutable std::mutex mtx_;
    std::map<Key, Entry> live_;
    std::priority_queue<Pending, std::vector<Pending>, std::greater<Pending>> heap_;
    std::uint64_t nextGeneration_{1};

    std::condition_variable cv_;
    std::atomic<bool> running_{false};
    Duration          maxSleep_{50};
    std::thread       thr_;
};

} // namespace mgc
