/*
 * MicrogridControl — Power command watchdog (implementation)
 * (c) 2025 MicrogridControl contributors
 *
 * Notes:
 * - Pending reverts live in a min-heap keyed by deadline. A heap entry is only
 *   acted on if the live table still holds the same generation, so refreshing
 *   a command simply supersedes the old entry instead of searching the heap.
 * - The dispatcher takes the component lock before touching a command, the
 *   table lock is never held across a driver call.
 */
#include "include/PowerWatchdog.hpp"
#include "include/ControlError.hpp"
#include "include/Log.hpp"
#include "include/Utils.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace mgc {

PowerWatchdog::PowerWatchdog(IComponentDriver& driver, ComponentLocks& locks, const TimeSource& clock)
: driver_(driver), locks_(locks), clock_(clock) {}

PowerWatchdog::~PowerWatchdog() {
    stop();
}

void PowerWatchdog::start(Duration maxSleep) {
    if (running_.exchange(true)) return;
    maxSleep_ = maxSleep.count() > 0 ? maxSleep : Duration(50);
    thr_ = std::thread([this]{ this->loop_(); });
    LOG_DEBUG("watchdog: dispatcher started (maxSleep=%lldms)", (long long)maxSleep_.count());
}

void PowerWatchdog::stop() {
    if (running_.exchange(false)) {
        cv_.notify_all();
        if (thr_.joinable()) thr_.join();
        LOG_DEBUG("watchdog: dispatcher stopped");
    }

    std::lock_guard<std::mutex> lock(mtx_);
    if (!live_.empty()) {
        LOG_INFO("watchdog: cancelling %zu pending revert(s)", live_.size());
    }
    live_.clear();
    heap_ = decltype(heap_){};
}

Duration PowerWatchdog::checkedLifetime(ComponentId id, std::optional<Duration> lifetime) {
    if (!lifetime) return std::chrono::duration_cast<Duration>(kDefaultLifetime);
    if (*lifetime < kMinLifetime || *lifetime > kMaxLifetime) {
        throw ControlError(ErrorCode::InvalidArgument, id,
                           "request lifetime " + std::to_string(lifetime->count()) +
                           "ms outside [10s, 15min]");
    }
    return *lifetime;
}

double PowerWatchdog::floorToResolution(double magnitude, double resolution) {
    if (!(resolution > 0.0)) return magnitude;
    // Tolerate representation error on exact multiples (e.g. 0.3 / 0.1).
    const double steps   = std::floor(std::fabs(magnitude) / resolution + 1e-9);
    const double floored = steps * resolution;
    if (floored == 0.0) return 0.0;
    return magnitude < 0.0 ? -floored : floored;
}

TimePoint PowerWatchdog::setPower(ComponentId id, PowerKind kind, double magnitude,
                                  std::optional<Duration> lifetime, double resolution) {
    const Duration life = checkedLifetime(id, lifetime);
    if (!std::isfinite(magnitude)) {
        throw ControlError(ErrorCode::InvalidArgument, id, "power setpoint must be finite");
    }

    const double value = floorToResolution(magnitude, resolution);

    std::string err;
    if (!driver_.setPower(id, kind, value, err)) {
        LOG_WARN("watchdog: %llu set %s power %.1f failed: %s",
                 (unsigned long long)id, toString(kind), value, err.c_str());
        throw ControlError(ErrorCode::DriverError, id,
                           std::string("set ") + toString(kind) + " power failed: " + err,
                           "set power");
    }

    const TimePoint expiresAt = clock_.now() + life;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        const Key key{id, kind};
        Entry& e = live_[key];
        e.cmd        = PowerCommand{id, kind, value, expiresAt};
        e.generation = nextGeneration_++;
        e.deadline   = expiresAt;
        heap_.push(Pending{expiresAt, key, e.generation});
    }
    cv_.notify_all();

    if (value != magnitude) {
        LOG_DEBUG("watchdog: %llu %s %.3f floored to %.3f (resolution %.3f)",
                  (unsigned long long)id, toString(kind), magnitude, value, resolution);
    }
    LOG_INFO("watchdog: %llu %s power <- %.1f until %s",
             (unsigned long long)id, toString(kind), value, util::to_iso8601(expiresAt).c_str());
    return expiresAt;
}

void PowerWatchdog::clear(ComponentId id, PowerKind kind) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (live_.erase(Key{id, kind})) {
        LOG_DEBUG("watchdog: %llu %s command cleared", (unsigned long long)id, toString(kind));
    }
}

std::optional<PowerCommand> PowerWatchdog::command(ComponentId id, PowerKind kind) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = live_.find(Key{id, kind});
    if (it == live_.end()) return std::nullopt;
    return it->second.cmd;
}

std::optional<TimePoint> PowerWatchdog::nextDeadline() const {
    std::lock_guard<std::mutex> lock(mtx_);
    if (heap_.empty()) return std::nullopt;
    return heap_.top().deadline;
}

size_t PowerWatchdog::expireDue() {
    const TimePoint now = clock_.now();

    std::vector<Pending> due;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        while (!heap_.empty() && heap_.top().deadline <= now) {
            due.push_back(heap_.top());
            heap_.pop();
        }
    }

    size_t reverted = 0;
    for (const auto& p : due) {
        if (revert_(p)) ++reverted;
    }
    return reverted;
}

size_t PowerWatchdog::revertAll() {
    std::vector<Pending> live;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        for (const auto& kv : live_) {
            live.push_back(Pending{kv.second.deadline, kv.first, kv.second.generation});
        }
    }

    size_t reverted = 0;
    for (const auto& p : live) {
        if (revert_(p)) ++reverted;
    }
    return reverted;
}

bool PowerWatchdog::revertNow(ComponentId id, PowerKind kind) {
    Pending p{};
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = live_.find(Key{id, kind});
        if (it == live_.end()) return false;
        p = Pending{it->second.deadline, it->first, it->second.generation};
    }
    return revertHeld_(p, "withdrawn");
}

bool PowerWatchdog::revert_(const Pending& p) {
    auto guard = locks_.acquire(p.key.first);
    return revertHeld_(p, "expired");
}

bool PowerWatchdog::revertHeld_(const Pending& p, const char* why) {
    const ComponentId id   = p.key.first;
    const PowerKind   kind = p.key.second;

    auto stillLive = [&]() -> Entry* {
        auto it = live_.find(p.key);
        if (it == live_.end()) return nullptr;
        if (it->second.generation != p.generation || it->second.deadline != p.deadline) return nullptr;
        return &it->second;
    };

    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!stillLive()) return false; // refreshed or cleared meanwhile
    }

    std::string err;
    if (!driver_.setPower(id, kind, 0.0, err)) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (Entry* e = stillLive()) {
            e->deadline = clock_.now() + kRevertRetry;
            heap_.push(Pending{e->deadline, p.key, e->generation});
        }
        LOG_ERROR("watchdog: %llu %s revert to 0 failed: %s (retry in %llds)",
                  (unsigned long long)id, toString(kind), err.c_str(), (long long)kRevertRetry.count());
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (stillLive()) live_.erase(p.key);
    }
    LOG_INFO("watchdog: %llu %s command %s -> reverted to 0", (unsigned long long)id, toString(kind), why);
    return true;
}

void PowerWatchdog::loop_() {
    while (running_.load(std::memory_order_relaxed)) {
        (void)expireDue();

        std::unique_lock<std::mutex> lock(mtx_);
        if (!running_.load(std::memory_order_relaxed)) break;

        Duration sleep = maxSleep_;
        if (!heap_.empty()) {
            const auto until = std::chrono::duration_cast<Duration>(heap_.top().deadline - clock_.now());
            sleep = std::clamp(until, Duration(1), maxSleep_);
        }
        cv_.wait_for(lock, sleep);
    }
}

} // namespace mgc
