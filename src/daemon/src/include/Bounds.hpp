/*
 * MicrogridControl — Bounds merger (header)
 * - Per (component, metric) inclusion intervals with merge-on-insert and expiry
 * (c) 2025 MicrogridControl contributors
 */
#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "Types.hpp"
#include "TimeSource.hpp"

namespace mgc {

enum class Metric {
    Unspecified,
    AcActivePower,
    AcReactivePower,
    AcApparentPower,
    AcCurrent,
    AcVoltage,
    AcFrequency,
    DcPower,
    DcCurrent,
    DcVoltage,
    BatterySocPct,
    BatteryCapacity,
    Temperature
};

const char* toString(Metric m);
std::optional<Metric> metricFromString(const std::string& s);

/* Zero is always within range for these, whatever the configured bounds. */
bool isPowerMetric(Metric m);

enum class ValidityDuration {
    Unspecified,   // treated as 5 s
    FiveSeconds,
    OneMinute,
    FiveMinutes,
    FifteenMinutes
};

Duration toDuration(ValidityDuration v);
std::optional<ValidityDuration> validityFromString(const std::string& s);

/* Closed interval [lower, upper]. A point (lower == upper) is valid. */
struct Bound {
    double lower{0.0};
    double upper{0.0};

    bool contains(double v) const { return v >= lower && v <= upper; }
    bool operator==(const Bound& o) const { return lower == o.lower && upper == o.upper; }
};

void to_json(nlohmann::json& j, const Bound& b);

/*
 * Sorts by lower bound and merges every interval whose lower bound is
 * <= the running upper bound (touching intervals merge). O(n log n).
 */
std::vector<Bound> mergeBounds(std::vector<Bound> in);

class BoundsMerger {
public:
    explicit BoundsMerger(const TimeSource& clock);

    /*
     * Merges `bounds` into the active set of (id, metric) and returns the new
     * expiry shared by every interval of the set. Empty input is a no-op that
     * returns the current expiry, or now if nothing is active.
     * Throws ControlError(InvalidArgument) on malformed bounds or metric.
     */
    TimePoint addBounds(ComponentId id, Metric metric,
                        const std::vector<Bound>& bounds,
                        ValidityDuration validity = ValidityDuration::Unspecified);

    /* Drops the set if expired, then checks membership (0 W always passes for power). */
    bool validate(ComponentId id, Metric metric, double value);

    /* Currently active (non-expired) intervals. */
    std::vector<Bound> activeBounds(ComponentId id, Metric metric);
    std::optional<TimePoint> expiry(ComponentId id, Metric metric);

    /* Removes every expired set; returns how many were dropped. */
    size_t sweep();

    /* All non-expired sets of one component (status reporting). */
    std::vector<std::pair<Metric, std::vector<Bound>>> snapshot(ComponentId id);

private:
    struct MetricBounds {
        std::vector<Bound> intervals;
        TimePoint          expiresAt{};
    };
    using Key = std::pair<ComponentId, Metric>;

    bool expiredUnlocked(const MetricBounds& mb, TimePoint now) const { return now >= mb.expiresAt; }

    const TimeSource& clock_;
    mutable std::mutex mtx_;
    std::map<Key, MetricBounds> sets_;
};

} // namespace mgc
