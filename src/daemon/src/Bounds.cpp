/*
 * MicrogridControl — Bounds merger (implementation)
 * (c) 2025 MicrogridControl contributors
 */
#include "include/Bounds.hpp"
#include "include/ControlError.hpp"
#include "include/Log.hpp"
#include "include/Utils.hpp"

#include <algorithm>
#include <cmath>

namespace mgc {

using nlohmann::json;

// -----------------------------------------------------------------------------
// metric / validity tables
// -----------------------------------------------------------------------------

namespace {

struct MetricName {
    Metric      metric;
    const char* name;
};

constexpr MetricName kMetricNames[] = {
    {Metric::Unspecified,     "unspecified"},
    {Metric::AcActivePower,   "ac_active_power"},
    {Metric::AcReactivePower, "ac_reactive_power"},
    {Metric::AcApparentPower, "ac_apparent_power"},
    {Metric::AcCurrent,       "ac_current"},
    {Metric::AcVoltage,       "ac_voltage"},
    {Metric::AcFrequency,     "ac_frequency"},
    {Metric::DcPower,         "dc_power"},
    {Metric::DcCurrent,       "dc_current"},
    {Metric::DcVoltage,       "dc_voltage"},
    {Metric::BatterySocPct,   "battery_soc_pct"},
    {Metric::BatteryCapacity, "battery_capacity"},
    {Metric::Temperature,     "temperature"},
};

} // namespace

const char* toString(Metric m) {
    for (const auto& e : kMetricNames) {
        if (e.metric == m) return e.name;
    }
    return "?";
}

std::optional<Metric> metricFromString(const std::string& s) {
    const std::string v = util::to_lower(util::trim(s));
    for (const auto& e : kMetricNames) {
        if (v == e.name) return e.metric;
    }
    return std::nullopt;
}

bool isPowerMetric(Metric m) {
    return m == Metric::AcActivePower || m == Metric::AcReactivePower ||
           m == Metric::AcApparentPower || m == Metric::DcPower;
}

Duration toDuration(ValidityDuration v) {
    using namespace std::chrono;
    switch (v) {
        case ValidityDuration::Unspecified:
        case ValidityDuration::FiveSeconds:    return duration_cast<Duration>(seconds(5));
        case ValidityDuration::OneMinute:      return duration_cast<Duration>(minutes(1));
        case ValidityDuration::FiveMinutes:    return duration_cast<Duration>(minutes(5));
        case ValidityDuration::FifteenMinutes: return duration_cast<Duration>(minutes(15));
    }
    return duration_cast<Duration>(seconds(5));
}

std::optional<ValidityDuration> validityFromString(const std::string& s) {
    const std::string v = util::to_lower(util::trim(s));
    if (v.empty() || v == "unspecified") return ValidityDuration::Unspecified;
    if (v == "5s")                       return ValidityDuration::FiveSeconds;
    if (v == "1m"  || v == "60s")        return ValidityDuration::OneMinute;
    if (v == "5m"  || v == "300s")       return ValidityDuration::FiveMinutes;
    if (v == "15m" || v == "900s")       return ValidityDuration::FifteenMinutes;
    return std::nullopt;
}

void to_json(json& j, const Bound& b) {
    j = json::array({b.lower, b.upper});
}

// -----------------------------------------------------------------------------
// merge
// -----------------------------------------------------------------------------

std::vector<Bound> mergeBounds(std::vector<Bound> in) {
    if (in.size() < 2) return in;

    std::sort(in.begin(), in.end(), [](const Bound& a, const Bound& b) {
        return a.lower < b.lower || (a.lower == b.lower && a.upper < b.upper);
    });

    std::vector<Bound> out;
    out.reserve(in.size());
    Bound acc = in.front();
    for (size_t i = 1; i < in.size(); ++i) {
        const Bound& b = in[i];
        if (b.lower <= acc.upper) {
            acc.upper = std::max(acc.upper, b.upper);
        } else {
            out.push_back(acc);
            acc = b;
        }
    }
    out.push_back(acc);
    return out;
}

// -----------------------------------------------------------------------------
// BoundsMerger
// -----------------------------------------------------------------------------

BoundsMerger::BoundsMerger(const TimeSource& clock)
: clock_(clock) {}

TimePoint BoundsMerger::addBounds(ComponentId id, Metric metric,
                                  const std::vector<Bound>& bounds,
                                  ValidityDuration validity) {
    if (metric == Metric::Unspecified) {
        throw ControlError(ErrorCode::InvalidArgument, id, "bounds: metric must be specified");
    }
    for (const auto& b : bounds) {
        if (!std::isfinite(b.lower) || !std::isfinite(b.upper)) {
            throw ControlError(ErrorCode::InvalidArgument, id, "bounds: non-finite bound");
        }
        if (b.lower > b.upper) {
            throw ControlError(ErrorCode::InvalidArgument, id,
                               "bounds: lower " + std::to_string(b.lower) +
                               " > upper " + std::to_string(b.upper));
        }
    }

    const TimePoint now = clock_.now();
    std::lock_guard<std::mutex> lock(mtx_);

    auto it = sets_.find(Key{id, metric});
    if (it != sets_.end() && expiredUnlocked(it->second, now)) {
        LOG_DEBUG("bounds: %llu/%s expired before insert, dropping %zu interval(s)",
                  (unsigned long long)id, toString(metric), it->second.intervals.size());
        sets_.erase(it);
        it = sets_.end();
    }

    if (bounds.empty()) {
        return it != sets_.end() ? it->second.expiresAt : now;
    }

    std::vector<Bound> all;
    if (it != sets_.end()) all = it->second.intervals;
    all.insert(all.end(), bounds.begin(), bounds.end());

    MetricBounds& mb = sets_[Key{id, metric}];
    mb.intervals = mergeBounds(std::move(all));
    mb.expiresAt = now + toDuration(validity);

    LOG_INFO("bounds: %llu/%s +%zu -> %zu interval(s), expires %s",
             (unsigned long long)id, toString(metric), bounds.size(), mb.intervals.size(),
             util::to_iso8601(mb.expiresAt).c_str());
    return mb.expiresAt;
}

bool BoundsMerger::validate(ComponentId id, Metric metric, double value) {
    if (isPowerMetric(metric) && value == 0.0) return true;

    const TimePoint now = clock_.now();
    std::lock_guard<std::mutex> lock(mtx_);

    auto it = sets_.find(Key{id, metric});
    if (it == sets_.end()) return false;
    if (expiredUnlocked(it->second, now)) {
        sets_.erase(it);
        return false;
    }
    for (const auto& b : it->second.intervals) {
        if (b.contains(value)) return true;
    }
    return false;
}

std::vector<Bound> BoundsMerger::activeBounds(ComponentId id, Metric metric) {
    const TimePoint now = clock_.now();
    std::lock_guard<std::mutex> lock(mtx_);

    auto it = sets_.find(Key{id, metric});
    if (it == sets_.end()) return {};
    if (expiredUnlocked(it->second, now)) {
        sets_.erase(it);
        return {};
    }
    return it->second.intervals;
}

std::optional<TimePoint> BoundsMerger::expiry(ComponentId id, Metric metric) {
    const TimePoint now = clock_.now();
    std::lock_guard<std::mutex> lock(mtx_);

    auto it = sets_.find(Key{id, metric});
    if (it == sets_.end() || expiredUnlocked(it->second, now)) return std::nullopt;
    return it->second.expiresAt;
}

size_t BoundsMerger::sweep() {
    const TimePoint now = clock_.now();
    std::lock_guard<std::mutex> lock(mtx_);

    size_t dropped = 0;
    for (auto it = sets_.begin(); it != sets_.end();) {
        if (expiredUnlocked(it->second, now)) {
            LOG_DEBUG("bounds: sweep drops %llu/%s",
                      (unsigned long long)it->first.first, toString(it->first.second));
            it = sets_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    if (dropped) LOG_TRACE("bounds: sweep removed %zu expired set(s)", dropped);
    return dropped;
}

std::vector<std::pair<Metric, std::vector<Bound>>> BoundsMerger::snapshot(ComponentId id) {
    const TimePoint now = clock_.now();
    std::lock_guard<std::mutex> lock(mtx_);

    std::vector<std::pair<Metric, std::vector<Bound>>> out;
    for (auto it = sets_.lower_bound(Key{id, Metric::Unspecified});
         it != sets_.end() && it->first.first == id; ++it) {
        if (!expiredUnlocked(it->second, now)) out.emplace_back(it->first.second, it->second.intervals);
    }
    return out;
}

} // namespace mgc
