/*
 * MicrogridControl — RPC parameter helpers (shared by rpc/Rpc*.cpp)
 * (c) 2025 MicrogridControl contributors
 */
#pragma once

#include <cmath>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "include/Bounds.hpp"
#include "include/CommandRegistry.hpp"
#include "include/ControlError.hpp"
#include "include/Types.hpp"

namespace mgc { namespace rpcp {

using nlohmann::json;

[[noreturn]] inline void badParam(const std::string& msg, ComponentId id = 0) {
    throw ControlError(ErrorCode::InvalidArgument, id, msg);
}

inline ComponentId componentId(const json& p) {
    if (!p.contains("componentId")) badParam("missing 'componentId'");
    const json& v = p["componentId"];
    if (!v.is_number_unsigned()) badParam("'componentId' must be a non-negative integer");
    return v.get<ComponentId>();
}

inline double number(const json& p, const char* key, ComponentId id) {
    if (!p.contains(key)) badParam(std::string("missing '") + key + "'", id);
    const json& v = p[key];
    if (!v.is_number()) badParam(std::string("'") + key + "' must be a number", id);
    return v.get<double>();
}

/* lifetimeS: seconds, fractional allowed; absent or null means the default. */
inline std::optional<Duration> lifetime(const json& p, ComponentId id) {
    if (!p.contains("lifetimeS") || p["lifetimeS"].is_null()) return std::nullopt;
    const json& v = p["lifetimeS"];
    if (!v.is_number()) badParam("'lifetimeS' must be a number", id);
    const double s = v.get<double>();
    if (!std::isfinite(s)) badParam("'lifetimeS' must be finite", id);
    if (s < 10.0 || s > 900.0) badParam("'lifetimeS' " + v.dump() + " outside [10, 900] seconds", id);
    return Duration(static_cast<Duration::rep>(std::llround(s * 1000.0)));
}

/* Unknown names are NotFound; a missing metric is InvalidArgument. */
inline Metric metric(const json& p, ComponentId id) {
    if (!p.contains("metric") || !p["metric"].is_string()) badParam("missing 'metric'", id);
    const std::string name = p["metric"].get<std::string>();
    auto m = metricFromString(name);
    if (!m) throw ControlError(ErrorCode::NotFound, id, "unknown metric '" + name + "'");
    return *m;
}

/* validity: "5s" | "1m"/"60s" | "5m"/"300s" | "15m"/"900s" | "unspecified", or seconds (5, 60, 300, 900). */
inline ValidityDuration validity(const json& p, ComponentId id) {
    if (!p.contains("validity") || p["validity"].is_null()) return ValidityDuration::Unspecified;
    const json& v = p["validity"];
    if (v.is_string()) {
        if (auto d = validityFromString(v.get<std::string>())) return *d;
    } else if (v.is_number()) {
        const double s = v.get<double>();
        if (s == 5.0)   return ValidityDuration::FiveSeconds;
        if (s == 60.0)  return ValidityDuration::OneMinute;
        if (s == 300.0) return ValidityDuration::FiveMinutes;
        if (s == 900.0) return ValidityDuration::FifteenMinutes;
    }
    badParam("unsupported 'validity' " + v.dump() + " (5s, 1m, 5m or 15m)", id);
}

/* bounds: [[lo, hi], ...] or [{"lower": lo, "upper": hi}, ...] */
inline std::vector<Bound> bounds(const json& p, ComponentId id) {
    if (!p.contains("bounds") || !p["bounds"].is_array()) badParam("'bounds' must be an array", id);
    std::vector<Bound> out;
    out.reserve(p["bounds"].size());
    for (const auto& b : p["bounds"]) {
        if (b.is_array() && b.size() == 2 && b[0].is_number() && b[1].is_number()) {
            out.push_back(Bound{b[0].get<double>(), b[1].get<double>()});
        } else if (b.is_object() && b.contains("lower") && b.contains("upper") &&
                   b["lower"].is_number() && b["upper"].is_number()) {
            out.push_back(Bound{b["lower"].get<double>(), b["upper"].get<double>()});
        } else {
            badParam("malformed bound " + b.dump(), id);
        }
    }
    return out;
}

/*
 * Runs `fn(params)` and turns control errors into the error envelope.
 * Handlers only need to produce the success payload.
 */
template <typename Fn>
RpcResult guarded(const RpcRequest& rq, const char* method, Fn&& fn) {
    try {
        return ok_(rq, method, fn(paramsAsObject(rq)));
    } catch (const ControlError& e) {
        return errFromControlError(rq, method, e);
    } catch (const json::exception& e) {
        return err_(rq, method, rpc_code::InvalidArgument, std::string("invalid params: ") + e.what());
    }
}

}} // namespace mgc::rpcp
