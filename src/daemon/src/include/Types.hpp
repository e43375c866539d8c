/*
 * MicrogridControl — Component model (header)
 * - Identity, category, feature flags and hardware snapshots shared by all engines
 * (c) 2025 MicrogridControl contributors
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mgc {

using ComponentId = std::uint64_t;

/* Wall-clock time; expiry timestamps are reported to callers as UTC. */
using TimePoint = std::chrono::system_clock::time_point;
using Duration  = std::chrono::milliseconds;

enum class ComponentCategory {
    Inverter,
    Battery,
    Relay,
    PrechargeModule,
    Other
};

enum class LifecycleState {
    Unknown,
    Stopped,
    Standby,
    Operational,
    Error
};

enum class Transition {
    Start,
    Standby,
    Stop
};

enum class PowerKind {
    Active,
    Reactive
};

enum class RelayKind {
    Ac,
    Dc
};

enum class ErrorState {
    None,
    Recoverable,
    Fatal
};

/* Capability flags a plan step may depend on. */
enum class Capability {
    None,
    DcRelay,
    AcRelay,
    Precharge,
    ActivePower,
    ReactivePower
};

struct Features {
    bool hasDcRelay{false};
    bool hasAcRelay{false};
    bool supportsPrecharge{false};

    // Empty = component does not accept setpoints of that kind; 0 = no flooring.
    std::optional<double> activeResolutionW;
    std::optional<double> reactiveResolutionVar;

    bool has(Capability c) const;
    std::optional<double> resolutionFor(PowerKind kind) const;
};

/* Last-known hardware substates of one component. */
struct HardwareState {
    bool   acRelayClosed{false};
    bool   dcRelayClosed{false};
    bool   prechargeActive{false};
    double activePowerW{0.0};
    double reactivePowerVar{0.0};

    bool relayClosed(RelayKind r) const { return r == RelayKind::Ac ? acRelayClosed : dcRelayClosed; }
    double power(PowerKind k) const { return k == PowerKind::Active ? activePowerW : reactivePowerVar; }
};

/* Setpoints issued through the control plane that are still live (0 when none). */
struct PowerSetpoints {
    double activeW{0.0};
    double reactiveVar{0.0};

    double& of(PowerKind k) { return k == PowerKind::Active ? activeW : reactiveVar; }
    double  of(PowerKind k) const { return k == PowerKind::Active ? activeW : reactiveVar; }
};

/* Inventory entry as discovered through the driver. */
struct ComponentInfo {
    ComponentId       id{0};
    ComponentCategory category{ComponentCategory::Other};
    std::string       name;
    Features          features;
};

const char* toString(ComponentCategory c);
const char* toString(LifecycleState s);
const char* toString(Transition t);
const char* toString(PowerKind k);
const char* toString(RelayKind r);
const char* toString(ErrorState e);
const char* toString(Capability c);

std::optional<ComponentCategory> categoryFromString(const std::string& s);
std::optional<ErrorState>        errorStateFromString(const std::string& s);

/* Relay driven by a plain Relay component: its DC relay if it only has that one, else AC. */
RelayKind mainRelayOf(const Features& f);

// JSON (de)serialization
void to_json(nlohmann::json& j, const Features& f);
void from_json(const nlohmann::json& j, Features& f);
void to_json(nlohmann::json& j, const HardwareState& h);
void from_json(const nlohmann::json& j, HardwareState& h);

} // namespace mgc
