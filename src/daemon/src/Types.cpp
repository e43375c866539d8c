/*
 * MicrogridControl — Component model (implementation)
 * (c) 2025 MicrogridControl contributors
 */
#include "include/Types.hpp"
#include "include/Utils.hpp"

namespace mgc {

using nlohmann::json;

bool Features::has(Capability c) const {
    switch (c) {
        case Capability::None:          return true;
        case Capability::DcRelay:       return hasDcRelay;
        case Capability::AcRelay:       return hasAcRelay;
        case Capability::Precharge:     return supportsPrecharge;
        case Capability::ActivePower:   return activeResolutionW.has_value();
        case Capability::ReactivePower: return reactiveResolutionVar.has_value();
    }
    return false;
}

std::optional<double> Features::resolutionFor(PowerKind kind) const {
    return kind == PowerKind::Active ? activeResolutionW : reactiveResolutionVar;
}

const char* toString(ComponentCategory c) {
    switch (c) {
        case ComponentCategory::Inverter:        return "inverter";
        case ComponentCategory::Battery:         return "battery";
        case ComponentCategory::Relay:           return "relay";
        case ComponentCategory::PrechargeModule: return "precharge";
        case ComponentCategory::Other:           return "other";
    }
    return "?";
}

const char* toString(LifecycleState s) {
    switch (s) {
        case LifecycleState::Unknown:     return "unknown";
        case LifecycleState::Stopped:     return "stopped";
        case LifecycleState::Standby:     return "standby";
        case LifecycleState::Operational: return "operational";
        case LifecycleState::Error:       return "error";
    }
    return "?";
}

const char* toString(Transition t) {
    switch (t) {
        case Transition::Start:   return "start";
        case Transition::Standby: return "standby";
        case Transition::Stop:    return "stop";
    }
    return "?";
}

const char* toString(PowerKind k) {
    return k == PowerKind::Active ? "active" : "reactive";
}

const char* toString(RelayKind r) {
    return r == RelayKind::Ac ? "AC" : "DC";
}

const char* toString(ErrorState e) {
    switch (e) {
        case ErrorState::None:        return "none";
        case ErrorState::Recoverable: return "recoverable";
        case ErrorState::Fatal:       return "fatal";
    }
    return "?";
}

const char* toString(Capability c) {
    switch (c) {
        case Capability::None:          return "none";
        case Capability::DcRelay:       return "dc-relay";
        case Capability::AcRelay:       return "ac-relay";
        case Capability::Precharge:     return "precharge";
        case Capability::ActivePower:   return "active-power";
        case Capability::ReactivePower: return "reactive-power";
    }
    return "?";
}

std::optional<ComponentCategory> categoryFromString(const std::string& s) {
    const std::string v = util::to_lower(util::trim(s));
    if (v == "inverter")                         return ComponentCategory::Inverter;
    if (v == "battery")                          return ComponentCategory::Battery;
    if (v == "relay")                            return ComponentCategory::Relay;
    if (v == "precharge" || v == "precharger" ||
        v == "precharge_module")                 return ComponentCategory::PrechargeModule;
    if (v == "other")                            return ComponentCategory::Other;
    return std::nullopt;
}

std::optional<ErrorState> errorStateFromString(const std::string& s) {
    const std::string v = util::to_lower(util::trim(s));
    if (v.empty() || v == "none") return ErrorState::None;
    if (v == "recoverable")       return ErrorState::Recoverable;
    if (v == "fatal")             return ErrorState::Fatal;
    return std::nullopt;
}

RelayKind mainRelayOf(const Features& f) {
    return (f.hasDcRelay && !f.hasAcRelay) ? RelayKind::Dc : RelayKind::Ac;
}

/* ----------------------------------------------------------------------------
 * json (de)serialization
 * ----------------------------------------------------------------------------*/

void to_json(json& j, const Features& f) {
    j = json{
        {"dcRelay",   f.hasDcRelay},
        {"acRelay",   f.hasAcRelay},
        {"precharge", f.supportsPrecharge}
    };
    if (f.activeResolutionW)     j["activeResolutionW"]     = *f.activeResolutionW;
    if (f.reactiveResolutionVar) j["reactiveResolutionVar"] = *f.reactiveResolutionVar;
}

void from_json(const json& j, Features& f) {
    if (j.contains("dcRelay"))   j.at("dcRelay").get_to(f.hasDcRelay);
    if (j.contains("acRelay"))   j.at("acRelay").get_to(f.hasAcRelay);
    if (j.contains("precharge")) j.at("precharge").get_to(f.supportsPrecharge);
    if (j.contains("activeResolutionW") && !j.at("activeResolutionW").is_null())
        f.activeResolutionW = j.at("activeResolutionW").get<double>();
    if (j.contains("reactiveResolutionVar") && !j.at("reactiveResolutionVar").is_null())
        f.reactiveResolutionVar = j.at("reactiveResolutionVar").get<double>();
}

void to_json(json& j, const HardwareState& h) {
    j = json{
        {"acRelayClosed",    h.acRelayClosed},
        {"dcRelayClosed",    h.dcRelayClosed},
        {"prechargeActive",  h.prechargeActive},
        {"activePowerW",     h.activePowerW},
        {"reactivePowerVar", h.reactivePowerVar}
    };
}

void from_json(const json& j, HardwareState& h) {
    if (j.contains("acRelayClosed"))    j.at("acRelayClosed").get_to(h.acRelayClosed);
    if (j.contains("dcRelayClosed"))    j.at("dcRelayClosed").get_to(h.dcRelayClosed);
    if (j.contains("prechargeActive"))  j.at("prechargeActive").get_to(h.prechargeActive);
    if (j.contains("activePowerW"))     j.at("activePowerW").get_to(h.activePowerW);
    if (j.contains("reactivePowerVar")) j.at("reactivePowerVar").get_to(h.reactivePowerVar);
}

} // namespace mgc
