/*
 * MicrogridControl — Simulated component driver (implementation)
 * (c) 2025 MicrogridControl contributors
 */
#include "include/SimulatedDriver.hpp"
#include "include/Log.hpp"
#include "include/Utils.hpp"

#include <cmath>

namespace mgc {

using nlohmann::json;

SimulatedDriver::SimulatedDriver(const TimeSource& clock)
: clock_(clock) {}

bool SimulatedDriver::loadInventory(const std::string& path, std::string& err) {
    std::string perr;
    json doc = util::read_json_file(path, &perr);
    if (doc.is_discarded()) {
        err = perr;
        return false;
    }
    if (!loadInventoryJson(doc, err)) {
        err = path + ": " + err;
        return false;
    }
    LOG_INFO("sim: loaded %zu component(s) from %s", size(), path.c_str());
    return true;
}

bool SimulatedDriver::loadInventoryJson(const json& doc, std::string& err) {
    if (!doc.is_object() || !doc.contains("components") || !doc["components"].is_array()) {
        err = "inventory must be an object with a 'components' array";
        return false;
    }

    std::map<ComponentId, SimComponent> next;
    size_t index = 0;
    for (const auto& e : doc["components"]) {
        const std::string where = "components[" + std::to_string(index++) + "]";
        try {
            if (!e.is_object() || !e.contains("id") || !e["id"].is_number_unsigned()) {
                err = where + ": missing or invalid 'id'";
                return false;
            }
            SimComponent c;
            c.info.id = e["id"].get<ComponentId>();

            const auto cat = categoryFromString(e.value("category", std::string{}));
            if (!cat) {
                err = where + ": unknown category '" + e.value("category", std::string{}) + "'";
                return false;
            }
            c.info.category = *cat;
            c.info.name     = e.value("name", "component-" + std::to_string(c.info.id));
            if (e.contains("features")) e["features"].get_to(c.info.features);

            if (e.contains("state")) {
                const json& st = e["state"];
                st.get_to(c.hw);
                if (st.contains("error")) {
                    const auto es = errorStateFromString(st["error"].get<std::string>());
                    if (!es) {
                        err = where + ": unknown error state '" + st["error"].get<std::string>() + "'";
                        return false;
                    }
                    c.error = *es;
                }
            }
            const int pms = e.value("prechargeMs", kDefaultPrechargeMs);
            if (pms < 0) {
                err = where + ": prechargeMs must be >= 0";
                return false;
            }
            c.prechargeTime = Duration(pms);
            c.unreachable   = e.value("unreachable", false);
            c.failing       = e.value("failing", false);

            if (!next.emplace(c.info.id, std::move(c)).second) {
                err = where + ": duplicate id " + std::to_string(e["id"].get<ComponentId>());
                return false;
            }
        } catch (const json::exception& ex) {
            err = where + ": " + ex.what();
            return false;
        }
    }

    std::lock_guard<std::mutex> lock(mtx_);
    comps_.swap(next);
    return true;
}

bool SimulatedDriver::addComponent(const ComponentInfo& info, const HardwareState& hw,
                                   ErrorState error, int prechargeMs) {
    std::lock_guard<std::mutex> lock(mtx_);
    SimComponent c;
    c.info = info;
    c.hw = hw;
    c.error = error;
    c.prechargeTime = Duration(prechargeMs);
    return comps_.emplace(info.id, std::move(c)).second;
}

void SimulatedDriver::advance(TimePoint now) {
    std::lock_guard<std::mutex> lock(mtx_);
    for (auto& kv : comps_) {
        SimComponent& c = kv.second;
        if (c.prechargeDoneAt && now >= *c.prechargeDoneAt) {
            c.prechargeDoneAt.reset();
            c.hw.prechargeActive = false;
            c.hw.dcRelayClosed = true;
            LOG_DEBUG("sim: %llu precharge complete, DC relay closed", (unsigned long long)kv.first);
        }
    }
}

void SimulatedDriver::setUnreachable(ComponentId id, bool on) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = comps_.find(id);
    if (it != comps_.end()) it->second.unreachable = on;
}

void SimulatedDriver::setFailing(ComponentId id, bool on) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = comps_.find(id);
    if (it != comps_.end()) it->second.failing = on;
}

void SimulatedDriver::setErrorState(ComponentId id, ErrorState e) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = comps_.find(id);
    if (it != comps_.end()) it->second.error = e;
}

size_t SimulatedDriver::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return comps_.size();
}

std::vector<ComponentInfo> SimulatedDriver::listComponents() {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<ComponentInfo> out;
    out.reserve(comps_.size());
    for (const auto& kv : comps_) out.push_back(kv.second.info);
    return out;
}

std::optional<Features> SimulatedDriver::getFeatures(ComponentId id) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = comps_.find(id);
    if (it == comps_.end() || it->second.unreachable) return std::nullopt;
    return it->second.info.features;
}

std::optional<HardwareState> SimulatedDriver::getHardwareState(ComponentId id) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = comps_.find(id);
    if (it == comps_.end() || it->second.unreachable) return std::nullopt;
    return it->second.hw;
}

std::optional<ErrorState> SimulatedDriver::getErrorState(ComponentId id) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = comps_.find(id);
    if (it == comps_.end() || it->second.unreachable) return std::nullopt;
    return it->second.error;
}

SimulatedDriver::SimComponent* SimulatedDriver::commandable_(ComponentId id, std::string& err) {
    auto it = comps_.find(id);
    if (it == comps_.end()) {
        err = "no such component";
        return nullptr;
    }
    if (it->second.unreachable) {
        err = "component unreachable";
        return nullptr;
    }
    if (it->second.failing) {
        err = "command rejected by device";
        return nullptr;
    }
    return &it->second;
}

bool SimulatedDriver::setRelay(ComponentId id, RelayKind relay, bool closed, std::string& err) {
    std::lock_guard<std::mutex> lock(mtx_);
    SimComponent* c = commandable_(id, err);
    if (!c) return false;

    const bool present = relay == RelayKind::Ac ? c->info.features.hasAcRelay : c->info.features.hasDcRelay;
    if (!present) {
        err = std::string("no ") + toString(relay) + " relay";
        return false;
    }
    if (relay == RelayKind::Ac) {
        c->hw.acRelayClosed = closed;
    } else {
        c->hw.dcRelayClosed = closed;
        if (!closed) {
            c->hw.prechargeActive = false;
            c->prechargeDoneAt.reset();
        }
    }
    LOG_DEBUG("sim: %llu %s relay %s", (unsigned long long)id, toString(relay), closed ? "closed" : "open");
    return true;
}

bool SimulatedDriver::setPower(ComponentId id, PowerKind kind, double magnitude, std::string& err) {
    std::lock_guard<std::mutex> lock(mtx_);
    SimComponent* c = commandable_(id, err);
    if (!c) return false;
    if (!std::isfinite(magnitude)) {
        err = "non-finite setpoint";
        return false;
    }
    if (kind == PowerKind::Active) c->hw.activePowerW = magnitude;
    else                           c->hw.reactivePowerVar = magnitude;
    LOG_DEBUG("sim: %llu %s power %.1f", (unsigned long long)id, toString(kind), magnitude);
    return true;
}

bool SimulatedDriver::ackError(ComponentId id, std::string& err) {
    std::lock_guard<std::mutex> lock(mtx_);
    SimComponent* c = commandable_(id, err);
    if (!c) return false;
    if (c->error == ErrorState::Fatal) {
        err = "fatal error cannot be cleared";
        return false;
    }
    c->error = ErrorState::None;
    return true;
}

bool SimulatedDriver::startPrecharge(ComponentId id, std::string& err) {
    std::lock_guard<std::mutex> lock(mtx_);
    SimComponent* c = commandable_(id, err);
    if (!c) return false;
    if (!c->info.features.supportsPrecharge) {
        err = "precharge not supported";
        return false;
    }
    if (c->hw.dcRelayClosed || c->hw.prechargeActive) return true;

    c->hw.prechargeActive = true;
    c->prechargeDoneAt = clock_.now() + c->prechargeTime;
    LOG_DEBUG("sim: %llu precharge started (%lld ms)",
              (unsigned long long)id, (long long)c->prechargeTime.count());
    return true;
}

} // namespace mgc
