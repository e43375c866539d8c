/*
 * MicrogridControl — Simulated component driver (header)
 * - In-memory hardware backed by an inventory JSON file
 * (c) 2025 MicrogridControl contributors
 */
#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "Types.hpp"
#include "ComponentDriver.hpp"
#include "TimeSource.hpp"

namespace mgc {

/*
 * Relay and power commands take effect immediately. Precharge completes
 * (DC relay closes) once `prechargeMs` has elapsed and advance() runs.
 * Components flagged unreachable fail every read; failing ones reject
 * every command.
 */
class SimulatedDriver : public IComponentDriver {
public:
    static constexpr int kDefaultPrechargeMs = 2000;

    explicit SimulatedDriver(const TimeSource& clock);

    /* Replaces the inventory; false with `err` on I/O, parse or validation errors. */
    bool loadInventory(const std::string& path, std::string& err);
    bool loadInventoryJson(const nlohmann::json& doc, std::string& err);

    /* Adds one component; false if the id is taken. */
    bool addComponent(const ComponentInfo& info, const HardwareState& hw = {},
                      ErrorState error = ErrorState::None, int prechargeMs = kDefaultPrechargeMs);

    /* Completes due precharges. */
    void advance(TimePoint now);

    // Fault injection
    void setUnreachable(ComponentId id, bool on);
    void setFailing(ComponentId id, bool on);
    void setErrorState(ComponentId id, ErrorState e);

    size_t size() const;

    // IComponentDriver
    std::vector<ComponentInfo>   listComponents() override;
    std::optional<Features>      getFeatures(ComponentId id) override;
    std::optional<HardwareState> getHardwareState(ComponentId id) override;
    std::optional<ErrorState>    getErrorState(ComponentId id) override;

    bool setRelay(ComponentId id, RelayKind relay, bool closed, std::string& err) override;
    bool setPower(ComponentId id, PowerKind kind, double magnitude, std::string& err) override;
    bool ackError(ComponentId id, std::string& err) override;
    bool startPrecharge(ComponentId id, std::string& err) override;

private:
    struct SimComponent {
        ComponentInfo            info;
        HardwareState            hw;
        ErrorState               error{ErrorState::None};
        Duration                 prechargeTime{kDefaultPrechargeMs};
        std::optional<TimePoint> prechargeDoneAt;
        bool                     unreachable{false};
        bool                     failing{false};
    };

    /* Looks up a component that accepts commands; fills `err` otherwise. */
    SimComponent* commandable_(ComponentId id, std::string& err);

    const TimeSource& clock_;
    mutable std::mutex mtx_;
    std::map<ComponentId, SimComponent> comps_;
};

} // namespace mgc
