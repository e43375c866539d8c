/*
 * MicrogridControl — RPC: time-limited power setpoints
 * (c) 2025 MicrogridControl contributors
 */
#include <nlohmann/json.hpp>

#include "rpc/RpcHandlers.hpp"
#include "rpc/RpcParams.hpp"
#include "include/ControlSession.hpp"
#include "include/Log.hpp"
#include "include/Utils.hpp"

namespace mgc {

using nlohmann::json;

void BindRpcPower(ControlSession& session, CommandRegistry& reg) {
    // Params: { componentId, power (W), lifetimeS? (10..900, default 60) }
    reg.add(
        "component.setPowerActive",
        "Set active power (W); reverts to 0 unless refreshed within lifetimeS",
        [&session](const RpcRequest& rq) -> RpcResult {
            return rpcp::guarded(rq, "component.setPowerActive", [&](const json& p) {
                const ComponentId id = rpcp::componentId(p);
                const double watts   = rpcp::number(p, "power", id);
                const auto life      = rpcp::lifetime(p, id);
                const TimePoint until = session.setComponentPowerActive(id, watts, life);
                return json{{"validUntil", util::to_iso8601(until)}};
            });
        }
    );

    // Params: { componentId, power (VAr), lifetimeS? }
    reg.add(
        "component.setPowerReactive",
        "Set reactive power (VAr); reverts to 0 unless refreshed within lifetimeS",
        [&session](const RpcRequest& rq) -> RpcResult {
            return rpcp::guarded(rq, "component.setPowerReactive", [&](const json& p) {
                const ComponentId id = rpcp::componentId(p);
                const double var     = rpcp::number(p, "power", id);
                const auto life      = rpcp::lifetime(p, id);
                const TimePoint until = session.setComponentPowerReactive(id, var, life);
                return json{{"validUntil", util::to_iso8601(until)}};
            });
        }
    );
}

} // namespace mgc
