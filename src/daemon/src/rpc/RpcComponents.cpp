/*
 * MicrogridControl — RPC: component lifecycle (start/standby/stop/ackError/status)
 * (c) 2025 MicrogridControl contributors
 */
#include <nlohmann/json.hpp>

#include "rpc/RpcHandlers.hpp"
#include "rpc/RpcParams.hpp"
#include "include/ControlSession.hpp"
#include "include/Log.hpp"

namespace mgc {

using nlohmann::json;

void BindRpcComponents(ControlSession& session, CommandRegistry& reg) {
    // Params for all transitions: { componentId }
    reg.add(
        "component.start",
        "Bring a component to operational",
        [&session](const RpcRequest& rq) -> RpcResult {
            return rpcp::guarded(rq, "component.start", [&](const json& p) {
                const ComponentId id = rpcp::componentId(p);
                LOG_TRACE("rpc component.start %llu", (unsigned long long)id);
                session.startComponent(id);
                return json::object();
            });
        }
    );

    reg.add(
        "component.standby",
        "Put an operational component in standby",
        [&session](const RpcRequest& rq) -> RpcResult {
            return rpcp::guarded(rq, "component.standby", [&](const json& p) {
                const ComponentId id = rpcp::componentId(p);
                LOG_TRACE("rpc component.standby %llu", (unsigned long long)id);
                session.putComponentInStandby(id);
                return json::object();
            });
        }
    );

    reg.add(
        "component.stop",
        "Stop a component",
        [&session](const RpcRequest& rq) -> RpcResult {
            return rpcp::guarded(rq, "component.stop", [&](const json& p) {
                const ComponentId id = rpcp::componentId(p);
                LOG_TRACE("rpc component.stop %llu", (unsigned long long)id);
                session.stopComponent(id);
                return json::object();
            });
        }
    );

    reg.add(
        "component.ackError",
        "Acknowledge a recoverable component error",
        [&session](const RpcRequest& rq) -> RpcResult {
            return rpcp::guarded(rq, "component.ackError", [&](const json& p) {
                const ComponentId id = rpcp::componentId(p);
                LOG_TRACE("rpc component.ackError %llu", (unsigned long long)id);
                session.ackComponentError(id);
                return json::object();
            });
        }
    );

    reg.add(
        "component.status",
        "Lifecycle, hardware snapshot, live setpoints and bounds of a component",
        [&session](const RpcRequest& rq) -> RpcResult {
            return rpcp::guarded(rq, "component.status", [&](const json& p) {
                const ComponentId id = rpcp::componentId(p);
                return json(session.status(id));
            });
        }
    );
}

} // namespace mgc
