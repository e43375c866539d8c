/*
 * MicrogridControl — RPC: metric bounds
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

void BindRpcBounds(ControlSession& session, CommandRegistry& reg) {
    // Params: { componentId, metric, bounds: [[lo, hi], ...], validity? }
    reg.add(
        "component.addBounds",
        "Merge inclusion bounds for a metric; returns the shared expiry",
        [&session](const RpcRequest& rq) -> RpcResult {
            return rpcp::guarded(rq, "component.addBounds", [&](const json& p) {
                const ComponentId id     = rpcp::componentId(p);
                const Metric metric      = rpcp::metric(p, id);
                const auto bounds        = rpcp::bounds(p, id);
                const ValidityDuration v = rpcp::validity(p, id);
                const TimePoint expires  = session.addComponentBounds(id, metric, bounds, v);
                return json{{"expiresAt", util::to_iso8601(expires)}};
            });
        }
    );
}

} // namespace mgc
