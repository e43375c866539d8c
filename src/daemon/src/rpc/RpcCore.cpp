/*
 * MicrogridControl — RPC: core bindings (ping/version)
 * "commands" and "help" are registry built-ins.
 * (c) 2025 MicrogridControl contributors
 */
#include <nlohmann/json.hpp>

#include "rpc/RpcHandlers.hpp"
#include "include/Log.hpp"
#include "include/Utils.hpp"
#include "include/Version.hpp"

namespace mgc {

using nlohmann::json;

void BindRpcCore(CommandRegistry& reg) {
    // Liveness probe
    reg.add(
        "ping",
        "Liveness probe",
        [](const RpcRequest& rq) -> RpcResult {
            LOG_TRACE("rpc ping");
            return ok_(rq, "ping", json{{"pong", true}, {"time", util::utc_iso8601()}});
        }
    );

    reg.add(
        "version",
        "Return daemon/rpc version info",
        [](const RpcRequest& rq) -> RpcResult {
            LOG_TRACE("rpc version");
            return ok_(rq, "version", json{
                {"name",    "MicrogridControl"},
                {"version", MGCD_VERSION},
                {"rpc",     "2.0"}
            });
        }
    );
}

} // namespace mgc
