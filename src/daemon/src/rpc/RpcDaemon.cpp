/*
 * MicrogridControl — RPC: daemon control
 * (c) 2025 MicrogridControl contributors
 */
#include <nlohmann/json.hpp>

#include "rpc/RpcHandlers.hpp"
#include "include/Daemon.hpp"
#include "include/Log.hpp"

namespace mgc {

using nlohmann::json;

void BindRpcDaemon(Daemon& self, CommandRegistry& reg) {
    // daemon.shutdown: live setpoints are reverted to 0 on the way out
    reg.add(
        "daemon.shutdown",
        "Shutdown daemon gracefully",
        [&self](const RpcRequest& rq) -> RpcResult {
            LOG_INFO("rpc daemon.shutdown");
            self.requestStop();
            return ok_(rq, "daemon.shutdown", json{{"status", "stopping"}});
        }
    );
}

} // namespace mgc
