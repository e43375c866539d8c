/*
 * MicrogridControl — RPC binder (thin aggregator)
 * (c) 2025 MicrogridControl contributors
 */
#include "rpc/RpcHandlers.hpp"
#include "include/Daemon.hpp"
#include "include/Log.hpp"

namespace mgc {

// Keep this file tiny; all handlers live in src/rpc/*
void BindDaemonRpcCommands(Daemon& self, CommandRegistry& reg) {
    LOG_TRACE("rpc: binding commands");

    BindRpcCore(reg);
    BindRpcDaemon(self, reg);

    BindRpcComponents(self.session(), reg);
    BindRpcPower(self.session(), reg);
    BindRpcBounds(self.session(), reg);

    LOG_DEBUG("rpc: %zu commands bound", reg.size());
}

} // namespace mgc
