/*
 * MicrogridControl — RPC binders (declarations)
 * (c) 2025 MicrogridControl contributors
 */
#pragma once

#include "include/CommandRegistry.hpp"

namespace mgc {

class Daemon;
class ControlSession;

// Registers every daemon RPC command into the given registry.
void BindDaemonRpcCommands(Daemon& self, CommandRegistry& reg);

// Individual binders
void BindRpcCore(CommandRegistry& reg);
void BindRpcDaemon(Daemon& self, CommandRegistry& reg);
void BindRpcComponents(ControlSession& session, CommandRegistry& reg);
void BindRpcPower(ControlSession& session, CommandRegistry& reg);
void BindRpcBounds(ControlSession& session, CommandRegistry& reg);

} // namespace mgc
