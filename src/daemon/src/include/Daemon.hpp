/*
 * MicrogridControl — Daemon (header)
 * - Owns the hardware adapter, the control session and the RPC server
 * (c) 2025 MicrogridControl contributors
 */
#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "Config.hpp"
#include "CommandRegistry.hpp"
#include "ControlSession.hpp"
#include "RpcTcpServer.hpp"
#include "SimulatedDriver.hpp"
#include "TimeSource.hpp"

namespace mgc {

class Daemon {
public:
    Daemon();
    ~Daemon();

    Daemon(const Daemon&) = delete;
    Daemon& operator=(const Daemon&) = delete;

    /* Loads the inventory, discovers components, binds RPC and starts serving. */
    bool init(const DaemonConfig& cfg);

    /* Blocks until requestStop(); drives precharge completion, polling and bounds sweep. */
    void runLoop();

    void requestStop() { stop_.store(true, std::memory_order_relaxed); }
    bool stopRequested() const noexcept { return stop_.load(std::memory_order_relaxed); }

    /* Stops RPC, reverts live setpoints and stops the watchdog (idempotent). */
    void shutdown();

    const DaemonConfig& config() const noexcept { return cfg_; }
    long long           uptimeMs() const;

    ControlSession&   session()     noexcept { return *session_; }
    SimulatedDriver&  driver()      noexcept { return *driver_; }
    CommandRegistry&  rpcRegistry() noexcept { return *rpcRegistry_; }

private:
    bool loadInventory_();

    DaemonConfig      cfg_{};
    SystemTimeSource  clock_;
    long long         startedMs_{0};

    std::atomic<bool> stop_{false};
    std::atomic<bool> running_{false};

    std::unique_ptr<SimulatedDriver>  driver_;
    std::unique_ptr<ControlSession>   session_;
    std::unique_ptr<CommandRegistry>  rpcRegistry_;
    std::unique_ptr<RpcTcpServer>     rpcServer_;
};

} // namespace mgc
