/*
 * MicrogridControl — Daemon (implementation)
 * (c) 2025 MicrogridControl contributors
 */
#include "include/Daemon.hpp"
#include "include/Log.hpp"
#include "include/Utils.hpp"
#include "rpc/RpcHandlers.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <thread>

namespace fs = std::filesystem;

namespace mgc {

Daemon::Daemon()
: driver_(std::make_unique<SimulatedDriver>(clock_)),
  session_(std::make_unique<ControlSession>(*driver_, clock_)),
  rpcRegistry_(std::make_unique<CommandRegistry>())
{
    LOG_TRACE("daemon: ctor");
    BindDaemonRpcCommands(*this, *rpcRegistry_);
}

Daemon::~Daemon() {
    LOG_TRACE("daemon: dtor");
    shutdown();
}

bool Daemon::loadInventory_() {
    const std::string& path = cfg_.inventoryPath;
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) {
        LOG_WARN("daemon: no inventory at '%s'; starting without components", path.c_str());
        return true;
    }
    std::string err;
    if (!driver_->loadInventory(path, err)) {
        LOG_ERROR("daemon: inventory: %s", err.c_str());
        return false;
    }
    return true;
}

bool Daemon::init(const DaemonConfig& cfg) {
    LOG_INFO("daemon: init start");
    cfg_ = cfg;
    startedMs_ = util::now_ms();
    stop_.store(false);

    if (!loadInventory_()) return false;

    const size_t n = session_->discover();
    session_->start(Duration(cfg_.watchdogMaxSleepMs));
    LOG_INFO("daemon: %zu component(s) under control", n);

    rpcServer_ = std::make_unique<RpcTcpServer>(*rpcRegistry_,
                     cfg_.host.empty() ? std::string("127.0.0.1") : cfg_.host,
                     static_cast<unsigned short>(cfg_.port));
    if (!rpcServer_->start()) {
        LOG_ERROR("daemon: rpc server start failed");
        session_->shutdown();
        rpcServer_.reset();
        return false;
    }
    LOG_INFO("daemon: init done (rpc on %s:%u)", cfg_.host.c_str(), (unsigned)rpcServer_->port());

    running_.store(true, std::memory_order_relaxed);
    return true;
}

long long Daemon::uptimeMs() const {
    return startedMs_ ? util::now_ms() - startedMs_ : 0;
}

void Daemon::runLoop() {
    LOG_INFO("daemon: runLoop enter");
    using clock = std::chrono::steady_clock;
    using std::chrono::milliseconds;

    auto nextTick  = clock::now();
    auto lastPoll  = clock::now();
    auto lastSweep = clock::now();

    constexpr int kSleepMinMs = 1;   // avoid 0ms busy spin
    constexpr int kSleepMaxMs = 50;  // keep responsiveness for stop requests

    while (running_.load(std::memory_order_relaxed) && !stop_.load(std::memory_order_relaxed)) {
        auto now = clock::now();

        // Simulated hardware progresses (precharge completion)
        if (now >= nextTick) {
            driver_->advance(clock_.now());
            nextTick = now + milliseconds(cfg_.tickMs);
        }

        // Reachability, reported faults, settling of pending transitions
        if (now - lastPoll >= milliseconds(cfg_.pollMs)) {
            (void)session_->pollHardware();
            lastPoll = now;
        }

        if (now - lastSweep >= milliseconds(cfg_.sweepMs)) {
            const size_t dropped = session_->sweepBounds();
            if (dropped) LOG_DEBUG("daemon: swept %zu expired bounds set(s)", dropped);
            lastSweep = now;
        }

        auto nextDue = std::min({nextTick, lastPoll + milliseconds(cfg_.pollMs),
                                 lastSweep + milliseconds(cfg_.sweepMs)});
        long sleepMs = std::chrono::duration_cast<milliseconds>(nextDue - now).count();
        sleepMs = std::clamp<long>(sleepMs, kSleepMinMs, kSleepMaxMs);
        std::this_thread::sleep_for(milliseconds(sleepMs));
    }

    LOG_INFO("daemon: run loop end");
}

void Daemon::shutdown() {
    if (!running_.exchange(false)) return;
    LOG_INFO("daemon: shutdown");

    if (rpcServer_) {
        LOG_DEBUG("daemon: stopping rpc");
        rpcServer_->stop();
        rpcServer_.reset();
    }

    // live setpoints go back to 0 before the adapter disappears
    session_->shutdown();
    LOG_INFO("daemon: shutdown complete");
}

} // namespace mgc
