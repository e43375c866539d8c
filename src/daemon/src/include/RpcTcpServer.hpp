/*
 * MicrogridControl — RPC TCP server (header)
 * Newline-delimited JSON-RPC 2.0 over TCP.
 * One acceptor thread; each connection is served by its own thread so
 * independent callers are handled concurrently.
 * (c) 2025 MicrogridControl contributors
 */
#pragma once

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace mgc {

class CommandRegistry;

class RpcTcpServer {
public:
    RpcTcpServer(CommandRegistry& reg, const std::string& host, unsigned short port,
                 size_t maxClients = 64);
    ~RpcTcpServer();

    RpcTcpServer(const RpcTcpServer&) = delete;
    RpcTcpServer& operator=(const RpcTcpServer&) = delete;

    /* Binds and starts the acceptor; false (and logged) on failure. */
    bool start();
    void stop();

    bool running() const { return running_.load(); }

    /* Actual bound port (useful when 0 was requested). */
    unsigned short port() const { return port_; }

private:
    struct Client {
        int               fd{-1};
        std::thread       thr;
        std::atomic<bool> done{false};
    };

    static constexpr size_t kMaxLineBytes = 1 << 20;

    void acceptLoop_();
    void serve_(Client& cl);
    void reapFinished_();

    CommandRegistry& reg_;
    std::string      host_;
    unsigned short   port_{0};
    size_t           maxClients_;

    std::atomic<bool> running_{false};
    int               listenFd_{-1};
    std::thread       thr_;

    std::mutex                          clientsMtx_;
    std::list<std::unique_ptr<Client>>  clients_;
};

} // namespace mgc
