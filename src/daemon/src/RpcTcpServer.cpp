/*
 * MicrogridControl — RPC TCP server (implementation)
 * (c) 2025 MicrogridControl contributors
 */
#include "include/RpcTcpServer.hpp"
#include "include/CommandRegistry.hpp"
#include "include/Log.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace mgc {

// Both loops wake this often to notice stop().
static constexpr int kPollMs = 200;

static inline void set_nonblock_(int fd) {
    int fl = ::fcntl(fd, F_GETFL, 0);
    if (fl < 0) return;
    (void)::fcntl(fd, F_SETFL, fl | O_NONBLOCK);
}

static bool wait_readable_(int fd, int timeoutMs) {
    pollfd p{fd, POLLIN, 0};
    int r = ::poll(&p, 1, timeoutMs);
    return r > 0;
}

static bool send_all_(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                pollfd p{fd, POLLOUT, 0};
                if (::poll(&p, 1, 1000) <= 0) return false;
                continue;
            }
            return false;
        }
        off += static_cast<size_t>(n);
    }
    return true;
}

RpcTcpServer::RpcTcpServer(CommandRegistry& reg, const std::string& host, unsigned short port,
                           size_t maxClients)
: reg_(reg), host_(host), port_(port), maxClients_(maxClients) {}

RpcTcpServer::~RpcTcpServer() {
    stop();
}

bool RpcTcpServer::start() {
    if (running_.load()) return true;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port   = htons(port_);
    const std::string bindHost = host_ == "localhost" ? "127.0.0.1" : host_;
    if (::inet_pton(AF_INET, bindHost.c_str(), &addr.sin_addr) != 1) {
        LOG_ERROR("rpc: invalid bind address '%s'", host_.c_str());
        return false;
    }

    listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listenFd_ < 0) {
        LOG_ERROR("rpc: socket() failed: %s", std::strerror(errno));
        return false;
    }

    int one = 1;
    (void)::setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    if (::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        LOG_ERROR("rpc: bind(%s:%u) failed: %s", host_.c_str(), port_, std::strerror(errno));
        ::close(listenFd_);
        listenFd_ = -1;
        return false;
    }
    if (::listen(listenFd_, 16) < 0) {
        LOG_ERROR("rpc: listen() failed: %s", std::strerror(errno));
        ::close(listenFd_);
        listenFd_ = -1;
        return false;
    }
    socklen_t alen = sizeof(addr);
    if (::getsockname(listenFd_, reinterpret_cast<sockaddr*>(&addr), &alen) == 0) {
        port_ = ntohs(addr.sin_port);
    }
    set_nonblock_(listenFd_);

    running_.store(true);
    try {
        thr_ = std::thread([this]{ acceptLoop_(); });
    } catch (const std::exception& ex) {
        LOG_ERROR("rpc: failed to start thread: %s", ex.what());
        ::close(listenFd_);
        listenFd_ = -1;
        running_.store(false);
        return false;
    }

    LOG_INFO("rpc: listening on %s:%u", host_.c_str(), port_);
    return true;
}

void RpcTcpServer::stop() {
    if (!running_.exchange(false)) return;

    if (thr_.joinable()) thr_.join();
    if (listenFd_ >= 0) {
        ::close(listenFd_);
        listenFd_ = -1;
    }

    std::list<std::unique_ptr<Client>> clients;
    {
        std::lock_guard<std::mutex> lock(clientsMtx_);
        clients.swap(clients_);
    }
    for (auto& cl : clients) {
        ::shutdown(cl->fd, SHUT_RDWR);
        if (cl->thr.joinable()) cl->thr.join();
        ::close(cl->fd);
    }

    LOG_INFO("rpc: stopped");
}

void RpcTcpServer::reapFinished_() {
    std::lock_guard<std::mutex> lock(clientsMtx_);
    for (auto it = clients_.begin(); it != clients_.end();) {
        if ((*it)->done.load()) {
            if ((*it)->thr.joinable()) (*it)->thr.join();
            ::close((*it)->fd);
            LOG_DEBUG("rpc: client disconnected (fd=%d)", (*it)->fd);
            it = clients_.erase(it);
        } else {
            ++it;
        }
    }
}

void RpcTcpServer::acceptLoop_() {
    while (running_.load()) {
        reapFinished_();
        if (!wait_readable_(listenFd_, kPollMs)) continue;

        sockaddr_in cli{};
        socklen_t clilen = sizeof(cli);
        int cfd = ::accept(listenFd_, reinterpret_cast<sockaddr*>(&cli), &clilen);
        if (cfd < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                LOG_WARN("rpc: accept() failed: %s", std::strerror(errno));
            }
            continue;
        }

        std::lock_guard<std::mutex> lock(clientsMtx_);
        if (clients_.size() >= maxClients_) {
            LOG_WARN("rpc: client limit (%zu) reached, rejecting fd=%d", maxClients_, cfd);
            ::close(cfd);
            continue;
        }
        auto cl = std::make_unique<Client>();
        cl->fd = cfd;
        Client* raw = cl.get();
        try {
            raw->thr = std::thread([this, raw]{ serve_(*raw); });
        } catch (const std::exception& ex) {
            LOG_ERROR("rpc: cannot spawn client thread: %s", ex.what());
            ::close(cfd);
            continue;
        }
        clients_.push_back(std::move(cl));
        LOG_DEBUG("rpc: client connected (fd=%d)", cfd);
    }
}

void RpcTcpServer::serve_(Client& cl) {
    std::string acc;
    char buf[4096];

    while (running_.load()) {
        if (!wait_readable_(cl.fd, kPollMs)) continue;

        ssize_t n = ::recv(cl.fd, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        acc.append(buf, buf + n);

        bool alive = true;
        for (;;) {
            auto pos = acc.find('\n');
            if (pos == std::string::npos) break;
            std::string line = acc.substr(0, pos);
            acc.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty()) continue;

            std::string reply = reg_.handleLine(line);
            reply.push_back('\n');
            if (!send_all_(cl.fd, reply)) { alive = false; break; }
        }
        if (!alive) break;

        if (acc.size() > kMaxLineBytes) {
            LOG_WARN("rpc: fd=%d exceeded %zu bytes without newline, closing", cl.fd, kMaxLineBytes);
            break;
        }
    }
    cl.done.store(true);
}

} // namespace mgc
