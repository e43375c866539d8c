/*
 * MicrogridControl — Daemon entry (main)
 * (c) 2025 MicrogridControl contributors
 */
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include "include/Version.hpp"
#include "include/Config.hpp"
#include "include/Daemon.hpp"
#include "include/CommandRegistry.hpp"
#include "include/Log.hpp"
#include "include/Utils.hpp"

namespace fs = std::filesystem;
using mgc::Daemon;
using mgc::DaemonConfig;

static std::atomic<bool> gStop{false};
static void sig_handler(int) { gStop.store(true); }

static void usage(const char* exe) {
    std::cout <<
        "MicrogridControl daemon (mgcd) " << MGCD_VERSION << "\n"
        "Usage: " << exe << " [options]\n"
        "Options:\n"
        "  --config PATH         Path to daemon.json (default: ~/.config/MicrogridControl/daemon.json)\n"
        "  --inventory PATH      Component inventory JSON (default: ~/.config/MicrogridControl/inventory.json)\n"
        "  --host IP             RPC host (default: 127.0.0.1)\n"
        "  --port N              RPC port (default: 8787)\n"
        "  --logfile PATH        Log file path (default: /var/log/mgc/mgcd.log or /tmp/mgcd.log)\n"
        "  --pidfile PATH        PID file path (default: /run/mgcd.pid or /tmp/mgcd.pid)\n"
        "  --foreground          Do not daemonize; run in foreground\n"
        "  --debug               Verbose logging\n"
        "  --cmds                Print RPC command list and exit (no IO)\n"
        "  -h,--help             Show this help\n";
}

static bool write_pidfile(const std::string& path, pid_t pid, std::string& err) {
    err.clear();
    mgc::util::ensure_parent_dirs(path);
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) { err = "open pidfile failed"; return false; }
    char buf[64];
    int n = std::snprintf(buf, sizeof(buf), "%d\n", (int)pid);
    if (::write(fd, buf, (size_t)n) != n) { ::close(fd); err = "write pidfile failed"; return false; }
    ::close(fd);
    return true;
}

static bool daemonize() {
    pid_t pid = fork();
    if (pid < 0) return false;
    if (pid > 0) _exit(0);

    if (setsid() < 0) return false;
    pid = fork();
    if (pid < 0) return false;
    if (pid > 0) _exit(0);

    umask(022);
    if (chdir("/") != 0) return false;

    int nullfd = ::open("/dev/null", O_RDWR);
    if (nullfd >= 0) {
        dup2(nullfd, STDIN_FILENO);
        dup2(nullfd, STDOUT_FILENO);
        dup2(nullfd, STDERR_FILENO);
        if (nullfd > STDERR_FILENO) ::close(nullfd);
    }
    return true;
}

static void print_commands_pretty(mgc::CommandRegistry& reg) {
    const auto entries = reg.list();
    std::fprintf(stdout, "Available RPC commands (%zu):\n", entries.size());
    for (const auto& e : entries) {
        std::fprintf(stdout, "  %-28s  %s\n", e.name.c_str(), e.help.c_str());
    }
}

static void install_signals() {
    std::signal(SIGINT,  sig_handler);
    std::signal(SIGTERM, sig_handler);
    std::signal(SIGHUP,  sig_handler);
    std::signal(SIGPIPE, SIG_IGN);
}

static bool parse_port(const std::string& s, int& out) {
    try {
        size_t idx = 0;
        int v = std::stoi(s, &idx, 10);
        if (idx != s.size() || v <= 0 || v > 65535) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

int main(int argc, char** argv) {
    std::string cfgPath, inventory, host, portStr, logfile, pidfile;
    bool foreground = false;
    bool debug = false;
    bool listCmds = false;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&](const char* what) -> std::string {
            if (i + 1 >= argc) { std::cerr << "missing value for " << what << "\n"; std::exit(2); }
            return argv[++i];
        };
        if      (a == "--config")     cfgPath   = next("--config");
        else if (a == "--inventory")  inventory = next("--inventory");
        else if (a == "--host")       host      = next("--host");
        else if (a == "--port")       portStr   = next("--port");
        else if (a == "--logfile")    logfile   = next("--logfile");
        else if (a == "--pidfile")    pidfile   = next("--pidfile");
        else if (a == "--foreground") foreground = true;
        else if (a == "--debug")      debug = true;
        else if (a == "--cmds")       listCmds = true;
        else if (a == "-h" || a == "--help") { usage(argv[0]); return 0; }
        else {
            std::cerr << "unknown arg: " << a << "\n";
            usage(argv[0]);
            return 2;
        }
    }

    // --cmds: list RPC commands without touching config or the filesystem
    if (listCmds) {
        mgc::Logger::instance().setLevel(mgc::LogLevel::Error);
        Daemon dummy;
        print_commands_pretty(dummy.rpcRegistry());
        return 0;
    }

    std::string loadErr;
    DaemonConfig cfg = mgc::loadDaemonConfig(cfgPath, &loadErr);
    if (!loadErr.empty()) std::cerr << "[warn] load config: " << loadErr << "\n";

    // CLI wins over daemon.json and environment
    if (!inventory.empty()) cfg.inventoryPath = mgc::util::expandUserPath(inventory);
    if (!host.empty())      cfg.host = host;
    if (!logfile.empty())   cfg.logfile = mgc::util::expandUserPath(logfile);
    if (!pidfile.empty())   cfg.pidfile = mgc::util::expandUserPath(pidfile);
    if (!portStr.empty() && !parse_port(portStr, cfg.port)) {
        std::cerr << "invalid --port: " << portStr << "\n";
        return 2;
    }
    if (debug) cfg.debug = true;

    std::string verr;
    if (!mgc::validateConfig(cfg, verr)) {
        std::cerr << "invalid configuration: " << verr << "\n";
        return 2;
    }

    install_signals();

    if (!foreground && !daemonize()) {
        std::cerr << "daemonize failed\n";
        return 1;
    }

    // Logger after daemonize so descriptors are final
    mgc::Logger::instance().init(cfg.logfile,
                                 cfg.debug ? mgc::LogLevel::Debug : mgc::LogLevel::Info,
                                 foreground);
    LOG_INFO("mgcd starting (version %s)", MGCD_VERSION);
    if (!loadErr.empty()) LOG_WARN("config: %s (using defaults)", loadErr.c_str());

    std::string perr;
    if (!cfg.pidfile.empty() && !write_pidfile(cfg.pidfile, getpid(), perr)) {
        LOG_WARN("pidfile '%s': %s", cfg.pidfile.c_str(), perr.c_str());
    }

    int rc = 0;
    {
        Daemon daemon;
        if (!daemon.init(cfg)) {
            LOG_ERROR("daemon init failed");
            rc = 2;
        } else {
            std::thread loopThread([&]{ daemon.runLoop(); });

            while (!gStop.load(std::memory_order_relaxed) && !daemon.stopRequested()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
            LOG_INFO("mgcd shutting down (%s)", gStop.load() ? "signal" : "rpc request");

            daemon.requestStop();
            if (loopThread.joinable()) loopThread.join();
            daemon.shutdown();
        }
    }

    if (!cfg.pidfile.empty()) {
        std::error_code ec;
        fs::remove(cfg.pidfile, ec);
    }
    mgc::Logger::instance().shutdown();
    return rc;
}
