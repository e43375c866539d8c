/*
 * MicrogridControl — Daemon configuration (implementation)
 * (c) 2025 MicrogridControl contributors
 *
 * - Defaults are XDG-aware (config under $XDG_CONFIG_HOME/MicrogridControl).
 * - Environment is a fallback layer; daemon.json overrides it.
 * - Logfile prefers /var/log/mgc, pidfile prefers /run; both fall back to /tmp.
 */
#include "include/Config.hpp"
#include "include/Utils.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;
using nlohmann::json;

namespace mgc {

/* ----------------------------------------------------------------------------
 * helpers
 * ----------------------------------------------------------------------------*/

static std::string xdg_config_home() {
    if (auto v = util::getenv_str("XDG_CONFIG_HOME")) return *v;
    if (auto home = util::getenv_str("HOME")) return (fs::path(*home) / ".config").string();
    return {};
}

static bool parent_writable(const std::string& path) {
    std::error_code ec;
    fs::path dir = fs::path(path).parent_path();
    if (dir.empty()) dir = ".";
    fs::create_directories(dir, ec);
    if (ec) return false;
    return ::access(dir.c_str(), W_OK) == 0;
}

static void expandPaths_(DaemonConfig& c) {
    c.configFile    = util::expandUserPath(c.configFile);
    c.inventoryPath = util::expandUserPath(c.inventoryPath);
    c.logfile       = util::expandUserPath(c.logfile);
    c.pidfile       = util::expandUserPath(c.pidfile);
}

/* ----------------------------------------------------------------------------
 * json (de)serialization
 * ----------------------------------------------------------------------------*/

void to_json(json& j, const DaemonConfig& c) {
    j = json{
        {"host", c.host},
        {"port", c.port},

        {"tickMs", c.tickMs},
        {"pollMs", c.pollMs},
        {"sweepMs", c.sweepMs},
        {"watchdogMaxSleepMs", c.watchdogMaxSleepMs},

        {"inventoryPath", c.inventoryPath},
        {"logfile", c.logfile},
        {"pidfile", c.pidfile},

        {"debug", c.debug}
    };
}

void from_json(const json& j, DaemonConfig& c) {
    if (j.contains("host"))               j.at("host").get_to(c.host);
    if (j.contains("port"))               j.at("port").get_to(c.port);
    if (j.contains("tickMs"))             j.at("tickMs").get_to(c.tickMs);
    if (j.contains("pollMs"))             j.at("pollMs").get_to(c.pollMs);
    if (j.contains("sweepMs"))            j.at("sweepMs").get_to(c.sweepMs);
    if (j.contains("watchdogMaxSleepMs")) j.at("watchdogMaxSleepMs").get_to(c.watchdogMaxSleepMs);
    if (j.contains("inventoryPath"))      j.at("inventoryPath").get_to(c.inventoryPath);
    if (j.contains("logfile"))            j.at("logfile").get_to(c.logfile);
    if (j.contains("pidfile"))            j.at("pidfile").get_to(c.pidfile);
    if (j.contains("debug"))              j.at("debug").get_to(c.debug);
}

/* ----------------------------------------------------------------------------
 * Defaults / environment
 * ----------------------------------------------------------------------------*/

DaemonConfig defaultConfig() {
    DaemonConfig c;

    const std::string cfgHome = xdg_config_home();
    const std::string base = cfgHome.empty() ? std::string() : (fs::path(cfgHome) / "MicrogridControl").string();

    c.configFile    = base.empty() ? "" : (fs::path(base) / "daemon.json").string();
    c.inventoryPath = base.empty() ? "" : (fs::path(base) / "inventory.json").string();

    const std::string logVar = "/var/log/mgc/mgcd.log";
    c.logfile = parent_writable(logVar) ? logVar : "/tmp/mgcd.log";

    const std::string runPid = "/run/mgcd.pid";
    c.pidfile = parent_writable(runPid) ? runPid : "/tmp/mgcd.pid";

    return c;
}

void applyEnvOverrides(DaemonConfig& c) {
    if (auto v = util::getenv_str("MGCD_HOST"))       c.host = *v;
    if (auto v = util::getenv_int("MGCD_PORT"))       c.port = *v;
    if (auto v = util::getenv_int("MGCD_TICK_MS"))    c.tickMs = *v;
    if (auto v = util::getenv_int("MGCD_POLL_MS"))    c.pollMs = *v;
    if (auto v = util::getenv_int("MGCD_SWEEP_MS"))   c.sweepMs = *v;
    if (auto v = util::getenv_str("MGCD_INVENTORY"))  c.inventoryPath = *v;
    if (auto v = util::getenv_str("MGCD_LOGFILE"))    c.logfile = *v;
    if (auto v = util::getenv_str("MGCD_PIDFILE"))    c.pidfile = *v;
    if (auto v = util::getenv_bool("MGCD_DEBUG"))     c.debug = *v;

    // only affects where daemon.json is looked up; --config still wins
    if (auto v = util::getenv_str("MGCD_CONFIG_PATH")) c.configFile = *v;
}

bool validateConfig(const DaemonConfig& c, std::string& err) {
    if (c.host.empty())                       { err = "host must not be empty"; return false; }
    if (c.port <= 0 || c.port > 65535)        { err = "port out of range: " + std::to_string(c.port); return false; }
    if (c.tickMs <= 0)                        { err = "tickMs must be > 0"; return false; }
    if (c.pollMs <= 0)                        { err = "pollMs must be > 0"; return false; }
    if (c.sweepMs <= 0)                       { err = "sweepMs must be > 0"; return false; }
    if (c.watchdogMaxSleepMs <= 0)            { err = "watchdogMaxSleepMs must be > 0"; return false; }
    return true;
}

/* ----------------------------------------------------------------------------
 * File I/O
 * ----------------------------------------------------------------------------*/

void saveDaemonConfig(const std::string& path, const DaemonConfig& c) {
    const std::string target = util::expandUserPath(path);
    std::error_code ec;
    util::ensure_parent_dirs(target, &ec);
    if (ec) {
        throw std::runtime_error("cannot create parent dirs for: " + target + " (" + ec.message() + ")");
    }
    std::ofstream os(target);
    if (!os) throw std::runtime_error("cannot write config: " + target);
    json j; to_json(j, c);
    os << j.dump(2) << "\n";
}

void loadDaemonConfig(const std::string& path, DaemonConfig& out) {
    out = defaultConfig();
    applyEnvOverrides(out);

    const std::string p = util::expandUserPath(!path.empty() ? path : out.configFile);
    if (p.empty()) {
        throw std::runtime_error("no config path resolved (empty XDG_CONFIG_HOME/HOME?)");
    }

    std::error_code ec;
    if (!fs::exists(p, ec)) {
        saveDaemonConfig(p, out);
    } else {
        std::string perr;
        json j = util::read_json_file(p, &perr);
        if (j.is_discarded()) throw std::runtime_error(perr);
        if (!j.is_object()) throw std::runtime_error("config root must be an object: " + p);
        try {
            from_json(j, out);
        } catch (const json::exception& e) {
            throw std::runtime_error("invalid config '" + p + "': " + e.what());
        }
    }
    out.configFile = p;
    expandPaths_(out);

    std::string verr;
    if (!validateConfig(out, verr)) throw std::runtime_error("invalid config '" + p + "': " + verr);
}

DaemonConfig loadDaemonConfig(const std::string& path, std::string* err) {
    DaemonConfig cfg;
    if (err) err->clear();
    try {
        loadDaemonConfig(path, cfg);
    } catch (const std::exception& ex) {
        if (err) *err = ex.what();
        cfg = defaultConfig();
        applyEnvOverrides(cfg);
        expandPaths_(cfg);
    }
    return cfg;
}

} // namespace mgc
