/*
 * MicrogridControl — Daemon configuration (public interface)
 * (c) 2025 MicrogridControl contributors
 *
 * Layering: defaults -> environment (MGCD_*) -> daemon.json.
 * Command-line flags are applied on top by mgcd itself.
 */
#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace mgc {

struct DaemonConfig {
    // RPC server
    std::string host{"127.0.0.1"};
    int         port{8787};

    // Loop timing
    int         tickMs{50};               // main loop cadence
    int         pollMs{500};              // hardware re-read cadence
    int         sweepMs{1000};            // expired-bounds sweep cadence
    int         watchdogMaxSleepMs{50};   // upper bound for the revert dispatcher wait

    // Files / paths
    std::string inventoryPath;  // component inventory for the simulated driver
    std::string logfile;
    std::string pidfile;
    std::string configFile;     // XDG-based default daemon.json

    bool        debug{false};
};

void to_json(nlohmann::json& j, const DaemonConfig& c);
void from_json(const nlohmann::json& j, DaemonConfig& c);

/* Defaults with XDG-derived paths, no environment overlay. */
DaemonConfig defaultConfig();

/* Applies MGCD_* variables onto `c`. */
void applyEnvOverrides(DaemonConfig& c);

/* Rejects out-of-range values; fills `err` and returns false. */
bool validateConfig(const DaemonConfig& c, std::string& err);

/*
 * Full load. `path` empty means the default location. A missing file is
 * created with the current values. Throws std::runtime_error on I/O or
 * parse failures and on invalid values.
 */
void loadDaemonConfig(const std::string& path, DaemonConfig& out);

/* Non-throwing variant; on failure returns defaults+env and fills `err`. */
DaemonConfig loadDaemonConfig(const std::string& path, std::string* err);

void saveDaemonConfig(const std::string& path, const DaemonConfig& c);

} // namespace mgc
