/*
 * MicrogridControl — Utility helpers (header)
 * (c) 2025 MicrogridControl contributors
 */
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include <nlohmann/json.hpp>

#include "Types.hpp"

namespace mgc { namespace util {

/* ----------------------------------------------------------------------------
 * Environment helpers
 * ----------------------------------------------------------------------------*/

std::optional<std::string> getenv_str(const char* key);
std::optional<int>         getenv_int(const char* key);
std::optional<bool>        getenv_bool(const char* key);

/* ----------------------------------------------------------------------------
 * String helpers
 * ----------------------------------------------------------------------------*/

std::string trim(std::string_view sv);

/** Lowercase copy (ASCII) */
std::string to_lower(std::string_view sv);

/** "1"/"true"/"yes"/"on" and their negatives; nullopt otherwise. */
std::optional<bool> parse_bool(std::string_view sv);

/* ----------------------------------------------------------------------------
 * Time helpers
 * ----------------------------------------------------------------------------*/

std::string utc_iso8601();
long long now_ms();

/** "2025-09-20T14:22:11.042Z" */
std::string to_iso8601(TimePoint tp);

/* ----------------------------------------------------------------------------
 * Filesystem / JSON helpers
 * ----------------------------------------------------------------------------*/

/** Ensure parent directory of path exists (no-op if already exists). */
void ensure_parent_dirs(const std::filesystem::path& p, std::error_code* ec = nullptr);

/** Whole file into `out`; false when it cannot be read. */
bool read_file(const std::filesystem::path& p, std::string& out);

/*
 * Parses a JSON document, tolerating a UTF-8 BOM and // or block comments.
 * Returns a discarded value on failure and fills `err` when given.
 */
nlohmann::json read_json_file(const std::string& path, std::string* err = nullptr);

/* Expand a user/home/environment path:
 *  - Leading '~' -> $HOME
 *  - ${VAR} or $VAR -> environment variable
 * Returns the expanded string (no filesystem checks). */
std::string expandUserPath(const std::string& path);

}} // namespace mgc::util
