/*
 * MicrogridControl — Utility helpers (implementation; Linux-only)
 * (c) 2025 MicrogridControl contributors
 */
#include "include/Utils.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace mgc { namespace util {

using json = nlohmann::json;

/* ----------------------------------------------------------------------------
 * Environment helpers
 * ----------------------------------------------------------------------------*/

std::optional<std::string> getenv_str(const char* key) {
    if (!key || !*key) return std::nullopt;
    const char* v = std::getenv(key);
    if (!v || !*v) return std::nullopt;
    return std::string(v);
}

std::optional<int> getenv_int(const char* key) {
    auto v = getenv_str(key);
    if (!v) return std::nullopt;
    try {
        size_t idx = 0;
        int n = std::stoi(*v, &idx, 10);
        if (idx != v->size()) return std::nullopt;
        return n;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<bool> getenv_bool(const char* key) {
    auto v = getenv_str(key);
    if (!v) return std::nullopt;
    return parse_bool(*v);
}

/* ----------------------------------------------------------------------------
 * String helpers
 * ----------------------------------------------------------------------------*/

std::string trim(std::string_view sv) {
    size_t i = 0, j = sv.size();
    while (i < j && std::isspace(static_cast<unsigned char>(sv[i]))) ++i;
    while (j > i && std::isspace(static_cast<unsigned char>(sv[j-1]))) --j;
    return std::string(sv.substr(i, j - i));
}

std::string to_lower(std::string_view sv) {
    std::string s(sv);
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::optional<bool> parse_bool(std::string_view sv) {
    const std::string v = to_lower(trim(sv));
    if (v == "1" || v == "true"  || v == "yes" || v == "on")  return true;
    if (v == "0" || v == "false" || v == "no"  || v == "off") return false;
    return std::nullopt;
}

/* ----------------------------------------------------------------------------
 * Time helpers
 * ----------------------------------------------------------------------------*/

std::string utc_iso8601() {
    return to_iso8601(std::chrono::system_clock::now());
}

long long now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string to_iso8601(TimePoint tp) {
    using namespace std::chrono;
    const auto ms = duration_cast<milliseconds>(tp.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    int frac = static_cast<int>(ms % 1000);
    if (frac < 0) { frac += 1000; --secs; }

    std::tm tm_utc{};
    gmtime_r(&secs, &tm_utc);
    char date[32] = {0};
    if (std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm_utc) == 0) return std::string();
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%s.%03dZ", date, frac);
    return std::string(buf);
}

/* ----------------------------------------------------------------------------
 * Filesystem / JSON helpers
 * ----------------------------------------------------------------------------*/

void ensure_parent_dirs(const fs::path& p, std::error_code* ec) {
    fs::path dir = p.parent_path();
    if (dir.empty()) return;
    std::error_code tmp;
    fs::create_directories(dir, tmp);
    if (ec) *ec = tmp;
}

bool read_file(const fs::path& p, std::string& out) {
    std::ifstream ifs(p, std::ios::binary);
    if (!ifs) return false;
    std::ostringstream ss;
    ss << ifs.rdbuf();
    out = ss.str();
    return true;
}

json read_json_file(const std::string& path, std::string* err) {
    std::string text;
    if (!read_file(path, text)) {
        if (err) *err = "cannot open '" + path + "'";
        return json(json::value_t::discarded);
    }

    // UTF-8 BOM
    if (text.size() >= 3 &&
        static_cast<unsigned char>(text[0]) == 0xEF &&
        static_cast<unsigned char>(text[1]) == 0xBB &&
        static_cast<unsigned char>(text[2]) == 0xBF) {
        text.erase(0, 3);
    }

    try {
        return json::parse(text, /*cb=*/nullptr, /*allow_exceptions=*/true, /*ignore_comments=*/true);
    } catch (const json::parse_error& e) {
        if (err) *err = "parse error in '" + path + "': " + e.what();
        return json(json::value_t::discarded);
    }
}

/* ----------------------------------------------------------------------------
 * Path expansion
 * ----------------------------------------------------------------------------*/

static inline bool isIdentChar_(char c) {
    return c == '_' || std::isalnum(static_cast<unsigned char>(c));
}

std::string expandUserPath(const std::string& in) {
    if (in.empty()) return in;

    std::string out = in;
    if (out.front() == '~') {
        auto home = getenv_str("HOME");
        if (home) {
            if (out.size() == 1) return *home;
            if (out[1] == '/') out = *home + out.substr(1);
        }
    }

    std::string result;
    result.reserve(out.size());
    for (size_t i = 0; i < out.size(); ++i) {
        const char c = out[i];
        if (c == '$' && i + 1 < out.size()) {
            if (out[i + 1] == '{') {
                const size_t j = out.find('}', i + 2);
                if (j != std::string::npos) {
                    if (auto v = getenv_str(out.substr(i + 2, j - (i + 2)).c_str())) result += *v;
                    i = j;
                    continue;
                }
            } else {
                size_t j = i + 1;
                while (j < out.size() && isIdentChar_(out[j])) ++j;
                if (j > i + 1) {
                    if (auto v = getenv_str(out.substr(i + 1, j - (i + 1)).c_str())) result += *v;
                    i = j - 1;
                    continue;
                }
            }
        }
        result.push_back(c);
    }
    return result;
}

}} // namespace mgc::util
