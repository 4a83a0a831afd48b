#include "synmacro/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

#if defined(_WIN32)
#include <stdlib.h>
#define SYNMACRO_ENVIRON _environ
#else
extern char** environ;
#define SYNMACRO_ENVIRON environ
#endif

namespace synmacro {

bool flag_value(const std::string& v) {
    return !v.empty() && (v[0] == '1' || v[0] == 't' || v[0] == 'T' || v[0] == 'y' || v[0] == 'Y');
}

bool env_flag_enabled(const char* name) {
    const char* v = std::getenv(name);
    return v && flag_value(v);
}

void config_store::add_define(const std::string& define) {
    auto eq = define.find('=');
    std::string key = define.substr(0, eq);
    if (key.empty()) throw std::invalid_argument("empty configuration key in '" + define + "'");
    set(key, eq == std::string::npos ? std::string("1") : define.substr(eq + 1));
}

std::optional<std::string> config_store::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

bool config_store::flag(const std::string& key, bool fallback) const {
    auto v = get(key);
    return v ? flag_value(*v) : fallback;
}

int64_t config_store::integer(const std::string& key, int64_t fallback) const {
    auto v = get(key);
    if (!v) return fallback;
    try {
        size_t used = 0;
        int64_t out = std::stoll(*v, &used);
        if (used != v->size()) throw std::invalid_argument(*v);
        return out;
    } catch (const std::logic_error&) {
        throw std::invalid_argument("configuration value '" + key + "=" + *v + "' is not an integer");
    }
}

config_store config_store::from_environment(const std::string& prefix) {
    config_store out;
    for (char** e = SYNMACRO_ENVIRON; e && *e; ++e) {
        std::string entry(*e);
        if (entry.compare(0, prefix.size(), prefix) != 0) continue;
        auto eq = entry.find('=');
        if (eq == std::string::npos || eq == prefix.size()) continue;
        std::string key = entry.substr(prefix.size(), eq - prefix.size());
        std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return (char)std::tolower(c); });
        out.set(key, entry.substr(eq + 1));
    }
    return out;
}

std::shared_ptr<const config_store> compile_time_config::lock(const std::string& key) const {
    auto s = store_.lock();
    if (!s) throw config_unavailable_error("compile-time configuration '" + key + "' read outside the expansion pass");
    return s;
}

std::optional<std::string> compile_time_config::get(const std::string& key) const { return lock(key)->get(key); }
bool compile_time_config::flag(const std::string& key, bool fallback) const { return lock(key)->flag(key, fallback); }
int64_t compile_time_config::integer(const std::string& key, int64_t fallback) const { return lock(key)->integer(key, fallback); }

engine_options detect_options() {
    engine_options o{};
    auto get = [](const char* k) -> const char* { const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };
    auto positive = [](const char* name, const char* v) {
        char* end = nullptr;
        long n = std::strtol(v, &end, 10);
        if (*end != '\0' || n <= 0) throw std::invalid_argument(std::string(name) + " must be a positive integer, got '" + v + "'");
        return static_cast<int>(n);
    };

    if (const char* v = get("SYNMACRO_MAX_DEPTH")) o.max_depth = positive("SYNMACRO_MAX_DEPTH", v);
    if (const char* v = get("SYNMACRO_JOBS")) o.jobs = positive("SYNMACRO_JOBS", v);
    o.trace = env_flag_enabled("SYNMACRO_TRACE");
    o.diag_json = env_flag_enabled("SYNMACRO_DIAG_JSON");
    return o;
}

} // namespace synmacro
