#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "synmacro/errors.hpp"

namespace synmacro {

// Feature flags sourced from environment ('1', 't', 'T', 'y', 'Y' enable).
bool env_flag_enabled(const char* name);
bool flag_value(const std::string& v);

// Compile-time key/value configuration, filled before the pass.
class config_store {
public:
    void set(std::string key, std::string value) { values_[std::move(key)] = std::move(value); }
    // "key=value"; a bare "key" means "key=1". Throws std::invalid_argument on an empty key.
    void add_define(const std::string& define);

    std::optional<std::string> get(const std::string& key) const;
    bool flag(const std::string& key, bool fallback = false) const;
    int64_t integer(const std::string& key, int64_t fallback = 0) const;
    bool contains(const std::string& key) const { return values_.count(key) > 0; }
    const std::map<std::string, std::string>& values() const { return values_; }

    // Every PREFIX<KEY>=value in the process environment, KEY lowercased.
    static config_store from_environment(const std::string& prefix = "SYNMACRO_CFG_");

private:
    std::map<std::string, std::string> values_;
};

// Read access handed to macros. Only valid while the owning config_session is open;
// afterwards every read throws config_unavailable_error.
class compile_time_config {
public:
    compile_time_config() = default;
    explicit compile_time_config(std::weak_ptr<const config_store> store) : store_(std::move(store)) {}

    std::optional<std::string> get(const std::string& key) const;
    bool flag(const std::string& key, bool fallback = false) const;
    int64_t integer(const std::string& key, int64_t fallback = 0) const;
    bool available() const { return !store_.expired(); }

private:
    std::shared_ptr<const config_store> lock(const std::string& key) const;

    std::weak_ptr<const config_store> store_;
};

// Scope of the expansion pass: owns a snapshot of the store for its lifetime.
class config_session {
public:
    explicit config_session(const config_store& store) : store_(std::make_shared<const config_store>(store)) {}
    ~config_session() { close(); }
    config_session(const config_session&) = delete;
    config_session& operator=(const config_session&) = delete;

    compile_time_config capability() const { return compile_time_config(store_); }
    void close() { store_.reset(); }

private:
    std::shared_ptr<const config_store> store_;
};

// Engine knobs, overridable from the environment:
//   SYNMACRO_MAX_DEPTH  maximum nested expansion depth (default 64)
//   SYNMACRO_JOBS       units expanded in parallel (default 1)
//   SYNMACRO_TRACE      log each expansion to stderr
//   SYNMACRO_DIAG_JSON  also print diagnostics as JSON
struct engine_options {
    int max_depth = 64;
    int jobs = 1;
    bool trace = false;
    bool diag_json = false;
};

engine_options detect_options();

} // namespace synmacro
