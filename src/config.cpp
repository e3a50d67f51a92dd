#include "config.hpp"
#include "config_codec.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>

namespace smsrelay {

ConfigJson Config::defaults_json() {
    return {
        {"forwarder", {{"StdoutForwarder", ConfigJson::object()}}},
        {"http_timeout", 30}
    };
}

static ConfigJson merge_defaults(const ConfigJson& existing,
                                 const ConfigJson& defaults) {
    ConfigJson merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        }
    }
    return merged;
}

std::string config_path() {
    if (const char* v = std::getenv("SMSRELAY_CONFIG"))
        if (*v) return v;
    return expand_home("~/.smsrelay/config.json");
}

// Parse the file at `path`; nullopt when it is missing or malformed.
static std::optional<ConfigJson> read_config_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return std::nullopt;
    try {
        auto j = ConfigJson::parse(file);
        if (j.is_object()) return j;
        std::cerr << "[config] Ignoring config that is not a JSON object: " << path << "\n";
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "[config] Malformed config " << path << ": " << e.what() << "\n";
    }
    return std::nullopt;
}

Config Config::load(const std::string& path) {
    Config cfg;
    cfg.path = path.empty() ? config_path() : path;

    ConfigJson j;
    if (auto original = read_config_file(cfg.path)) {
        j = merge_defaults(*original, defaults_json());
        if (j != *original) {
            if (atomic_write_file(cfg.path, j.dump(4) + "\n"))
                std::cerr << "[config] Migrated config with new defaults: " << cfg.path << "\n";
        }
    } else {
        // Config file is missing or malformed; fall back to defaults
        bool existed = std::ifstream(cfg.path).is_open();
        j = defaults_json();
        if (!existed && atomic_write_file(cfg.path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << cfg.path << "\n";
    }

    // Kept as stored; decoding at activation reports a bad record
    if (j.contains("forwarder"))
        cfg.forwarder = j["forwarder"];
    if (j.contains("http_timeout") && j["http_timeout"].is_number_integer() && j["http_timeout"].get<long>() > 0)
        cfg.http_timeout = j["http_timeout"].get<long>();

    // Environment variables always override config file
    if (const char* v = std::getenv("SMSRELAY_FORWARDER")) {
        try {
            cfg.forwarder = ConfigJson::parse(v);
        } catch (const nlohmann::json::parse_error& e) {
            throw ConfigError(std::string("SMSRELAY_FORWARDER is not valid JSON: ") + e.what());
        }
    }
    if (const char* v = std::getenv("SMSRELAY_HTTP_TIMEOUT")) {
        try {
            long timeout = std::stol(v);
            if (timeout > 0) cfg.http_timeout = timeout;
        } catch (const std::exception&) {
            std::cerr << "[config] Ignoring invalid SMSRELAY_HTTP_TIMEOUT: " << v << "\n";
        }
    }

    return cfg;
}

bool Config::persist_forwarder(const ConfigJson& record) {
    // Store the canonical encoding so generated fields (the relay
    // confirmation code) survive restarts. Throws before anything is written.
    ConfigJson canonical = encode_forwarder(decode_forwarder(record));
    if (!modify_config_json(path.empty() ? config_path() : path,
                            [&](ConfigJson& j) { j["forwarder"] = canonical; }))
        return false;
    forwarder = std::move(canonical);
    return true;
}

bool modify_config_json(const std::string& path,
                        const std::function<void(ConfigJson&)>& modifier) {
    ConfigJson j = read_config_file(path).value_or(Config::defaults_json());
    modifier(j);
    return atomic_write_file(path, j.dump(4) + "\n");
}

} // namespace smsrelay
