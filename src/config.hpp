#pragma once
#include "config_error.hpp"
#include <functional>
#include <string>

namespace smsrelay {

struct Config {
    // Persisted forwarder record as stored, decoded by config_codec
    ConfigJson forwarder = {{"StdoutForwarder", ConfigJson::object()}};
    long http_timeout = 30; // seconds, applied by the transport
    std::string path;       // file this config was loaded from

    // Load from `path` (default: config_path()) + env vars. Creates the file
    // with defaults when missing. Throws ConfigError when SMSRELAY_FORWARDER
    // is not valid JSON.
    static Config load(const std::string& path = "");

    // Default config JSON (used by load() and tests)
    static ConfigJson defaults_json();

    // Decode `record` and write its canonical tagged encoding to the config
    // file. Throws ConfigError for an invalid record; returns false on I/O
    // failure.
    bool persist_forwarder(const ConfigJson& record);
};

// $SMSRELAY_CONFIG, else ~/.smsrelay/config.json
std::string config_path();

// Read-modify-write the config file at `path` atomically.
// The callback receives a mutable reference to the parsed JSON.
bool modify_config_json(const std::string& path,
                        const std::function<void(ConfigJson&)>& modifier);

} // namespace smsrelay
