#pragma once
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace smsrelay {

// Persisted forwarder records keep key order (payload maps are emitted in it).
using ConfigJson = nlohmann::ordered_json;

// A persisted forwarder record is malformed or incomplete.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace smsrelay
