#pragma once
#include "../config_error.hpp"
#include "../http.hpp"
#include "../sms.hpp"
#include <iostream>

namespace smsrelay {

// Dry-run forwarder: prints each message and always reports success.
class StdoutForwarder {
public:
    static constexpr const char* kTag = "StdoutForwarder";

    explicit StdoutForwarder(std::ostream& out = std::cout) : out_(&out) {}

    // Nothing to read; any record body is accepted.
    static StdoutForwarder from_json(const ConfigJson& record);
    ConfigJson to_json() const { return ConfigJson::object(); }

    bool forward(const SmsMessage& sms, HttpClient& http) const;

    bool operator==(const StdoutForwarder&) const { return true; }
    bool operator!=(const StdoutForwarder&) const { return false; }

private:
    std::ostream* out_;
};

} // namespace smsrelay
