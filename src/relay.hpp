#pragma once
#include "forwarder.hpp"
#include "http.hpp"
#include "sms.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace smsrelay {

// Holds the active forwarder and relays incoming messages through it.
// All methods are thread-safe. The active forwarder is an immutable value:
// activate() swaps it, and a relay() already in flight keeps using the
// forwarder it started with.
class Relay {
public:
    explicit Relay(HttpClient& http);

    // Decode and install a persisted record. On ConfigError the previous
    // forwarder stays active and the error propagates.
    void activate_record(const ConfigJson& record);
    void activate(Forwarder forwarder);
    void deactivate();

    std::optional<Forwarder> active() const;
    // Empty when nothing is active
    std::string active_tag() const;

    // Forward one message. False on delivery failure or when no forwarder
    // is active; never throws for delivery errors.
    bool relay(const SmsMessage& sms);

    // Managed relay only (nullopt otherwise): re-verify the pairing and
    // install the updated value, unless another forwarder was activated
    // in the meantime.
    std::optional<bool> check_linked();

    uint64_t delivered_count() const { return delivered_.load(); }
    uint64_t failed_count() const { return failed_.load(); }

private:
    std::shared_ptr<const Forwarder> snapshot() const;

    HttpClient& http_;
    mutable std::mutex mutex_;
    std::shared_ptr<const Forwarder> active_;
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> failed_{0};
};

} // namespace smsrelay
