#include "relay.hpp"
#include "config_codec.hpp"
#include <iostream>

namespace smsrelay {

Relay::Relay(HttpClient& http)
    : http_(http)
{}

void Relay::activate_record(const ConfigJson& record) {
    // Decode outside the lock; a throw leaves active_ untouched
    activate(decode_forwarder(record));
}

void Relay::activate(Forwarder forwarder) {
    auto next = std::make_shared<const Forwarder>(std::move(forwarder));
    std::lock_guard<std::mutex> lock(mutex_);
    active_ = std::move(next);
}

void Relay::deactivate() {
    std::lock_guard<std::mutex> lock(mutex_);
    active_.reset();
}

std::shared_ptr<const Forwarder> Relay::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

std::optional<Forwarder> Relay::active() const {
    auto current = snapshot();
    if (!current) return std::nullopt;
    return *current;
}

std::string Relay::active_tag() const {
    auto current = snapshot();
    return current ? forwarder_tag(*current) : "";
}

bool Relay::relay(const SmsMessage& sms) {
    auto current = snapshot();
    if (!current) {
        std::cerr << "[relay] No forwarder configured; dropping message from "
                  << sms.sender << "\n";
        failed_++;
        return false;
    }

    bool ok = forward(*current, sms, http_);
    if (ok)
        delivered_++;
    else
        failed_++;
    return ok;
}

std::optional<bool> Relay::check_linked() {
    auto current = snapshot();
    if (!current) return std::nullopt;
    const auto* managed = std::get_if<ManagedRelayForwarder>(current.get());
    if (!managed) return std::nullopt;

    ManagedRelayForwarder updated = *managed;
    bool linked = updated.check_linked(http_);

    auto next = std::make_shared<const Forwarder>(std::move(updated));
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_ == current) active_ = std::move(next);
    return linked;
}

} // namespace smsrelay
