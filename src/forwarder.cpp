#include "forwarder.hpp"
#include <type_traits>

namespace smsrelay {

bool forward(const Forwarder& forwarder, const SmsMessage& sms, HttpClient& http) {
    return std::visit([&](const auto& f) { return f.forward(sms, http); }, forwarder);
}

const char* forwarder_tag(const Forwarder& forwarder) {
    return std::visit([](const auto& f) -> const char* {
        return std::decay_t<decltype(f)>::kTag;
    }, forwarder);
}

} // namespace smsrelay
