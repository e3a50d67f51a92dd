#pragma once
#include "forwarders/stdout.hpp"
#include "forwarders/http_callback.hpp"
#include "forwarders/telegram_bot.hpp"
#include "forwarders/managed_relay.hpp"
#include <variant>

namespace smsrelay {

// Every forwarder kind. Adding a kind means adding an alternative here and
// a decoder entry in config_codec.cpp.
using Forwarder = std::variant<StdoutForwarder,
                               HttpCallbackForwarder,
                               TelegramBotForwarder,
                               ManagedRelayForwarder>;

// Deliver one message through whichever forwarder is held. Returns false on
// delivery failure; never throws for network or HTTP errors.
bool forward(const Forwarder& forwarder, const SmsMessage& sms, HttpClient& http);

// The record tag of the held alternative, e.g. "TelegramBotForwarder"
const char* forwarder_tag(const Forwarder& forwarder);

} // namespace smsrelay
