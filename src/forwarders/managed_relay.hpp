#pragma once
#include "http_callback.hpp"
#include <string>

namespace smsrelay {

// Forwards SMS messages through the hosted relay bot, which delivers them to
// the Telegram user `tg_handle` once that user has opened the setup link.
//
// Pairing: a fresh instance draws an 8-letter confirmation code. The user
// opens setup_url() in Telegram, which registers "<code>_<handle>" with the
// bot; check_linked() then asks the relay whether that pairing exists.
class ManagedRelayForwarder : public HttpCallbackForwarder {
public:
    static constexpr const char* kTag = "ManagedRelayForwarder";
    // Tag written by older releases; accepted on decode only
    static constexpr const char* kLegacyTag = "DeployedTelegramBotForwarder";

    static constexpr const char* kDefaultBaseUrl = "https://forwarder.whatever.team";
    static constexpr const char* kDefaultBotHandle = "smsforwarderrobot";
    static constexpr size_t kCodeLength = 8;

    // Generates a new confirmation code.
    explicit ManagedRelayForwarder(std::string tg_handle,
                                   std::string base_url = kDefaultBaseUrl,
                                   std::string bot_handle = kDefaultBotHandle);

    ManagedRelayForwarder(std::string tg_handle, std::string base_url,
                          std::string bot_handle, std::string tg_code);

    // Fields: tgHandle (required), tgCode (regenerated when absent, must
    // pass is_valid_code() otherwise), baseUrl, botHandle. Throws ConfigError.
    static ManagedRelayForwarder from_json(const ConfigJson& record);
    ConfigJson to_json() const;

    // https://t.me/<bot>?start=<code>_<handle>
    std::string setup_url() const;

    // GET <base>/check_user; 200 means linked. Any failure means "not yet".
    bool check_linked(HttpClient& http);
    bool linked() const { return linked_; }

    OutgoingRequest build_request(const SmsMessage& sms) const;
    bool forward(const SmsMessage& sms, HttpClient& http) const;

    const std::string& tg_code() const { return tg_code_; }
    const std::string& base_url() const { return base_url_; }
    const std::string& tg_handle() const { return tg_handle_; }
    const std::string& bot_handle() const { return bot_handle_; }

    // 8 uniformly drawn letters A-Z. Pairing code, not a secret.
    static std::string generate_code();
    static bool is_valid_code(const std::string& code);

    // linked() is derived state and takes no part in equality
    bool operator==(const ManagedRelayForwarder& other) const;
    bool operator!=(const ManagedRelayForwarder& other) const { return !(*this == other); }

private:
    std::string tg_code_;
    std::string base_url_;
    std::string tg_handle_;
    std::string bot_handle_;
    bool linked_ = false;
};

} // namespace smsrelay
