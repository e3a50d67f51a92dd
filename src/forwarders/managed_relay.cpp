#include "managed_relay.hpp"
#include "record_fields.hpp"
#include <iostream>
#include <random>

namespace smsrelay {

ManagedRelayForwarder::ManagedRelayForwarder(std::string tg_handle,
                                             std::string base_url,
                                             std::string bot_handle)
    : ManagedRelayForwarder(std::move(tg_handle), std::move(base_url),
                            std::move(bot_handle), generate_code())
{}

ManagedRelayForwarder::ManagedRelayForwarder(std::string tg_handle,
                                             std::string base_url,
                                             std::string bot_handle,
                                             std::string tg_code)
    : HttpCallbackForwarder(base_url + "/forward", HttpMethod::Post),
      tg_code_(std::move(tg_code)),
      base_url_(std::move(base_url)),
      tg_handle_(std::move(tg_handle)),
      bot_handle_(std::move(bot_handle))
{}

ManagedRelayForwarder ManagedRelayForwarder::from_json(const ConfigJson& record) {
    const ConfigJson* fields = &record;
    if (record.is_object() && record.contains(kLegacyTag))
        fields = &unwrap_record(record, kLegacyTag);
    else
        fields = &unwrap_record(record, kTag);

    std::string handle = required_string(*fields, "tgHandle", "telegram handle");
    std::string base = string_field(*fields, "baseUrl").value_or("");
    std::string bot = string_field(*fields, "botHandle").value_or("");
    std::string code = string_field(*fields, "tgCode").value_or("");

    if (base.empty()) base = kDefaultBaseUrl;
    if (bot.empty()) bot = kDefaultBotHandle;
    if (code.empty()) {
        code = generate_code();
        std::cerr << "[relay] No confirmation code stored; generated a new one. "
                     "Open the setup link again to pair.\n";
    } else if (!is_valid_code(code)) {
        // The code goes onto the wire unencoded
        throw ConfigError("Invalid confirmation code: `" + code + "`");
    }
    return ManagedRelayForwarder(std::move(handle), std::move(base),
                                 std::move(bot), std::move(code));
}

ConfigJson ManagedRelayForwarder::to_json() const {
    ConfigJson j = ConfigJson::object();
    j["tgCode"] = tg_code_;
    j["baseUrl"] = base_url_;
    j["tgHandle"] = tg_handle_;
    j["botHandle"] = bot_handle_;
    return j;
}

std::string ManagedRelayForwarder::setup_url() const {
    return "https://t.me/" + bot_handle_ + "?start=" + tg_code_ + "_" + tg_handle_;
}

bool ManagedRelayForwarder::check_linked(HttpClient& http) {
    Fields params;
    params.emplace_back("username", tg_handle_);
    params.emplace_back("code", tg_code_);

    HttpResponse resp;
    try {
        resp = http.get(base_url_ + "/check_user" + encode_query(params));
    } catch (const std::exception& e) {
        std::cerr << "[relay] Link check failed: " << e.what() << "\n";
        linked_ = false;
        return false;
    }
    linked_ = resp.status_code == 200;
    if (resp.status_code == 0)
        std::cerr << "[relay] Link check got no response from " << base_url_ << "\n";
    return linked_;
}

OutgoingRequest ManagedRelayForwarder::build_request(const SmsMessage& sms) const {
    OutgoingRequest req;
    req.method = HttpMethod::Post;
    // The relay expects code/username as literal trailing parameters
    req.url = callback_url_ + encode_query(sms_fields(sms)) +
              "code=" + tg_code_ + "&username=" + tg_handle_;
    return req;
}

bool ManagedRelayForwarder::forward(const SmsMessage& sms, HttpClient& http) const {
    return send_request(http, build_request(sms), "relay");
}

std::string ManagedRelayForwarder::generate_code() {
    static thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 25);
    std::string code;
    code.reserve(kCodeLength);
    for (size_t i = 0; i < kCodeLength; ++i)
        code += static_cast<char>('A' + dist(gen));
    return code;
}

bool ManagedRelayForwarder::is_valid_code(const std::string& code) {
    if (code.size() != kCodeLength) return false;
    for (char c : code)
        if (c < 'A' || c > 'Z') return false;
    return true;
}

bool ManagedRelayForwarder::operator==(const ManagedRelayForwarder& other) const {
    return tg_code_ == other.tg_code_ &&
           base_url_ == other.base_url_ &&
           tg_handle_ == other.tg_handle_ &&
           bot_handle_ == other.bot_handle_;
}

} // namespace smsrelay
