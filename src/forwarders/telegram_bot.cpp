#include "telegram_bot.hpp"
#include "record_fields.hpp"
#include "../uri.hpp"
#include <limits>

namespace smsrelay {

static const char* const kMissingCredentials = "Missing the token or chat id";

TelegramBotForwarder::TelegramBotForwarder(std::string token, int64_t chat_id)
    : token_(std::move(token)), chat_id_(chat_id)
{}

static int64_t chat_id_field(const ConfigJson& fields) {
    auto it = fields.find("chatId");
    if (it == fields.end() || it->is_null())
        throw ConfigError(kMissingCredentials);

    if (it->is_number_unsigned()) {
        if (it->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
            throw ConfigError("Invalid Telegram chat id: " + it->dump());
        return static_cast<int64_t>(it->get<uint64_t>());
    }
    if (it->is_number_integer())
        return it->get<int64_t>();

    if (it->is_string()) {
        const auto s = it->get<std::string>();
        size_t consumed = 0;
        try {
            int64_t id = std::stoll(s, &consumed);
            if (consumed == s.size()) return id;
        } catch (const std::exception&) {
            // fall through to the error below
        }
    }
    throw ConfigError("Invalid Telegram chat id: " + it->dump());
}

TelegramBotForwarder TelegramBotForwarder::from_json(const ConfigJson& record) {
    const auto& fields = unwrap_record(record, kTag);
    auto token = string_field(fields, "token");
    if (!token || token->empty())
        throw ConfigError(kMissingCredentials);
    return TelegramBotForwarder(*token, chat_id_field(fields));
}

ConfigJson TelegramBotForwarder::to_json() const {
    ConfigJson j = ConfigJson::object();
    j["token"] = token_;
    j["chatId"] = chat_id_;
    return j;
}

std::string TelegramBotForwarder::api_url(const std::string& method) const {
    return "https://api.telegram.org/bot" + token_ + "/" + method;
}

std::string TelegramBotForwarder::format_text(const SmsMessage& sms) {
    return "New SMS message from " + sms.sender + ":\n" + sms.body +
           "\n\nDate: " + std::to_string(sms.timestamp) + ".";
}

OutgoingRequest TelegramBotForwarder::build_request(const SmsMessage& sms) const {
    Fields params;
    params.emplace_back("chat_id", std::to_string(chat_id_));
    params.emplace_back("text", format_text(sms));

    OutgoingRequest req;
    req.method = HttpMethod::Post;
    req.url = api_url("sendMessage") + encode_query(params);
    return req;
}

bool TelegramBotForwarder::forward(const SmsMessage& sms, HttpClient& http) const {
    return send_request(http, build_request(sms), "telegram");
}

} // namespace smsrelay
