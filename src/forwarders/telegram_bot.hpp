#pragma once
#include "../config_error.hpp"
#include "../http.hpp"
#include "../sms.hpp"
#include "http_sender.hpp"
#include <cstdint>
#include <string>

namespace smsrelay {

// Sends each SMS straight to a chat through the Telegram Bot API.
class TelegramBotForwarder {
public:
    static constexpr const char* kTag = "TelegramBotForwarder";

    TelegramBotForwarder(std::string token, int64_t chat_id);

    // Fields: token, chatId (integer or numeric string). Both required.
    static TelegramBotForwarder from_json(const ConfigJson& record);
    ConfigJson to_json() const;

    // Build Telegram API URL for a method
    std::string api_url(const std::string& method) const;

    // "New SMS message from {sender}:\n{body}\n\nDate: {timestamp}."
    static std::string format_text(const SmsMessage& sms);

    OutgoingRequest build_request(const SmsMessage& sms) const;
    bool forward(const SmsMessage& sms, HttpClient& http) const;

    const std::string& token() const { return token_; }
    int64_t chat_id() const { return chat_id_; }

    bool operator==(const TelegramBotForwarder& other) const {
        return token_ == other.token_ && chat_id_ == other.chat_id_;
    }
    bool operator!=(const TelegramBotForwarder& other) const { return !(*this == other); }

private:
    std::string token_;
    int64_t chat_id_;
};

} // namespace smsrelay
