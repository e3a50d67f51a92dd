#include "sms.hpp"
#include <stdexcept>

namespace smsrelay {

Fields sms_fields(const SmsMessage& sms) {
    Fields fields;
    fields.emplace_back("address", sms.sender);
    fields.emplace_back("body", sms.body);
    fields.emplace_back("date", std::to_string(sms.timestamp));
    fields.emplace_back(kThreadIdKey, sms.thread_id);
    return fields;
}

static const nlohmann::json* first_of(const nlohmann::json& j,
                                      const char* primary, const char* alias) {
    if (j.contains(primary)) return &j[primary];
    if (j.contains(alias)) return &j[alias];
    return nullptr;
}

SmsMessage sms_from_json(const nlohmann::json& j) {
    if (!j.is_object())
        throw std::invalid_argument("SMS record must be a JSON object");

    SmsMessage sms;
    const auto* sender = first_of(j, "address", "sender");
    if (!sender || !sender->is_string())
        throw std::invalid_argument("SMS record has no sender address");
    sms.sender = sender->get<std::string>();

    if (!j.contains("body") || !j["body"].is_string())
        throw std::invalid_argument("SMS record has no body");
    sms.body = j["body"].get<std::string>();

    if (const auto* date = first_of(j, "date", "timestamp")) {
        if (date->is_number_integer()) {
            sms.timestamp = date->get<int64_t>();
        } else if (date->is_string()) {
            const auto text = date->get<std::string>();
            size_t consumed = 0;
            try {
                sms.timestamp = std::stoll(text, &consumed);
            } catch (const std::exception&) {
                consumed = 0;
            }
            if (consumed == 0 || consumed != text.size())
                throw std::invalid_argument("SMS record has a non-numeric date");
        } else {
            throw std::invalid_argument("SMS record has a non-numeric date");
        }
    }

    if (j.contains(kThreadIdKey)) {
        const auto& t = j[kThreadIdKey];
        sms.thread_id = t.is_string() ? t.get<std::string>() : t.dump();
    }
    return sms;
}

} // namespace smsrelay
