#pragma once
#include "uri.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace smsrelay {

struct SmsMessage {
    std::string sender;
    std::string body;
    int64_t timestamp = 0;   // epoch milliseconds
    std::string thread_id;   // opaque; never forwarded
};

// Flat outgoing field mapping: address, body, date, thread_id (in that order).
// thread_id is included so payload merging sees it; every encoder drops it.
Fields sms_fields(const SmsMessage& sms);

// Parse one incoming SMS record. Accepts "address"/"sender", "body",
// "date"/"timestamp" (number or numeric string) and an optional "thread_id"
// of any scalar type. Throws std::invalid_argument when sender or body is
// missing or not a string.
SmsMessage sms_from_json(const nlohmann::json& j);

} // namespace smsrelay
