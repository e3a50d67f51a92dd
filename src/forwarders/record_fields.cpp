#include "record_fields.hpp"

namespace smsrelay {

const ConfigJson& unwrap_record(const ConfigJson& record, const char* tag) {
    if (!record.is_object())
        throw ConfigError(std::string(tag) + ": record is not a JSON object");
    auto it = record.find(tag);
    if (it != record.end()) {
        if (!it->is_object())
            throw ConfigError(std::string(tag) + ": record body is not a JSON object");
        return *it;
    }
    return record;
}

std::optional<std::string> string_field(const ConfigJson& fields, const char* key) {
    auto it = fields.find(key);
    if (it == fields.end() || it->is_null()) return std::nullopt;
    if (!it->is_string())
        throw ConfigError(std::string("Field '") + key + "' must be a string");
    return it->get<std::string>();
}

std::string required_string(const ConfigJson& fields, const char* key,
                            const char* what) {
    auto value = string_field(fields, key);
    if (!value || value->empty())
        throw ConfigError(std::string("Missing the ") + what);
    return *value;
}

Fields payload_field(const ConfigJson& fields, const char* key) {
    Fields payload;
    auto it = fields.find(key);
    if (it == fields.end() || it->is_null()) return payload;
    if (!it->is_object())
        throw ConfigError(std::string("Field '") + key + "' must be an object");

    for (const auto& [k, v] : it->items()) {
        if (k == kThreadIdKey) continue;
        payload.emplace_back(k, v.is_string() ? v.get<std::string>() : v.dump());
    }
    return payload;
}

ConfigJson payload_to_json(const Fields& payload) {
    ConfigJson obj = ConfigJson::object();
    for (const auto& [k, v] : payload) obj[k] = v;
    return obj;
}

} // namespace smsrelay
