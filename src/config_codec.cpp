#include "config_codec.hpp"
#include <type_traits>

namespace smsrelay {

using Decoder = Forwarder (*)(const ConfigJson&);

struct DecoderEntry {
    const char* tag;
    Decoder decode;
};

template <typename T>
static Forwarder decode_as(const ConfigJson& record) {
    return T::from_json(record);
}

static const DecoderEntry kDecoders[] = {
    {StdoutForwarder::kTag,             &decode_as<StdoutForwarder>},
    {HttpCallbackForwarder::kTag,       &decode_as<HttpCallbackForwarder>},
    {TelegramBotForwarder::kTag,        &decode_as<TelegramBotForwarder>},
    {ManagedRelayForwarder::kTag,       &decode_as<ManagedRelayForwarder>},
    {ManagedRelayForwarder::kLegacyTag, &decode_as<ManagedRelayForwarder>},
};

ConfigJson encode_forwarder(const Forwarder& forwarder) {
    return std::visit([](const auto& f) {
        ConfigJson record = ConfigJson::object();
        record[std::decay_t<decltype(f)>::kTag] = f.to_json();
        return record;
    }, forwarder);
}

std::string dump_forwarder(const Forwarder& forwarder) {
    return encode_forwarder(forwarder).dump();
}

// Flat records predate the tag wrapper; pick the variant by its fields.
static Forwarder decode_flat(const ConfigJson& record) {
    if (record.contains("tgHandle") || record.contains("tgCode"))
        return ManagedRelayForwarder::from_json(record);
    if (record.contains("token") || record.contains("chatId"))
        return TelegramBotForwarder::from_json(record);
    if (record.contains("callbackUrl"))
        return HttpCallbackForwarder::from_json(record);
    throw ConfigError("Cannot determine the forwarder type of record: " + record.dump());
}

Forwarder decode_forwarder(const ConfigJson& record) {
    // Record stored as a string blob holding the JSON text
    if (record.is_string()) {
        ConfigJson inner;
        try {
            inner = ConfigJson::parse(record.get<std::string>());
        } catch (const nlohmann::json::parse_error& e) {
            throw ConfigError(std::string("Malformed forwarder record: ") + e.what());
        }
        if (!inner.is_object())
            throw ConfigError("Forwarder record must be a JSON object");
        return decode_forwarder(inner);
    }
    if (!record.is_object())
        throw ConfigError("Forwarder record must be a JSON object");

    if (record.size() == 1 && record.begin().value().is_object()) {
        const std::string tag = record.begin().key();
        for (const auto& entry : kDecoders) {
            if (tag == entry.tag) return entry.decode(record);
        }
        throw ConfigError("Unknown forwarder type: " + tag);
    }
    return decode_flat(record);
}

Forwarder parse_forwarder(const std::string& text) {
    ConfigJson record;
    try {
        record = ConfigJson::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(std::string("Malformed forwarder record: ") + e.what());
    }
    return decode_forwarder(record);
}

} // namespace smsrelay
