#include "http_callback.hpp"
#include "record_fields.hpp"

namespace smsrelay {

HttpCallbackForwarder::HttpCallbackForwarder(std::string callback_url,
                                             HttpMethod method,
                                             Fields uri_payload,
                                             Fields body_payload)
    : callback_url_(std::move(callback_url)),
      method_(method),
      uri_payload_(std::move(uri_payload)),
      body_payload_(std::move(body_payload))
{
    erase_field(uri_payload_, kThreadIdKey);
    erase_field(body_payload_, kThreadIdKey);
}

HttpCallbackForwarder HttpCallbackForwarder::from_json(const ConfigJson& record) {
    const auto& fields = unwrap_record(record, kTag);

    std::string url = required_string(fields, "callbackUrl", "callback url");

    // Records written before the method field existed were POST-only
    HttpMethod method = HttpMethod::Post;
    auto method_str = string_field(fields, "method");
    if (method_str && !method_str->empty()) {
        auto parsed = parse_method(*method_str);
        if (!parsed)
            throw ConfigError("Invalid HTTP method: `" + *method_str + "`");
        method = *parsed;
    }

    return HttpCallbackForwarder(std::move(url), method,
                                 payload_field(fields, "uriPayload"),
                                 payload_field(fields, "jsonPayload"));
}

ConfigJson HttpCallbackForwarder::to_json() const {
    ConfigJson j = ConfigJson::object();
    j["callbackUrl"] = callback_url_;
    j["method"] = method_name(method_);
    j["uriPayload"] = payload_to_json(uri_payload_);
    j["jsonPayload"] = payload_to_json(body_payload_);
    return j;
}

OutgoingRequest HttpCallbackForwarder::build_request(const SmsMessage& sms) const {
    OutgoingRequest req;
    req.method = method_;

    Fields payload = sms_fields(sms);
    if (method_ == HttpMethod::Get) {
        merge_fields(payload, uri_payload_);
        req.url = callback_url_ + encode_query(payload);
        return req;
    }

    merge_fields(payload, body_payload_);
    req.url = callback_url_ + encode_query(uri_payload_);
    req.body = encode_form(payload);
    req.headers.emplace_back("Content-Type", "application/x-www-form-urlencoded");
    return req;
}

bool HttpCallbackForwarder::forward(const SmsMessage& sms, HttpClient& http) const {
    return send_request(http, build_request(sms), "callback");
}

bool HttpCallbackForwarder::operator==(const HttpCallbackForwarder& other) const {
    return callback_url_ == other.callback_url_ &&
           method_ == other.method_ &&
           uri_payload_ == other.uri_payload_ &&
           body_payload_ == other.body_payload_;
}

} // namespace smsrelay
