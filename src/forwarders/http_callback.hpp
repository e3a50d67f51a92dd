#pragma once
#include "../config_error.hpp"
#include "../http.hpp"
#include "../sms.hpp"
#include "../uri.hpp"
#include "http_sender.hpp"
#include <string>

namespace smsrelay {

// Forwards SMS messages to a user-defined HTTP endpoint.
//
// GET:       endpoint + encode_query(sms fields ∪ uri_payload), no body.
// POST/PUT:  endpoint + encode_query(uri_payload), form body of
//            (sms fields ∪ body_payload).
//
// The caller is responsible for the endpoint's scheme being valid.
class HttpCallbackForwarder {
public:
    static constexpr const char* kTag = "HttpCallbackForwarder";

    explicit HttpCallbackForwarder(std::string callback_url,
                                   HttpMethod method = HttpMethod::Post,
                                   Fields uri_payload = {},
                                   Fields body_payload = {});

    // Fields: callbackUrl (required), method (default POST), uriPayload,
    // jsonPayload. Throws ConfigError.
    static HttpCallbackForwarder from_json(const ConfigJson& record);
    ConfigJson to_json() const;

    OutgoingRequest build_request(const SmsMessage& sms) const;
    bool forward(const SmsMessage& sms, HttpClient& http) const;

    const std::string& callback_url() const { return callback_url_; }
    HttpMethod method() const { return method_; }
    const Fields& uri_payload() const { return uri_payload_; }
    const Fields& body_payload() const { return body_payload_; }

    bool operator==(const HttpCallbackForwarder& other) const;
    bool operator!=(const HttpCallbackForwarder& other) const { return !(*this == other); }

protected:
    std::string callback_url_;
    HttpMethod method_;
    Fields uri_payload_;
    Fields body_payload_;
};

} // namespace smsrelay
