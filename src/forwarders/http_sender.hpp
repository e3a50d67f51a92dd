#pragma once
#include "../http.hpp"
#include <string>
#include <vector>

namespace smsrelay {

// A fully built outbound request, ready for the transport.
struct OutgoingRequest {
    HttpMethod method = HttpMethod::Post;
    std::string url;
    std::string body;
    std::vector<Header> headers;
};

// Shared send path for the HTTP forwarders: performs one round trip and
// reports success iff the status is exactly 200. Non-200 statuses, transport
// failures (status 0) and exceptions thrown by the transport are logged
// under `label` and reported as false.
bool send_request(HttpClient& http, const OutgoingRequest& request,
                  const std::string& label);

} // namespace smsrelay
