#pragma once
#include "http.hpp"
#include <stdexcept>

namespace smsrelay {

class MockHttpClient : public HttpClient {
public:
    HttpResponse next_response{200, "ok"};
    std::vector<HttpResponse> response_queue;
    bool throw_on_request = false;

    HttpMethod last_method = HttpMethod::Post;
    std::string last_url;
    std::string last_body;
    std::vector<Header> last_headers;
    int call_count = 0;

    HttpResponse request(HttpMethod method,
                         const std::string& url,
                         const std::string& body,
                         const std::vector<Header>& headers) override {
        call_count++;
        last_method = method;
        last_url = url;
        last_body = body;
        last_headers = headers;
        if (throw_on_request) throw std::runtime_error("connection reset");
        if (!response_queue.empty()) {
            auto resp = response_queue.front();
            response_queue.erase(response_queue.begin());
            return resp;
        }
        return next_response;
    }
};

} // namespace smsrelay
