#include "http_sender.hpp"
#include "../util.hpp"
#include <iostream>

namespace smsrelay {

bool send_request(HttpClient& http, const OutgoingRequest& request,
                  const std::string& label) {
    HttpResponse resp;
    try {
        resp = http.request(request.method, request.url, request.body, request.headers);
    } catch (const std::exception& e) {
        std::cerr << "[forward] " << label << ": transport error: " << e.what()
                  << " (" << method_name(request.method) << " "
                  << redact_url(request.url) << ")\n";
        return false;
    }

    if (resp.status_code == 200) return true;

    if (resp.status_code == 0) {
        std::cerr << "[forward] " << label << ": no response from "
                  << redact_url(request.url) << "\n";
    } else {
        std::cerr << "[forward] " << label << ": delivery failed (status "
                  << resp.status_code << ") " << method_name(request.method) << " "
                  << redact_url(request.url) << "\n";
    }
    return false;
}

} // namespace smsrelay
