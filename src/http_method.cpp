#include "http.hpp"

namespace smsrelay {

const char* method_name(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:  return "GET";
        case HttpMethod::Post: return "POST";
        case HttpMethod::Put:  return "PUT";
    }
    return "POST";
}

std::optional<HttpMethod> parse_method(const std::string& name) {
    if (name == "GET")  return HttpMethod::Get;
    if (name == "POST") return HttpMethod::Post;
    if (name == "PUT")  return HttpMethod::Put;
    return std::nullopt;
}

} // namespace smsrelay
