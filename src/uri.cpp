#include "uri.hpp"

#include <algorithm>
#include <cctype>

namespace smsrelay {

static bool is_unreserved(unsigned char c) {
    if (std::isalnum(c)) return true;
    switch (c) {
        case '-': case '_': case '.': case '!': case '~':
        case '*': case '\'': case '(': case ')':
            return true;
        default:
            return false;
    }
}

std::string uri_encode_component(const std::string& value) {
    static const char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (c < 0x80 && is_unreserved(c)) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }
    return out;
}

std::string encode_query(const Fields& fields) {
    std::string uri = "?";
    for (const auto& [key, value] : fields) {
        if (key == kThreadIdKey) continue;
        uri += key + "=" + uri_encode_component(value) + "&";
    }
    return uri;
}

std::string encode_form(const Fields& fields) {
    std::string body;
    for (const auto& [key, value] : fields) {
        if (key == kThreadIdKey) continue;
        if (!body.empty()) body += '&';
        body += uri_encode_component(key) + "=" + uri_encode_component(value);
    }
    return body;
}

void merge_fields(Fields& into, const Fields& from) {
    for (const auto& entry : from) {
        auto it = std::find_if(into.begin(), into.end(),
                               [&](const Field& f) { return f.first == entry.first; });
        if (it != into.end())
            it->second = entry.second;
        else
            into.push_back(entry);
    }
}

void erase_field(Fields& fields, const std::string& key) {
    fields.erase(std::remove_if(fields.begin(), fields.end(),
                                [&](const Field& f) { return f.first == key; }),
                 fields.end());
}

} // namespace smsrelay
