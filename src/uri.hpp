#pragma once
#include <string>
#include <utility>
#include <vector>

namespace smsrelay {

// Ordered string→string mapping. Order is the emission order on the wire.
using Field = std::pair<std::string, std::string>;
using Fields = std::vector<Field>;

// Internal key that never leaves the device; dropped by every encoder below.
constexpr const char* kThreadIdKey = "thread_id";

// Percent-encode per URI component rules: A-Z a-z 0-9 - _ . ! ~ * ' ( )
// pass through, everything else becomes %XX (uppercase hex) byte-wise.
std::string uri_encode_component(const std::string& value);

// "?k1=v1&k2=v2&"; an empty mapping yields "?"
std::string encode_query(const Fields& fields);

// "k1=v1&k2=v2" (application/x-www-form-urlencoded request body)
std::string encode_form(const Fields& fields);

// Insert-or-assign each entry of `from`; existing keys keep their position.
void merge_fields(Fields& into, const Fields& from);

// Remove every `key` entry
void erase_field(Fields& fields, const std::string& key);

} // namespace smsrelay
