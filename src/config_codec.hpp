#pragma once
#include "forwarder.hpp"
#include <string>

namespace smsrelay {

// {"<Tag>": {<fields>}}
ConfigJson encode_forwarder(const Forwarder& forwarder);

// Compact JSON text of encode_forwarder()
std::string dump_forwarder(const Forwarder& forwarder);

// Decode a persisted record. A single key mapping to an object selects the
// variant by tag. Anything else is a legacy flat record whose variant is
// inferred from its fields. A string value is taken as the record's JSON
// text. Throws ConfigError.
Forwarder decode_forwarder(const ConfigJson& record);

// Parse JSON text, then decode_forwarder(). Syntax errors become ConfigError.
Forwarder parse_forwarder(const std::string& text);

} // namespace smsrelay
