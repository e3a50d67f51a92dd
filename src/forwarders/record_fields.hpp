#pragma once
#include "../config_error.hpp"
#include "../uri.hpp"
#include <optional>
#include <string>

namespace smsrelay {

// Helpers shared by the forwarder decoders. Each reads one field of a raw
// record: absent (or null) yields nullopt/empty, present with the wrong
// type throws ConfigError.

// Records may be wrapped as {"<tag>": {...}} or be the flat field object.
const ConfigJson& unwrap_record(const ConfigJson& record, const char* tag);

std::optional<std::string> string_field(const ConfigJson& fields, const char* key);

// Absent and empty are both treated as missing
std::string required_string(const ConfigJson& fields, const char* key,
                            const char* what);

// String→string object; non-string values are stringified. thread_id is dropped.
Fields payload_field(const ConfigJson& fields, const char* key);

ConfigJson payload_to_json(const Fields& payload);

} // namespace smsrelay
