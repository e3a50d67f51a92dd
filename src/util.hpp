#pragma once
#include <string>
#include <cstdint>

namespace smsrelay {

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename; creates parent directories.
// Returns false if any step fails.
bool atomic_write_file(const std::string& path, const std::string& content);

// Mask the token in Telegram Bot API URLs ("api.telegram.org/bot<token>/") for logging
std::string redact_url(const std::string& url);

} // namespace smsrelay
