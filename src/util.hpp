#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <cstdint>
#include <functional>

namespace runbus {

// Clock returning Unix epoch milliseconds.
using NowFn = std::function<uint64_t()>;

// Unix epoch milliseconds
uint64_t epoch_millis();

// Trim whitespace
std::string trim(const std::string& s);

// Lowercase ASCII
std::string to_lower(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Render an arbitrary error value as a single log-friendly line.
// Strings pass through, {name, message} objects become "name: message",
// everything else is dumped. Truncated to max_len bytes.
std::string format_for_log(const nlohmann::json& error, size_t max_len = 2000);

// String field of a JSON object, or empty if absent / not a string.
std::string json_string_field(const nlohmann::json& obj, const char* key);

} // namespace runbus
