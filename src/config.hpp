#pragma once
#include <chrono>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Typed lookups over an options object. A missing key yields the fallback,
// a key of the wrong type raises ConfigurationError.
namespace config {

using json = nlohmann::json;

std::string get_string(const json& cfg, const std::string& key, const std::string& fallback);
std::vector<std::string> get_string_list(const json& cfg, const std::string& key,
                                         const std::vector<std::string>& fallback);
// Seconds in the document, milliseconds in memory. Must round to at least
// 1 ms and stay within a year.
std::chrono::milliseconds get_seconds(const json& cfg, const std::string& key, std::chrono::milliseconds fallback);
// Rejects values outside int range.
int get_int(const json& cfg, const std::string& key, int fallback);

// Parses a JSON file; ConfigurationError when it is missing or malformed.
json load_file(const std::string& path);

} // namespace config
