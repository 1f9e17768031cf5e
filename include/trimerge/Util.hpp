#ifndef TRIMERGE_UTIL_HPP
#define TRIMERGE_UTIL_HPP

#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace trimerge {

// Merge b into a (recursively). Values in b take precedence.
void deep_merge(nlohmann::json& a, const nlohmann::json& b);

// Set a nested value by dot-notation, creating intermediate objects
void set_by_dot(nlohmann::json& obj, const std::string& path, const nlohmann::json& value);

// Get a nested value by dot-notation. Returns nullptr if missing.
const nlohmann::json* find_by_dot(const nlohmann::json& obj, const std::string& path);

// Type a raw string from the environment or the command line.
// Order: bool, null, integer, float, JSON object/array, quoted string, raw string.
nlohmann::json parse_value(const std::string& raw);

// Parse "k1=v1,k2=v2" overrides; values typed with parse_value().
// Commas inside brackets, braces or quotes do not split.
std::map<std::string, nlohmann::json> parse_overrides(const std::string& s);

// Environment iteration: returns pairs (NAME, VALUE)
std::vector<std::pair<std::string, std::string>> enumerate_environment();

// Helpers
std::string to_lower(std::string s);
std::string trim(const std::string& s);
std::vector<std::string> split(const std::string& s, char delim);

} // namespace trimerge

#endif // TRIMERGE_UTIL_HPP
