#include "trimerge/Util.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <regex>
#include <sstream>
#include <stdexcept>
#if defined(_WIN32)
  #include <windows.h>
  #include <cstring>
#else
  #include <unistd.h>
  extern char **environ;
#endif

namespace trimerge {

void deep_merge(nlohmann::json& a, const nlohmann::json& b) {
    if (!a.is_object() || !b.is_object()) {
        a = b;
        return;
    }
    for (auto it = b.begin(); it != b.end(); ++it) {
        auto ait = a.find(it.key());
        if (ait != a.end() && ait->is_object() && it->is_object()) {
            deep_merge(*ait, *it);
        } else {
            a[it.key()] = *it;
        }
    }
}

void set_by_dot(nlohmann::json& obj, const std::string& path, const nlohmann::json& value) {
    std::vector<std::string> parts = split(path, '.');
    if (parts.empty()) {
        return;
    }
    nlohmann::json* cur = &obj;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        auto& child = (*cur)[parts[i]];
        if (!child.is_object()) {
            child = nlohmann::json::object();
        }
        cur = &child;
    }
    (*cur)[parts.back()] = value;
}

const nlohmann::json* find_by_dot(const nlohmann::json& obj, const std::string& path) {
    const nlohmann::json* cur = &obj;
    for (const auto& part : split(path, '.')) {
        if (!cur->is_object()) return nullptr;
        auto it = cur->find(part);
        if (it == cur->end()) return nullptr;
        cur = &*it;
    }
    return cur;
}

nlohmann::json parse_value(const std::string& raw) {
    if (raw.empty()) {
        return raw;
    }

    const std::string lower = to_lower(raw);
    if (lower == "true") return true;
    if (lower == "false") return false;
    if (lower == "null") return nullptr;

    static const std::regex integer_re("^-?[0-9]+$");
    static const std::regex float_re("^-?[0-9]+\\.[0-9]+([eE][+-]?[0-9]+)?$");
    try {
        if (std::regex_match(raw, integer_re)) {
            return static_cast<std::int64_t>(std::stoll(raw));
        }
        if (std::regex_match(raw, float_re)) {
            return std::stod(raw);
        }
    } catch (const std::out_of_range&) {
        // Too large for a number; keep the text
        return raw;
    }

    const bool compound = (raw.front() == '{' && raw.back() == '}') ||
                          (raw.front() == '[' && raw.back() == ']');
    const bool quoted = raw.size() >= 2 && raw.front() == '"' && raw.back() == '"';
    if (compound || quoted) {
        nlohmann::json parsed = nlohmann::json::parse(raw, nullptr, false);
        if (!parsed.is_discarded() && (compound || parsed.is_string())) {
            return parsed;
        }
    }
    return raw;
}

std::map<std::string, nlohmann::json> parse_overrides(const std::string& s) {
    std::map<std::string, nlohmann::json> out;
    int depth = 0;
    bool in_str = false;
    std::string buf;
    auto flush = [&]() {
        auto pos = buf.find('=');
        if (pos != std::string::npos) {
            std::string k = trim(buf.substr(0, pos));
            if (!k.empty()) {
                out[k] = parse_value(trim(buf.substr(pos + 1)));
            }
        }
        buf.clear();
    };
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (in_str) {
            buf += c;
            if (c == '"' && s[i - 1] != '\\') in_str = false;
            continue;
        }
        if (c == '"') in_str = true;
        else if (c == '{' || c == '[') ++depth;
        else if (c == '}' || c == ']') --depth;
        else if (c == ',' && depth == 0) { flush(); continue; }
        buf += c;
    }
    flush();
    return out;
}

std::vector<std::pair<std::string, std::string>> enumerate_environment() {
    std::vector<std::pair<std::string, std::string>> envs;
#if defined(_WIN32)
    LPCH env = GetEnvironmentStringsA();
    if (!env) return envs;
    for (LPSTR var = env; *var != '\0'; var += std::strlen(var) + 1) {
        std::string entry(var);
        auto pos = entry.find('=');
        if (pos == std::string::npos || pos == 0) continue;
        envs.emplace_back(entry.substr(0, pos), entry.substr(pos + 1));
    }
    FreeEnvironmentStringsA(env);
#else
    if (environ) {
        for (char **env = environ; *env; ++env) {
            std::string entry(*env);
            auto pos = entry.find('=');
            if (pos == std::string::npos) continue;
            envs.emplace_back(entry.substr(0, pos), entry.substr(pos + 1));
        }
    }
#endif
    return envs;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string tok;
    std::istringstream iss(s);
    while (std::getline(iss, tok, delim)) {
        if (!tok.empty()) parts.push_back(tok);
    }
    return parts;
}

} // namespace trimerge
