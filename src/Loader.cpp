/**
 * @file Loader.cpp
 * @brief File loading implementation
 */

#include "trimerge/Loader.hpp"
#include "trimerge/Errors.hpp"
#include "trimerge/Util.hpp"

#include <toml++/toml.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace trimerge {

namespace {

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

template <typename T>
Value stringify(const T& v) {
    std::ostringstream ss;
    ss << v;
    return Value(ss.str());
}

/**
 * @brief Convert a toml++ node to a Value.
 */
Value toml_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());
        case toml::node_type::integer:
            return Value(node.as_integer()->get());
        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());
        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());
        case toml::node_type::date:
            return stringify(node.as_date()->get());
        case toml::node_type::time:
            return stringify(node.as_time()->get());
        case toml::node_type::date_time:
            return stringify(node.as_date_time()->get());
        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_to_json(elem));
            }
            return arr;
        }
        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_to_json(val);
            }
            return obj;
        }
        default:
            return Value(nullptr);
    }
}

} // anonymous namespace

Value load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    const std::string content = read_file(path);
    try {
        return Value::parse(content);
    } catch (const Value::parse_error& e) {
        // nlohmann reports a byte offset; turn it into line/column
        int line = 1, column = 1;
        for (std::size_t i = 0; i + 1 < e.byte && i < content.size(); ++i) {
            if (content[i] == '\n') {
                ++line;
                column = 1;
            } else {
                ++column;
            }
        }
        throw ParseError(path, line, column, e.what());
    }
}

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    try {
        toml::table table = toml::parse_file(path);
        return toml_to_json(table);
    } catch (const toml::parse_error& e) {
        throw ParseError(
            path,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }
}

std::string get_file_extension(const std::string& path) {
    return to_lower(fs::path(path).extension().string());
}

Value load_settings_file(const std::string& path) {
    if (path.empty()) {
        return Value::object();
    }
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return load_json_file(path);
    }
    if (ext == ".toml") {
        return load_toml_file(path);
    }
    throw ParseError(path, 0, 0, "unsupported settings file type '" + ext +
                                 "' (expected .json or .toml)");
}

} // namespace trimerge
