/**
 * @file Settings.cpp
 * @brief Settings loading and validation
 */

#include "trimerge/Settings.hpp"
#include "trimerge/Errors.hpp"
#include "trimerge/Loader.hpp"
#include "trimerge/Util.hpp"

#include <algorithm>
#include <cstdint>
#include <set>

namespace trimerge {

namespace {

const Value& setting(const Value& data, const std::string& key) {
    const Value* v = find_by_dot(data, key);
    if (v == nullptr) {
        throw SettingsError(key, "missing");
    }
    return *v;
}

std::int64_t integer_setting(const Value& data, const std::string& key, std::int64_t min) {
    const Value& v = setting(data, key);
    if (!v.is_number_integer()) {
        throw SettingsError(key, "expected an integer, got " + v.dump());
    }
    const auto n = v.get<std::int64_t>();
    if (n < min) {
        throw SettingsError(key, "must be at least " + std::to_string(min));
    }
    return n;
}

} // anonymous namespace

std::string transform_env_name(const std::string& name) {
    std::string out;
    const std::string lower = to_lower(name);
    for (std::size_t i = 0; i < lower.size(); ++i) {
        if (lower[i] != '_') {
            out += lower[i];
        } else if (i + 1 < lower.size() && lower[i + 1] == '_') {
            out += '_';
            ++i;
        } else {
            out += '.';
        }
    }
    return out;
}

std::set<std::string> flatten_keys(const Value& data, const std::string& prefix) {
    std::set<std::string> keys;
    if (!data.is_object()) {
        return keys;
    }
    for (auto it = data.begin(); it != data.end(); ++it) {
        const std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
        if (it->is_object() && !it->empty()) {
            auto nested = flatten_keys(*it, key);
            keys.insert(nested.begin(), nested.end());
        } else {
            keys.insert(key);
        }
    }
    return keys;
}

std::string remap_env_key(const std::string& dot_path, const std::set<std::string>& known_keys) {
    if (known_keys.count(dot_path) > 0) {
        return dot_path;
    }
    for (const auto& known : known_keys) {
        std::string dotted = known;
        std::replace(dotted.begin(), dotted.end(), '_', '.');
        if (dotted == dot_path) {
            return known;
        }
    }
    return dot_path;
}

std::map<std::string, Value> collect_env_overrides(
    const std::string& prefix,
    const std::vector<std::pair<std::string, std::string>>& environment) {
    std::map<std::string, Value> out;
    const std::string wanted = to_lower(prefix) + "_";
    for (const auto& [name, raw] : environment) {
        if (name.size() <= wanted.size() || to_lower(name.substr(0, wanted.size())) != wanted) {
            continue;
        }
        const std::string path = transform_env_name(name.substr(wanted.size()));
        if (!path.empty()) {
            out[path] = parse_value(raw);
        }
    }
    return out;
}

Value Settings::defaults() {
    return {
        {"merge", {{"max_depth", 64}}},
        {"diff", {{"patch_text", true}}},
        {"log", {{"level", "warning"}}},
        {"output", {{"indent", 2}}},
    };
}

Settings Settings::load(const SettingsSources& sources) {
    Value merged = defaults();

    if (sources.file_path.has_value()) {
        deep_merge(merged, load_settings_file(*sources.file_path));
    }

    if (sources.env_prefix.has_value() && !sources.env_prefix->empty()) {
        const auto known = flatten_keys(defaults());
        for (const auto& [path, value] :
             collect_env_overrides(*sources.env_prefix, enumerate_environment())) {
            set_by_dot(merged, remap_env_key(path, known), value);
        }
    }

    for (const auto& [path, value] : sources.overrides) {
        set_by_dot(merged, path, value);
    }

    return Settings(merged);
}

Settings::Settings(const Value& data)
    : data_(defaults())
{
    if (!data.is_object()) {
        throw SettingsError("", "settings must be an object, got " + data.dump());
    }
    deep_merge(data_, data);
    validate();
}

void Settings::validate() const {
    integer_setting(data_, "merge.max_depth", 1);
    integer_setting(data_, "output.indent", -1);

    if (!setting(data_, "diff.patch_text").is_boolean()) {
        throw SettingsError("diff.patch_text", "expected a boolean");
    }

    static const std::set<std::string> levels = {
        "trace", "debug", "info", "warning", "error", "fatal", "off"};
    const Value& level = setting(data_, "log.level");
    if (!level.is_string() || levels.count(to_lower(level.get<std::string>())) == 0) {
        throw SettingsError("log.level", "expected one of trace, debug, info, warning, "
                                         "error, fatal, off; got " + level.dump());
    }
}

MergeOptions Settings::merge_options() const {
    MergeOptions options;
    options.max_depth = static_cast<std::size_t>(integer_setting(data_, "merge.max_depth", 1));
    return options;
}

DifferOptions Settings::differ_options() const {
    DifferOptions options;
    options.patch_text = setting(data_, "diff.patch_text").get<bool>();
    return options;
}

std::string Settings::log_level() const {
    return to_lower(setting(data_, "log.level").get<std::string>());
}

int Settings::indent() const {
    return static_cast<int>(integer_setting(data_, "output.indent", -1));
}

} // namespace trimerge
