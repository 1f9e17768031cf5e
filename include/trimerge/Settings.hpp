/**
 * @file Settings.hpp
 * @brief Layered settings for the merge tool
 *
 * Precedence (lowest to highest):
 * 1. Built-in defaults
 * 2. Settings file (.json or .toml)
 * 3. Environment variables with prefix (TRIMERGE_MERGE_MAX_DEPTH=10)
 * 4. Explicit overrides (command line)
 *
 * Recognized keys:
 * - merge.max_depth  (integer >= 1)
 * - diff.patch_text  (boolean)
 * - log.level        (trace|debug|info|warning|error|fatal|off)
 * - output.indent    (integer >= -1, -1 prints compact JSON)
 */

#ifndef TRIMERGE_SETTINGS_HPP
#define TRIMERGE_SETTINGS_HPP

#include "trimerge/Differ.hpp"
#include "trimerge/Merge.hpp"
#include "trimerge/Value.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace trimerge {

/**
 * @brief Where to read settings from
 */
struct SettingsSources {
    std::optional<std::string> file_path;
    std::optional<std::string> env_prefix = std::string("TRIMERGE"); // nullopt disables
    std::map<std::string, Value> overrides;                          // dot-path → value
};

/**
 * @brief Transform an environment variable name (prefix removed) to a dot-path
 *
 * Lowercases, maps "_" to "." and "__" to a literal "_":
 *   MERGE_MAX__DEPTH -> merge.max_depth
 *   LOG_LEVEL        -> log.level
 */
std::string transform_env_name(const std::string& name);

/**
 * @brief Dot-paths of all leaves of an object tree
 */
std::set<std::string> flatten_keys(const Value& data, const std::string& prefix = "");

/**
 * @brief Match an env-derived dot-path against known setting keys
 *
 * Keys containing underscores cannot be spelled with single underscores in
 * a variable name, so "merge.max.depth" resolves to "merge.max_depth" when
 * that key is known. Unknown paths are returned unchanged.
 */
std::string remap_env_key(const std::string& dot_path, const std::set<std::string>& known_keys);

/**
 * @brief Environment variables under @p prefix as dot-path overrides
 *
 * Matching is case-insensitive on "{PREFIX}_". Values are typed with
 * parse_value().
 */
std::map<std::string, Value> collect_env_overrides(
    const std::string& prefix,
    const std::vector<std::pair<std::string, std::string>>& environment);

/**
 * @brief Validated settings tree
 */
class Settings {
public:
    /// Built-in defaults
    static Value defaults();

    /**
     * @brief Load with precedence defaults → file → env → overrides
     * @throws FileNotFoundError, ParseError, SettingsError
     */
    static Settings load(const SettingsSources& sources);

    /**
     * @brief Validate @p data layered over defaults()
     * @throws SettingsError for wrong types or out-of-range values
     */
    explicit Settings(const Value& data = Value::object());

    const Value& data() const noexcept { return data_; }

    MergeOptions merge_options() const;
    DifferOptions differ_options() const;
    std::string log_level() const;
    int indent() const;

private:
    Value data_;

    void validate() const;
};

} // namespace trimerge

#endif // TRIMERGE_SETTINGS_HPP
