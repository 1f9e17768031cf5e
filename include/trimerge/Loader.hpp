/**
 * @file Loader.hpp
 * @brief File loading for documents and settings
 *
 * - Documents (base/local/remote) are JSON files.
 * - Settings files are JSON or TOML, detected by extension.
 */

#ifndef TRIMERGE_LOADER_HPP
#define TRIMERGE_LOADER_HPP

#include "trimerge/Value.hpp"
#include <string>

namespace trimerge {

/**
 * @brief Load a JSON file.
 *
 * @param path Path to the JSON file
 * @return Parsed Value
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ParseError if the JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a TOML file and convert it to a Value.
 *
 * Tables become objects; dates and times become strings.
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ParseError if the TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a settings file, detecting the format by extension.
 *
 * An empty path loads nothing and returns an empty object.
 *
 * @throws FileNotFoundError if path is non-empty and the file doesn't exist
 * @throws ParseError on syntax errors or an unsupported extension
 */
Value load_settings_file(const std::string& path);

/**
 * @brief Get file extension (lowercase, including the dot).
 */
std::string get_file_extension(const std::string& path);

} // namespace trimerge

#endif // TRIMERGE_LOADER_HPP
