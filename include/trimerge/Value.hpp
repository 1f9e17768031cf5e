/**
 * @file Value.hpp
 * @brief Document value model for three-way merging
 *
 * Uses nlohmann::json as the underlying tree and classifies every node
 * into one of four structural kinds:
 * - Map      (JSON object, unordered unique keys)
 * - Sequence (JSON array)
 * - Text     (JSON string, indexed by code point)
 * - Scalar   (null, boolean, numbers)
 */

#ifndef TRIMERGE_VALUE_HPP
#define TRIMERGE_VALUE_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace trimerge {

/**
 * @brief JSON-like document value
 *
 * Alias for nlohmann::json. Base, local and remote documents are passed
 * around as const references and are never modified by a merge.
 */
using Value = nlohmann::json;

/**
 * @brief Closed set of structural kinds
 */
enum class ValueKind {
    Map,
    Sequence,
    Text,
    Scalar
};

/**
 * @brief Classify a value into its structural kind
 */
inline ValueKind kind_of(const Value& val) {
    switch (val.type()) {
        case Value::value_t::object:
            return ValueKind::Map;
        case Value::value_t::array:
            return ValueKind::Sequence;
        case Value::value_t::string:
            return ValueKind::Text;
        case Value::value_t::null:
        case Value::value_t::boolean:
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned:
        case Value::value_t::number_float:
        case Value::value_t::binary:
        case Value::value_t::discarded:
            return ValueKind::Scalar;
    }
    return ValueKind::Scalar;
}

/**
 * @brief Human-readable kind name ("map", "sequence", "text", "scalar")
 */
inline const char* kind_name(ValueKind kind) {
    switch (kind) {
        case ValueKind::Map: return "map";
        case ValueKind::Sequence: return "sequence";
        case ValueKind::Text: return "text";
        case ValueKind::Scalar: return "scalar";
    }
    return "unknown";
}

/**
 * @brief Check if value is a collection (map, sequence or text)
 */
inline bool is_collection(const Value& val) {
    return kind_of(val) != ValueKind::Scalar;
}

/**
 * @brief Look up a map key, distinguishing absent keys from null values
 *
 * @param map A Map value
 * @param key Key to look up
 * @return std::nullopt if the key is absent; otherwise the stored value,
 *         which may itself be JSON null
 */
std::optional<Value> lookup(const Value& map, const std::string& key);

/**
 * @brief Split UTF-8 text into code points
 *
 * Each element of the result holds the bytes of one code point. Bytes that
 * do not start a valid sequence are returned as single-byte elements.
 */
std::vector<std::string> split_code_points(const std::string& text);

/**
 * @brief Length of a text in code points
 */
std::size_t text_length(const std::string& text);

/**
 * @brief Length of a Sequence or Text value in elements
 *
 * @throws UnsupportedValueKind for maps and scalars
 */
std::size_t sequence_length(const Value& val, const std::string& path = "");

} // namespace trimerge

#endif // TRIMERGE_VALUE_HPP
