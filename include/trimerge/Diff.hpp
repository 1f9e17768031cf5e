/**
 * @file Diff.hpp
 * @brief Edit-script model (nbdime JSON diff format)
 *
 * An edit script is an ordered list of diff entries transforming a base
 * value into a target value.
 *
 * Map entries are keyed by map key:
 * - add:     {"op": "add", "key": K, "value": V}
 * - remove:  {"op": "remove", "key": K}
 * - replace: {"op": "replace", "key": K, "value": V}
 * - patch:   {"op": "patch", "key": K, "diff": [...]}
 *
 * Sequence and text entries are keyed by a base index:
 * - addrange:    {"op": "addrange", "key": j, "valuelist": [...] or "..."}
 * - removerange: {"op": "removerange", "key": j, "length": n}
 * - patch:       {"op": "patch", "key": j, "diff": [...]}
 *
 * A sequence patch addresses exactly one base element [j, j+1).
 */

#ifndef TRIMERGE_DIFF_HPP
#define TRIMERGE_DIFF_HPP

#include "trimerge/Value.hpp"
#include <cstddef>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace trimerge {

/**
 * @brief Elementary edit operations
 */
enum class DiffOp {
    Add,
    Remove,
    Replace,
    Patch,
    AddRange,
    RemoveRange
};

/**
 * @brief Wire name of an operation ("add", "removerange", ...)
 */
const char* to_string(DiffOp op);

/**
 * @brief Parse a wire name into an operation
 * @throws InvalidEditScript for unknown names
 */
DiffOp parse_diff_op(const std::string& name);

/**
 * @brief Map key (string) or base index
 */
using DiffKey = std::variant<std::string, std::size_t>;

/**
 * @brief Render a key for messages and paths ("name" or "3")
 */
std::string format_key(const DiffKey& key);

struct DiffEntry;

/**
 * @brief Ordered list of diff entries for one base→target transition
 */
using EditScript = std::vector<DiffEntry>;

/**
 * @brief One tagged edit operation
 *
 * Only the payload field matching @c op is meaningful:
 * - Add, Replace: @c value is the new value
 * - AddRange: @c value is the inserted values (array, or string for text)
 * - RemoveRange: @c length is the number of removed elements
 * - Patch: @c diff is the nested edit script
 */
struct DiffEntry {
    DiffOp op = DiffOp::Add;
    DiffKey key;
    Value value;
    std::size_t length = 0;
    EditScript diff;
};

bool operator==(const DiffEntry& a, const DiffEntry& b);
bool operator!=(const DiffEntry& a, const DiffEntry& b);

// ============================================================================
// Entry constructors
// ============================================================================

DiffEntry op_add(const std::string& key, Value value);
DiffEntry op_remove(const std::string& key);
DiffEntry op_replace(const std::string& key, Value value);
DiffEntry op_patch(const std::string& key, EditScript diff);
DiffEntry op_patch(std::size_t index, EditScript diff);
DiffEntry op_addrange(std::size_t index, Value valuelist);
DiffEntry op_removerange(std::size_t index, std::size_t length);

// ============================================================================
// Key access
// ============================================================================

/**
 * @brief Map key of an entry
 * @throws InvalidEditScript if the entry is keyed by index
 */
const std::string& map_key(const DiffEntry& e);

/**
 * @brief Base index of an entry
 * @throws InvalidEditScript if the entry is keyed by map key
 */
std::size_t index_key(const DiffEntry& e);

/**
 * @brief Number of inserted elements of an addrange entry
 *
 * Counts array elements, or code points when the valuelist is text.
 */
std::size_t valuelist_length(const DiffEntry& e);

/**
 * @brief Index a map edit script by key
 *
 * @throws InvalidEditScript on duplicate keys, index keys or range ops
 */
std::map<std::string, const DiffEntry*> as_map_diff(const EditScript& script);

// ============================================================================
// JSON conversion (found by nlohmann::json through ADL)
// ============================================================================

void to_json(Value& j, const DiffEntry& e);

/**
 * @throws InvalidEditScript for missing fields or unknown ops
 */
void from_json(const Value& j, DiffEntry& e);

/**
 * @brief Parse a JSON array into an edit script
 * @throws InvalidEditScript if @p j is not an array of valid entries
 */
EditScript edit_script_from_json(const Value& j);

Value edit_script_to_json(const EditScript& script);

} // namespace trimerge

#endif // TRIMERGE_DIFF_HPP
