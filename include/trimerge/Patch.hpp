/**
 * @file Patch.hpp
 * @brief Apply an edit script to a value
 *
 * Used by consumers that materialize documents from agreed decisions.
 * The merge engine never patches values itself.
 */

#ifndef TRIMERGE_PATCH_HPP
#define TRIMERGE_PATCH_HPP

#include "trimerge/Diff.hpp"
#include "trimerge/Value.hpp"

namespace trimerge {

/**
 * @brief Apply @p script to @p value and return the result
 *
 * Map scripts may use add, remove, replace and patch; sequence and text
 * scripts may use addrange, removerange and (sequences only) patch, sorted
 * by ascending base index.
 *
 * @throws InvalidEditScript if the script does not fit the value
 * @throws UnsupportedValueKind if @p value is a scalar and @p script is non-empty
 *
 * Example:
 * ```cpp
 * Value base = {{"a", 1}};
 * auto result = patch(base, {op_replace("a", 2), op_add("b", 3)});
 * // Result: {"a": 2, "b": 3}
 * ```
 */
Value patch(const Value& value, const EditScript& script);

} // namespace trimerge

#endif // TRIMERGE_PATCH_HPP
