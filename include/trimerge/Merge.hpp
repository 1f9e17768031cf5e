/**
 * @file Merge.hpp
 * @brief Three-way structural merge
 *
 * Classifies how each part of base, local and remote should be combined
 * and returns the ordered list of merge decisions. Nothing is resolved or
 * materialized here.
 *
 * Map keys (per key, keys in lexicographic order within each group):
 * - untouched on both sides         → keep
 * - touched on one side             → onesided
 * - removed on both sides           → agreement
 * - same op with equal result       → agreement
 * - different ops                   → conflict
 * - add/add or replace/replace      → conflict
 * - patch/patch with distinct result → recurse into the key
 *
 * Nested decision paths join keys as JSON Pointer tokens ("~" → "~0",
 * "/" → "~1").
 *
 * Sequences and text (per chunk, first match wins):
 * - no changes                      → keep_chunk
 * - changes on one side             → onesided_chunk
 * - insertions only, on both sides  → local_then_remote (+ keep_chunk)
 * - equal changes                   → agreement_chunk
 * - anything else                   → conflict_chunk, no finer recursion
 */

#ifndef TRIMERGE_MERGE_HPP
#define TRIMERGE_MERGE_HPP

#include "trimerge/Chunks.hpp"
#include "trimerge/Decisions.hpp"
#include "trimerge/Differ.hpp"
#include "trimerge/Value.hpp"
#include <cstddef>

namespace trimerge {

/**
 * @brief Merge policy knobs
 */
struct MergeOptions {
    /// Maximum nesting depth of recursive merges (root is depth 0)
    std::size_t max_depth = 64;
};

/**
 * @brief Merge with precomputed edit scripts
 *
 * @param base Common ancestor
 * @param local Local version
 * @param remote Remote version
 * @param base_local_diff Edit script base → local
 * @param base_remote_diff Edit script base → remote
 * @param options Merge policy
 * @return Decisions in emission order
 *
 * @throws StructuralKindMismatch if the kinds diverge at a merged path
 * @throws UnsupportedValueKind if a scalar needs a structural merge
 * @throws DepthExceeded if nesting exceeds options.max_depth
 * @throws InvalidEditScript if a script does not fit the documents
 * @throws ContractViolation on internal defects
 */
Decisions merge_with_diff(const Value& base, const Value& local, const Value& remote,
                          const EditScript& base_local_diff,
                          const EditScript& base_remote_diff,
                          const MergeOptions& options = {});

/**
 * @brief Merge with precomputed edit scripts and a custom chunker
 */
Decisions merge_with_diff(const Value& base, const Value& local, const Value& remote,
                          const EditScript& base_local_diff,
                          const EditScript& base_remote_diff,
                          const Chunker& chunker,
                          const MergeOptions& options = {});

/**
 * @brief Compute both edit scripts with @p differencer, then merge
 */
Decisions merge(const Value& base, const Value& local, const Value& remote,
                const Differencer& differencer,
                const MergeOptions& options = {});

/**
 * @brief Compute both edit scripts with the reference differencer, then merge
 *
 * Example:
 * ```cpp
 * Value base = {{"x", 1}};
 * auto decisions = merge(base, {{"x", 2}}, {{"x", 3}});
 * // One decision for "x": conflict == true, action == Action::Undecided
 * ```
 */
Decisions merge(const Value& base, const Value& local, const Value& remote,
                const MergeOptions& options = {},
                const DifferOptions& differ_options = {});

} // namespace trimerge

#endif // TRIMERGE_MERGE_HPP
