/**
 * @file Differ.hpp
 * @brief Edit-script computation (base → target)
 *
 * The merge engine only consumes edit scripts. Differencer is the seam
 * for plugging in a different diff algorithm; StructuralDifferencer is the
 * reference implementation used by merge().
 */

#ifndef TRIMERGE_DIFFER_HPP
#define TRIMERGE_DIFFER_HPP

#include "trimerge/Diff.hpp"
#include "trimerge/Value.hpp"

namespace trimerge {

/**
 * @brief Options for the reference differencer
 */
struct DifferOptions {
    /// Patch changed strings character-wise instead of replacing them
    bool patch_text = true;
};

/**
 * @brief Computes edit scripts between two values of one collection kind
 */
class Differencer {
public:
    virtual ~Differencer() = default;

    /**
     * @brief Compute the edit script transforming @p base into @p target
     *
     * Must be deterministic, and every key or range in the result must be
     * valid against @p base.
     */
    virtual EditScript diff(const Value& base, const Value& target) const = 0;
};

/**
 * @brief Reference differencer
 *
 * Maps:
 * - Keys only in base → remove
 * - Keys only in target → add
 * - Changed values of the same collection kind → patch (recursive)
 * - Other changed values → replace
 *
 * Sequences and text are aligned with a longest common subsequence.
 * Unmatched gaps produce patch entries for leading pairs of same-kind
 * collections, then one addrange followed by one removerange anchored at
 * the same base index.
 *
 * Postcondition: patch(base, diff(base, target)) == target.
 */
class StructuralDifferencer : public Differencer {
public:
    explicit StructuralDifferencer(DifferOptions options = {});

    /**
     * @throws std::invalid_argument if base and target are not collections
     *         of the same kind
     */
    EditScript diff(const Value& base, const Value& target) const override;

    const DifferOptions& options() const noexcept { return options_; }

private:
    DifferOptions options_;

    EditScript diff_maps(const Value& base, const Value& target) const;
    EditScript diff_sequences(const Value& base, const Value& target) const;
    EditScript diff_text(const std::string& base, const std::string& target) const;
    bool patchable(const Value& a, const Value& b) const;
};

/**
 * @brief Convenience wrapper around StructuralDifferencer
 */
EditScript diff(const Value& base, const Value& target, const DifferOptions& options = {});

} // namespace trimerge

#endif // TRIMERGE_DIFFER_HPP
