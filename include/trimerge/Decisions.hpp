/**
 * @file Decisions.hpp
 * @brief Merge decision records and their validating builder
 *
 * A merge decision says how one map key or one base range [j, k) should be
 * combined:
 * - base:              keep the base content
 * - local / remote:    take the one side that changed
 * - either:            both sides made the same change
 * - local_then_remote: both sides inserted; insert local then remote
 * - undecided:         conflict, left for later resolution
 *
 * Invariant: conflict == true exactly when action == undecided.
 */

#ifndef TRIMERGE_DECISIONS_HPP
#define TRIMERGE_DECISIONS_HPP

#include "trimerge/Diff.hpp"
#include "trimerge/Value.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace trimerge {

enum class Action {
    Base,
    Local,
    Remote,
    Either,
    Undecided,
    LocalThenRemote
};

const char* to_string(Action action);

/**
 * @throws std::invalid_argument for unknown names
 */
Action parse_action(const std::string& name);

/**
 * @brief Half-open base range [begin, end) addressed by a chunk decision
 */
struct KeyRange {
    std::size_t begin = 0;
    std::size_t end = 0;
};

inline bool operator==(const KeyRange& a, const KeyRange& b) {
    return a.begin == b.begin && a.end == b.end;
}

inline bool operator!=(const KeyRange& a, const KeyRange& b) {
    return !(a == b);
}

/**
 * @brief Map key or base range
 */
using DecisionKey = std::variant<std::string, KeyRange>;

/**
 * @brief Render a decision key ("name" or "[j, k)")
 */
std::string format_key(const DecisionKey& key);

/**
 * @brief One unit of merge output
 *
 * @c path addresses the collection holding @c key, from the document root
 * ("" for the root, "/cells/0" style below it, keys escaped as JSON
 * Pointer tokens). Absent diffs are
 * std::nullopt; @c custom_diff is reserved for later resolution and is
 * never set by the engine.
 */
struct MergeDecision {
    std::string path;
    DecisionKey key;
    bool conflict = false;
    Action action = Action::Base;
    std::optional<EditScript> local_diff;
    std::optional<EditScript> remote_diff;
    std::optional<EditScript> custom_diff;
};

using Decisions = std::vector<MergeDecision>;

bool has_conflicts(const Decisions& decisions);
std::size_t count_conflicts(const Decisions& decisions);

void to_json(Value& j, const MergeDecision& d);

/**
 * @throws std::invalid_argument or InvalidEditScript for malformed records,
 *         Value::exception for missing or mistyped fields
 */
void from_json(const Value& j, MergeDecision& d);

Value decisions_to_json(const Decisions& decisions);

// ============================================================================
// Builder
// ============================================================================

/**
 * @brief Append-only accumulator of merge decisions
 *
 * Every constructor validates its preconditions and throws
 * ContractViolation when they do not hold. A builder belongs to exactly
 * one top-level merge call.
 */
class MergeDecisionBuilder {
public:
    MergeDecisionBuilder() = default;
    MergeDecisionBuilder(const MergeDecisionBuilder&) = delete;
    MergeDecisionBuilder& operator=(const MergeDecisionBuilder&) = delete;

    /// Key untouched by both sides
    void keep(const std::string& path, const std::string& key);

    /// Key touched by exactly one side; the other pointer must be null
    void onesided(const std::string& path, const std::string& key,
                  const DiffEntry* local, const DiffEntry* remote);

    /// Key changed by both sides with the same op and the same result;
    /// the caller compares the resulting values, the scripts may differ
    void agreement(const std::string& path, const std::string& key,
                   const DiffEntry& local, const DiffEntry& remote);

    /// Key changed differently by both sides
    void conflict(const std::string& path, const std::string& key,
                  const DiffEntry& local, const DiffEntry& remote);

    void keep_chunk(const std::string& path, std::size_t begin, std::size_t end);

    void onesided_chunk(const std::string& path, std::size_t begin, std::size_t end,
                        const EditScript& local, const EditScript& remote);

    void agreement_chunk(const std::string& path, std::size_t begin, std::size_t end,
                         const EditScript& local, const EditScript& remote);

    void conflict_chunk(const std::string& path, std::size_t begin, std::size_t end,
                        const EditScript& local, const EditScript& remote);

    /// Both sides only insert at the chunk anchor; local goes first
    void local_then_remote(const std::string& path, std::size_t begin, std::size_t end,
                           const EditScript& local, const EditScript& remote);

    /// Decisions so far, in emission order
    const Decisions& decisions() const noexcept { return decisions_; }

    /**
     * @brief Check the conflict/action invariant and hand over the decisions
     */
    Decisions validated();

private:
    Decisions decisions_;

    void add(std::string path, DecisionKey key, bool conflict, Action action,
             std::optional<EditScript> local, std::optional<EditScript> remote);
};

} // namespace trimerge

#endif // TRIMERGE_DECISIONS_HPP
