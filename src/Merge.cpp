/**
 * @file Merge.cpp
 * @brief Three-way merge engine
 */

#include "trimerge/Merge.hpp"
#include "trimerge/Errors.hpp"
#include "trimerge/Logging.hpp"

#include <algorithm>
#include <iterator>
#include <set>

namespace trimerge {

namespace {

/**
 * @brief Append @p key to @p path as a JSON Pointer reference token
 *
 * "~" is written as "~0" and "/" as "~1", so every path splits back into
 * its keys unambiguously.
 */
std::string child_path(const std::string& path, const std::string& key) {
    std::string out = path;
    out += '/';
    for (char c : key) {
        if (c == '~') {
            out += "~0";
        } else if (c == '/') {
            out += "~1";
        } else {
            out += c;
        }
    }
    return out;
}

bool only_insertions(const EditScript& script) {
    return std::all_of(script.begin(), script.end(),
                       [](const DiffEntry& e) { return e.op == DiffOp::AddRange; });
}

/**
 * @brief Recursive dispatcher and the kind-specific strategies
 *
 * Holds the builder of one top-level merge call by reference; an engine
 * is never shared between calls.
 */
class MergeEngine {
public:
    MergeEngine(const Chunker& chunker, const MergeOptions& options, MergeDecisionBuilder& decisions)
        : chunker_(chunker)
        , options_(options)
        , decisions_(decisions)
    {}

    void merge(const Value& base, const Value& local, const Value& remote,
               const EditScript& base_local_diff, const EditScript& base_remote_diff,
               const std::string& path, std::size_t depth) {
        if (depth > options_.max_depth) {
            throw DepthExceeded(path, options_.max_depth);
        }

        const ValueKind kind = kind_of(base);
        if (kind != kind_of(local) || kind != kind_of(remote)) {
            throw StructuralKindMismatch(path, kind_name(kind), kind_name(kind_of(local)),
                                         kind_name(kind_of(remote)));
        }

        LOG(DEBUG) << "merging " << kind_name(kind) << " at '" << path << "'";
        switch (kind) {
            case ValueKind::Map:
                merge_maps(base, local, remote, base_local_diff, base_remote_diff, path, depth);
                return;
            case ValueKind::Sequence:
                merge_chunks(base.size(), base_local_diff, base_remote_diff, path);
                return;
            case ValueKind::Text:
                // Character-level chunks; rejoining into text is left to
                // whoever applies the decisions.
                merge_chunks(text_length(base.get_ref<const std::string&>()),
                             base_local_diff, base_remote_diff, path);
                return;
            case ValueKind::Scalar:
                break;
        }
        throw UnsupportedValueKind(path, kind_name(kind));
    }

private:
    const Chunker& chunker_;
    const MergeOptions& options_;
    MergeDecisionBuilder& decisions_;

    void merge_maps(const Value& base, const Value& local, const Value& remote,
                    const EditScript& base_local_diff, const EditScript& base_remote_diff,
                    const std::string& path, std::size_t depth) {
        const auto ldiff = as_map_diff(base_local_diff);
        const auto rdiff = as_map_diff(base_remote_diff);

        std::set<std::string> lkeys, rkeys;
        for (const auto& kv : ldiff) lkeys.insert(kv.first);
        for (const auto& kv : rdiff) rkeys.insert(kv.first);

        // Untouched keys
        for (auto it = base.begin(); it != base.end(); ++it) {
            if (!lkeys.count(it.key()) && !rkeys.count(it.key())) {
                decisions_.keep(path, it.key());
            }
        }

        // Keys touched by one side only
        std::vector<std::string> onesided;
        std::set_symmetric_difference(lkeys.begin(), lkeys.end(), rkeys.begin(), rkeys.end(),
                                      std::back_inserter(onesided));
        for (const auto& key : onesided) {
            auto lit = ldiff.find(key);
            auto rit = rdiff.find(key);
            decisions_.onesided(path, key,
                                lit == ldiff.end() ? nullptr : lit->second,
                                rit == rdiff.end() ? nullptr : rit->second);
        }

        // Keys touched by both sides
        std::vector<std::string> twosided;
        std::set_intersection(lkeys.begin(), lkeys.end(), rkeys.begin(), rkeys.end(),
                              std::back_inserter(twosided));
        for (const auto& key : twosided) {
            const DiffEntry& ld = *ldiff.at(key);
            const DiffEntry& rd = *rdiff.at(key);

            if (ld.op != rd.op) {
                decisions_.conflict(path, key, ld, rd);
                continue;
            }

            switch (ld.op) {
                case DiffOp::Remove:
                    decisions_.agreement(path, key, ld, rd);
                    break;
                case DiffOp::Add:
                case DiffOp::Replace:
                    // No base value to recurse against for add; replace is atomic
                    if (ld.value == rd.value) {
                        decisions_.agreement(path, key, ld, rd);
                    } else {
                        decisions_.conflict(path, key, ld, rd);
                    }
                    break;
                case DiffOp::Patch: {
                    // Different scripts may still produce the same value
                    const auto lv = lookup(local, key);
                    if (lv && lv == lookup(remote, key)) {
                        decisions_.agreement(path, key, ld, rd);
                    } else {
                        merge_patched_key(base, local, remote, ld, rd, path, key, depth);
                    }
                    break;
                }
                case DiffOp::AddRange:
                case DiffOp::RemoveRange:
                    throw InvalidEditScript(std::string("range op '") + to_string(ld.op) +
                                            "' in a map edit script");
            }
        }
    }

    void merge_patched_key(const Value& base, const Value& local, const Value& remote,
                           const DiffEntry& ld, const DiffEntry& rd,
                           const std::string& path, const std::string& key, std::size_t depth) {
        const auto bv = lookup(base, key);
        const auto lv = lookup(local, key);
        const auto rv = lookup(remote, key);
        if (!bv || !lv || !rv) {
            throw InvalidEditScript("patch of key '" + key + "' at '" + path +
                                    "' which is absent from a document");
        }
        merge(*bv, *lv, *rv, ld.diff, rd.diff, child_path(path, key), depth + 1);
    }

    void merge_chunks(std::size_t base_length,
                      const EditScript& base_local_diff, const EditScript& base_remote_diff,
                      const std::string& path) {
        const auto chunks = chunker_.make_chunks(base_length, base_local_diff, base_remote_diff);
        check_partition(chunks, base_length, path);

        for (const auto& chunk : chunks) {
            const std::size_t j = chunk.begin;
            const std::size_t k = chunk.end;
            const EditScript& d0 = chunk.local;
            const EditScript& d1 = chunk.remote;

            if (d0.empty() && d1.empty()) {
                decisions_.keep_chunk(path, j, k);
            } else if (d0.empty() || d1.empty()) {
                decisions_.onesided_chunk(path, j, k, d0, d1);
            } else if (only_insertions(d0) && only_insertions(d1)) {
                // Simultaneous insertions at one anchor are merged, not
                // conflicted, even when both sides insert the same values
                decisions_.local_then_remote(path, j, k, d0, d1);
                if (j < k) {
                    decisions_.keep_chunk(path, j, k);
                }
            } else if (d0 == d1) {
                decisions_.agreement_chunk(path, j, k, d0, d1);
            } else {
                decisions_.conflict_chunk(path, j, k, d0, d1);
            }
        }
    }

    static void check_partition(const std::vector<Chunk>& chunks, std::size_t base_length,
                                const std::string& path) {
        std::size_t next = 0;
        for (const auto& chunk : chunks) {
            if (chunk.begin != next || chunk.end < chunk.begin) {
                throw ContractViolation("chunks do not partition the base sequence at '" + path +
                                        "' (chunk [" + std::to_string(chunk.begin) + ", " +
                                        std::to_string(chunk.end) + "))");
            }
            next = chunk.end;
        }
        if (next != base_length) {
            throw ContractViolation("chunks at '" + path + "' end at " + std::to_string(next) +
                                    " instead of " + std::to_string(base_length));
        }
    }
};

} // anonymous namespace

Decisions merge_with_diff(const Value& base, const Value& local, const Value& remote,
                          const EditScript& base_local_diff,
                          const EditScript& base_remote_diff,
                          const Chunker& chunker,
                          const MergeOptions& options) {
    MergeDecisionBuilder builder;
    MergeEngine engine(chunker, options, builder);
    engine.merge(base, local, remote, base_local_diff, base_remote_diff, "", 0);

    Decisions decisions = builder.validated();
    LOG(INFO) << "merge produced " << decisions.size() << " decisions, "
              << count_conflicts(decisions) << " conflicts";
    return decisions;
}

Decisions merge_with_diff(const Value& base, const Value& local, const Value& remote,
                          const EditScript& base_local_diff,
                          const EditScript& base_remote_diff,
                          const MergeOptions& options) {
    BoundaryChunker chunker;
    return merge_with_diff(base, local, remote, base_local_diff, base_remote_diff, chunker, options);
}

Decisions merge(const Value& base, const Value& local, const Value& remote,
                const Differencer& differencer,
                const MergeOptions& options) {
    const ValueKind kind = kind_of(base);
    if (kind != kind_of(local) || kind != kind_of(remote)) {
        throw StructuralKindMismatch("", kind_name(kind), kind_name(kind_of(local)),
                                     kind_name(kind_of(remote)));
    }
    if (kind == ValueKind::Scalar) {
        throw UnsupportedValueKind("", kind_name(kind));
    }
    const EditScript base_local_diff = differencer.diff(base, local);
    const EditScript base_remote_diff = differencer.diff(base, remote);
    return merge_with_diff(base, local, remote, base_local_diff, base_remote_diff, options);
}

Decisions merge(const Value& base, const Value& local, const Value& remote,
                const MergeOptions& options,
                const DifferOptions& differ_options) {
    const StructuralDifferencer differencer(differ_options);
    return merge(base, local, remote, differencer, options);
}

} // namespace trimerge
