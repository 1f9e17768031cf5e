/**
 * @file Differ.cpp
 * @brief Reference differencer implementation
 */

#include "trimerge/Differ.hpp"

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <utility>

namespace trimerge {

namespace {

using Match = std::pair<std::size_t, std::size_t>;

/**
 * @brief Matched index pairs of a longest common subsequence, ascending
 *
 * Common prefix and suffix are matched directly, the middle part with a
 * dynamic-programming table.
 */
template <typename T>
std::vector<Match> lcs_matches(const std::vector<T>& a, const std::vector<T>& b) {
    std::vector<Match> matches;

    std::size_t prefix = 0;
    while (prefix < a.size() && prefix < b.size() && a[prefix] == b[prefix]) {
        matches.emplace_back(prefix, prefix);
        ++prefix;
    }

    std::size_t suffix = 0;
    while (suffix < a.size() - prefix && suffix < b.size() - prefix &&
           a[a.size() - 1 - suffix] == b[b.size() - 1 - suffix]) {
        ++suffix;
    }

    const std::size_t n = a.size() - prefix - suffix;
    const std::size_t m = b.size() - prefix - suffix;
    if (n > 0 && m > 0) {
        // table[i][j] = LCS length of a[prefix+i:] and b[prefix+j:]
        std::vector<std::vector<std::uint32_t>> table(n + 1, std::vector<std::uint32_t>(m + 1, 0));
        for (std::size_t i = n; i-- > 0;) {
            for (std::size_t j = m; j-- > 0;) {
                if (a[prefix + i] == b[prefix + j]) {
                    table[i][j] = table[i + 1][j + 1] + 1;
                } else {
                    table[i][j] = std::max(table[i + 1][j], table[i][j + 1]);
                }
            }
        }
        std::size_t i = 0, j = 0;
        while (i < n && j < m) {
            if (a[prefix + i] == b[prefix + j]) {
                matches.emplace_back(prefix + i, prefix + j);
                ++i;
                ++j;
            } else if (table[i + 1][j] >= table[i][j + 1]) {
                ++i;
            } else {
                ++j;
            }
        }
    }

    for (std::size_t s = suffix; s > 0; --s) {
        matches.emplace_back(a.size() - s, b.size() - s);
    }
    return matches;
}

/**
 * @brief Walk the unmatched gaps between LCS matches
 *
 * Calls @p on_gap(base_begin, base_end, target_begin, target_end) for each
 * non-empty gap, in ascending order.
 */
template <typename OnGap>
void for_each_gap(const std::vector<Match>& matches, std::size_t n, std::size_t m, OnGap on_gap) {
    std::size_t i = 0, j = 0;
    for (const auto& [mi, mj] : matches) {
        if (mi > i || mj > j) {
            on_gap(i, mi, j, mj);
        }
        i = mi + 1;
        j = mj + 1;
    }
    if (n > i || m > j) {
        on_gap(i, n, j, m);
    }
}

} // anonymous namespace

StructuralDifferencer::StructuralDifferencer(DifferOptions options)
    : options_(options)
{}

EditScript StructuralDifferencer::diff(const Value& base, const Value& target) const {
    const ValueKind kind = kind_of(base);
    if (kind != kind_of(target) || kind == ValueKind::Scalar) {
        throw std::invalid_argument(std::string("cannot diff ") + kind_name(kind) +
                                    " against " + kind_name(kind_of(target)));
    }
    switch (kind) {
        case ValueKind::Map:
            return diff_maps(base, target);
        case ValueKind::Sequence:
            return diff_sequences(base, target);
        case ValueKind::Text:
            return diff_text(base.get_ref<const std::string&>(),
                             target.get_ref<const std::string&>());
        case ValueKind::Scalar:
            break;
    }
    return {};
}

bool StructuralDifferencer::patchable(const Value& a, const Value& b) const {
    const ValueKind kind = kind_of(a);
    if (kind != kind_of(b)) {
        return false;
    }
    return kind == ValueKind::Map || kind == ValueKind::Sequence ||
           (kind == ValueKind::Text && options_.patch_text);
}

EditScript StructuralDifferencer::diff_maps(const Value& base, const Value& target) const {
    // Object iteration is ordered by key, so both loops emit sorted keys;
    // merge the two streams to keep the script sorted.
    std::map<std::string, DiffEntry> entries;

    for (auto it = base.begin(); it != base.end(); ++it) {
        auto tit = target.find(it.key());
        if (tit == target.end()) {
            entries.emplace(it.key(), op_remove(it.key()));
        } else if (*it != *tit) {
            if (patchable(*it, *tit)) {
                entries.emplace(it.key(), op_patch(it.key(), diff(*it, *tit)));
            } else {
                entries.emplace(it.key(), op_replace(it.key(), *tit));
            }
        }
    }
    for (auto it = target.begin(); it != target.end(); ++it) {
        if (!base.contains(it.key())) {
            entries.emplace(it.key(), op_add(it.key(), *it));
        }
    }

    EditScript script;
    script.reserve(entries.size());
    for (auto& [key, entry] : entries) {
        script.push_back(std::move(entry));
    }
    return script;
}

EditScript StructuralDifferencer::diff_sequences(const Value& base, const Value& target) const {
    const std::vector<Value> a(base.begin(), base.end());
    const std::vector<Value> b(target.begin(), target.end());

    EditScript script;
    for_each_gap(lcs_matches(a, b), a.size(), b.size(),
                 [&](std::size_t i0, std::size_t i1, std::size_t j0, std::size_t j1) {
        std::size_t p = 0;
        while (i0 + p < i1 && j0 + p < j1 && patchable(a[i0 + p], b[j0 + p])) {
            EditScript nested = diff(a[i0 + p], b[j0 + p]);
            if (!nested.empty()) {
                script.push_back(op_patch(i0 + p, std::move(nested)));
            }
            ++p;
        }
        if (j0 + p < j1) {
            Value inserted = Value::array();
            for (std::size_t j = j0 + p; j < j1; ++j) {
                inserted.push_back(b[j]);
            }
            script.push_back(op_addrange(i0 + p, std::move(inserted)));
        }
        if (i0 + p < i1) {
            script.push_back(op_removerange(i0 + p, i1 - i0 - p));
        }
    });
    return script;
}

EditScript StructuralDifferencer::diff_text(const std::string& base, const std::string& target) const {
    const std::vector<std::string> a = split_code_points(base);
    const std::vector<std::string> b = split_code_points(target);

    EditScript script;
    for_each_gap(lcs_matches(a, b), a.size(), b.size(),
                 [&](std::size_t i0, std::size_t i1, std::size_t j0, std::size_t j1) {
        if (j1 > j0) {
            std::string inserted;
            for (std::size_t j = j0; j < j1; ++j) {
                inserted += b[j];
            }
            script.push_back(op_addrange(i0, Value(std::move(inserted))));
        }
        if (i1 > i0) {
            script.push_back(op_removerange(i0, i1 - i0));
        }
    });
    return script;
}

EditScript diff(const Value& base, const Value& target, const DifferOptions& options) {
    return StructuralDifferencer(options).diff(base, target);
}

} // namespace trimerge
