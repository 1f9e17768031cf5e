/**
 * @file Chunks.cpp
 * @brief Reference chunker implementation
 */

#include "trimerge/Chunks.hpp"
#include "trimerge/Errors.hpp"

#include <set>

namespace trimerge {

namespace {

/**
 * @brief Base range [first, second) affected by a sequence entry
 */
std::pair<std::size_t, std::size_t> entry_range(const DiffEntry& e, std::size_t base_length) {
    const std::size_t j = index_key(e);
    std::size_t k = j;
    switch (e.op) {
        case DiffOp::AddRange:
            break;
        case DiffOp::Patch:
            k = j + 1;
            break;
        case DiffOp::RemoveRange:
            k = j + e.length;
            break;
        case DiffOp::Add:
        case DiffOp::Remove:
        case DiffOp::Replace:
            throw InvalidEditScript(std::string("op '") + to_string(e.op) +
                                    "' in a sequence edit script");
    }
    if (k > base_length) {
        throw InvalidEditScript("entry '" + std::string(to_string(e.op)) + "' at " +
                                std::to_string(j) + " reaches past base length " +
                                std::to_string(base_length));
    }
    return {j, k};
}

/**
 * @brief Check ordering and collect range boundaries of one script
 */
void collect_boundaries(const EditScript& script, std::size_t base_length,
                        std::set<std::size_t>& boundaries) {
    std::size_t last_end = 0;
    for (const auto& e : script) {
        const auto [j, k] = entry_range(e, base_length);
        if (j < last_end) {
            throw InvalidEditScript("sequence edit script entries are unsorted or overlap at " +
                                    std::to_string(j));
        }
        boundaries.insert(j);
        boundaries.insert(k);
        last_end = k;
    }
}

/**
 * @brief Split removeranges so that none crosses a boundary
 */
EditScript split_on_boundaries(const EditScript& script, const std::vector<std::size_t>& boundaries) {
    EditScript out;
    out.reserve(script.size());
    std::size_t b = 0;
    for (const auto& e : script) {
        if (e.op != DiffOp::RemoveRange) {
            out.push_back(e);
            continue;
        }
        const std::size_t j = index_key(e);
        const std::size_t k = j + e.length;
        while (boundaries[b] < j) {
            ++b;
        }
        while (boundaries[b] < k) {
            out.push_back(op_removerange(boundaries[b], boundaries[b + 1] - boundaries[b]));
            ++b;
        }
    }
    return out;
}

/**
 * @brief Move entries keyed at @p j from @p script into @p into
 */
void take_anchored(const EditScript& script, std::size_t& pos, std::size_t j, EditScript& into) {
    while (pos < script.size() && index_key(script[pos]) == j) {
        into.push_back(script[pos]);
        ++pos;
    }
}

} // anonymous namespace

std::vector<Chunk> BoundaryChunker::make_chunks(std::size_t base_length,
                                                const EditScript& local,
                                                const EditScript& remote) const {
    std::set<std::size_t> boundary_set{0, base_length};
    collect_boundaries(local, base_length, boundary_set);
    collect_boundaries(remote, base_length, boundary_set);
    const std::vector<std::size_t> boundaries(boundary_set.begin(), boundary_set.end());

    const EditScript d0 = split_on_boundaries(local, boundaries);
    const EditScript d1 = split_on_boundaries(remote, boundaries);

    std::vector<Chunk> chunks;
    std::size_t i0 = 0, i1 = 0;
    for (std::size_t b = 0; b + 1 < boundaries.size(); ++b) {
        Chunk chunk;
        chunk.begin = boundaries[b];
        chunk.end = boundaries[b + 1];
        take_anchored(d0, i0, chunk.begin, chunk.local);
        take_anchored(d1, i1, chunk.begin, chunk.remote);
        chunks.push_back(std::move(chunk));
    }

    // Insertions after the last base element
    Chunk tail;
    tail.begin = base_length;
    tail.end = base_length;
    take_anchored(d0, i0, base_length, tail.local);
    take_anchored(d1, i1, base_length, tail.remote);
    if (!tail.local.empty() || !tail.remote.empty()) {
        chunks.push_back(std::move(tail));
    }

    if (i0 != d0.size() || i1 != d1.size()) {
        throw InvalidEditScript("sequence edit script entries could not be aligned to chunks");
    }
    return chunks;
}

std::vector<Chunk> make_merge_chunks(std::size_t base_length,
                                     const EditScript& local,
                                     const EditScript& remote) {
    return BoundaryChunker().make_chunks(base_length, local, remote);
}

} // namespace trimerge
