/**
 * @file Chunks.hpp
 * @brief Alignment of two sequence edit scripts against a shared base
 *
 * A chunk is a base range [begin, end) together with the local and remote
 * entries anchored in it. Chunks partition [0, len(base)) without gaps or
 * overlaps, ordered by ascending begin. Insertions at the end of base form
 * a trailing zero-length chunk [len(base), len(base)).
 */

#ifndef TRIMERGE_CHUNKS_HPP
#define TRIMERGE_CHUNKS_HPP

#include "trimerge/Diff.hpp"
#include <cstddef>
#include <vector>

namespace trimerge {

struct Chunk {
    std::size_t begin = 0;
    std::size_t end = 0;
    EditScript local;
    EditScript remote;
};

/**
 * @brief Splits two sequence edit scripts into aligned chunks
 */
class Chunker {
public:
    virtual ~Chunker() = default;

    virtual std::vector<Chunk> make_chunks(std::size_t base_length,
                                           const EditScript& local,
                                           const EditScript& remote) const = 0;
};

/**
 * @brief Reference chunker
 *
 * Boundaries are 0, len(base) and the start and end of every entry on
 * either side. Removeranges are split on boundaries so no entry straddles
 * two chunks; every entry lands in the chunk starting at its key.
 */
class BoundaryChunker : public Chunker {
public:
    /**
     * @throws InvalidEditScript if a script is unsorted, overlapping,
     *         keyed by map key, or out of range for @p base_length
     */
    std::vector<Chunk> make_chunks(std::size_t base_length,
                                   const EditScript& local,
                                   const EditScript& remote) const override;
};

/**
 * @brief Chunk two scripts with the reference chunker
 */
std::vector<Chunk> make_merge_chunks(std::size_t base_length,
                                     const EditScript& local,
                                     const EditScript& remote);

} // namespace trimerge

#endif // TRIMERGE_CHUNKS_HPP
