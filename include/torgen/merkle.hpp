#ifndef TORGEN_MERKLE_HEADER
#define TORGEN_MERKLE_HEADER

#include "types.hpp"

#include <string>
#include <vector>

namespace torgen {

/** The value of the "pieces" field: all piece hashes concatenated in order. */
std::string concat_piece_hashes(const std::vector<sha1_hash>& piece_hashes);

/**
 * Reduces piece_hashes to the root of a binary hash tree, see BEP 30.
 *
 * Each level is hashed pairwise, i.e. `parent = sha1(left || right)`, until a single
 * hash remains. If a level has an odd number of nodes, it's padded with that level's
 * padding hash, which is 20 zero bytes at the leaf level and the hash of two padding
 * hashes of the level below at each level above. A single hash is its own root.
 *
 * Throws std::invalid_argument if piece_hashes is empty.
 */
sha1_hash merkle_root(std::vector<sha1_hash> piece_hashes);

} // namespace torgen

#endif // TORGEN_MERKLE_HEADER
