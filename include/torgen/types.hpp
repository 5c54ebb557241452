#ifndef TORGEN_TYPES_HEADER
#define TORGEN_TYPES_HEADER

#include <cstdint>
#include <array>

namespace torgen {

// Pieces are hashed with SHA-1, and so are the nodes of the Merkle tree and the info
// dictionary, so all three share this type.
using sha1_hash = std::array<uint8_t, 20>;
using md5_hash = std::array<uint8_t, 16>;

namespace values {

// Used by the optional fields in metainfo_args to signal that the implementation
// should pick the value.
constexpr int none = -2;

} // values

} // namespace torgen

#endif // TORGEN_TYPES_HEADER
