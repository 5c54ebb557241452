#ifndef TORGEN_SHA1_HASHER_HEADER
#define TORGEN_SHA1_HASHER_HEADER

#include "types.hpp"

#include <string_view>
#include <utility> // declval

#include <openssl/sha.h>

namespace torgen {

/**
 * Incremental SHA-1 hashing, used for pieces, Merkle tree nodes and the info hash.
 *
 * The data that is to be hashed need not be kept in memory, it can be hashed
 * incrementally by feeding the hasher with buffers using the update() method. When all
 * buffers have been hashed, use the finish() method to return the final SHA-1 digest,
 * after which the hasher must be reset before it's used again.
 */
class sha1_hasher
{
    SHA_CTX context_;

public:

    sha1_hasher();

    void reset();

    sha1_hasher& update(std::string_view buffer);
    template<
        typename Container,
        typename = decltype(std::declval<Container>().data())
    > sha1_hasher& update(const Container& buffer);

    sha1_hash finish();
};

template<typename Container, typename>
sha1_hasher& sha1_hasher::update(const Container& buffer)
{
    return update(std::string_view(
        reinterpret_cast<const char*>(buffer.data()),
        buffer.size() * sizeof(*buffer.data())
    ));
}

/**
 * This is a convenience method for when update would be called only once because all
 * the data is available.
 */
template<typename Buffer>
sha1_hash create_sha1_digest(const Buffer& buffer)
{
    sha1_hasher hasher;
    hasher.update(buffer);
    return hasher.finish();
}

} // namespace torgen

#endif // TORGEN_SHA1_HASHER_HEADER
