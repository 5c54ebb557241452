#ifndef TORGEN_MD5_HASHER_HEADER
#define TORGEN_MD5_HASHER_HEADER

#include "types.hpp"

#include <string_view>
#include <string>

#include <openssl/md5.h>

namespace torgen {

/**
 * Produces the optional whole-file checksums (the "md5sum" field). Used the same way
 * as sha1_hasher.
 */
class md5_hasher
{
    MD5_CTX context_;

public:

    md5_hasher();

    void reset();
    md5_hasher& update(std::string_view buffer);
    md5_hash finish();

    /** Finishes the digest and returns it as 32 lowercase hex characters. */
    std::string finish_hex();
};

} // namespace torgen

#endif // TORGEN_MD5_HASHER_HEADER
