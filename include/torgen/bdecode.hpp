#ifndef TORGEN_BDECODE_HEADER
#define TORGEN_BDECODE_HEADER

#include "bencode.hpp"

#include <string_view>
#include <system_error>
#include <cstddef>

namespace torgen {

struct decode_result
{
    bvalue value;
    // The number of bytes the decoded value occupies in the input, starting at the
    // offset at which decoding began. On error this is the number of bytes that were
    // examined before the malformed element was found.
    size_t length = 0;
};

/**
 * Decodes the single bencoded value that starts at offset in encoded. Bytes after it
 * are left alone, so a value embedded in a larger buffer can be decoded in place.
 *
 * Decoding is lenient where encoding is strict: map keys may appear in any order and
 * a repeated key overwrites the earlier value, and integers and string lengths may
 * have leading zeros (integers are normalized).
 *
 * Malformed input is reported through bencode_errc. The throwing overload throws a
 * bencode_error whose offset is the absolute position of the error in encoded.
 */
decode_result decode(std::string_view encoded, size_t offset, std::error_code& error);
decode_result decode(std::string_view encoded, size_t offset = 0);

} // namespace torgen

#endif // TORGEN_BDECODE_HEADER
