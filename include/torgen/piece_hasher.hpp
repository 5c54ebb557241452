#ifndef TORGEN_PIECE_HASHER_HEADER
#define TORGEN_PIECE_HASHER_HEADER

#include "sha1_hasher.hpp"
#include "types.hpp"
#include "path.hpp"

#include <string_view>
#include <cstdint>
#include <string>
#include <vector>

namespace torgen {

/**
 * Splits a logical byte stream into pieces of piece_length bytes and hashes each with
 * SHA-1. The stream may be fed in arbitrarily sized buffers, and a piece may be made
 * up of bytes from several buffers (e.g. the tail of one file and the head of the
 * next), since the digest of the current piece is computed incrementally.
 *
 * Each piece is hashed as soon as its last byte arrives, so the stream is never held
 * in memory. After all data was fed, finish() hashes the trailing piece if it's
 * shorter than piece_length. If the stream's length is a multiple of piece_length no
 * empty piece is produced.
 */
class piece_hasher
{
    sha1_hasher hasher_;
    std::vector<sha1_hash> pieces_;
    int64_t piece_length_;
    // The number of bytes of the current, not yet hashed, piece that have been fed to
    // hasher_.
    int64_t num_pending_bytes_ = 0;
    int64_t num_bytes_ = 0;

public:

    /** Throws std::invalid_argument if piece_length is not positive. */
    explicit piece_hasher(const int64_t piece_length);

    void update(std::string_view buffer);
    void finish();

    int64_t piece_length() const noexcept { return piece_length_; }
    /** The total number of bytes that have been fed to update. */
    int64_t num_bytes() const noexcept { return num_bytes_; }
    int num_pieces() const noexcept { return static_cast<int>(pieces_.size()); }
    const std::vector<sha1_hash>& pieces() const noexcept { return pieces_; }
};

struct source_file
{
    fs::path path;
    // The length of the file when it was enumerated. If a different number of bytes
    // can be read from it, hashing fails.
    int64_t length;
};

struct hashed_files
{
    std::vector<sha1_hash> piece_hashes;
    // One for each source file, in the same order, if md5sums were requested,
    // otherwise empty. These are lowercase hex strings.
    std::vector<std::string> md5sums;
};

constexpr int default_read_buffer_size = 256 * 1024;

/**
 * Hashes the logical concatenation of files, in the given order, into pieces, and
 * optionally computes the MD5 checksum of each file while doing so.
 *
 * A metainfo_error is thrown with read_failed if a file can't be opened or read, and
 * with file_size_changed if its length is not the expected one. There is no partial
 * result.
 */
hashed_files hash_files(const std::vector<source_file>& files, const int64_t piece_length,
        const bool compute_md5sums, const int read_buffer_size = default_read_buffer_size);

} // namespace torgen

#endif // TORGEN_PIECE_HASHER_HEADER
