#ifndef TORGEN_METAINFO_HEADER
#define TORGEN_METAINFO_HEADER

#include "metainfo_args.hpp"
#include "bencode.hpp"
#include "types.hpp"
#include "path.hpp"

#include <optional>
#include <cstdint>
#include <string>
#include <vector>
#include <mutex>

namespace torgen {

// The "created by" field of every metainfo we produce.
constexpr char generator_name[] = "torgen 1.0";

struct file_entry
{
    // The file's path relative to the root directory, as a sequence of path elements
    // rather than a joined string, so that it's independent of the path separator.
    std::vector<std::string> path;
    int64_t length = 0;
    // Empty unless checksums were requested.
    std::string md5sum;
};

/**
 * The info dictionary, which describes the content itself. Its SHA-1 hash identifies
 * the content, so nothing in here may depend on how the content is announced.
 */
struct info_dict
{
    // The suggested name of the file, or of the root directory for multi-file
    // content.
    std::string name;

    int64_t piece_length = default_piece_length;

    // Single-file content has a length and optionally its md5sum, and no files.
    int64_t length = 0;
    std::string md5sum;

    // Multi-file content lists each of its files here, in the order in which they
    // were hashed. Empty for single-file content.
    std::vector<file_entry> files;

    // If is_merkle is set this is the 20 byte root of the piece hash tree ("root
    // hash"), otherwise the concatenation of all piece hashes ("pieces"). The two are
    // never both present.
    std::string piece_hashes;
    bool is_merkle = false;

    bool is_private = false;

    bool is_multi_file() const noexcept { return !files.empty(); }
    int64_t total_length() const noexcept;
};

bvalue to_bvalue(const info_dict& info);

namespace detail {

/**
 * A value that is computed on first use and then cached. Concurrent first uses are
 * serialized so the value is computed once. Copies share nothing but the cached value.
 */
template<typename T> class memoized
{
    mutable std::mutex mutex_;
    mutable std::optional<T> value_;

public:
    memoized() = default;

    memoized(const memoized& other)
    {
        std::lock_guard<std::mutex> l(other.mutex_);
        value_ = other.value_;
    }

    memoized& operator=(const memoized& other)
    {
        if(this != &other)
        {
            std::optional<T> value;
            {
                std::lock_guard<std::mutex> l(other.mutex_);
                value = other.value_;
            }
            std::lock_guard<std::mutex> l(mutex_);
            value_ = std::move(value);
        }
        return *this;
    }

    bool has_value() const
    {
        std::lock_guard<std::mutex> l(mutex_);
        return value_.has_value();
    }

    template<typename Function> T get(Function compute) const
    {
        std::lock_guard<std::mutex> l(mutex_);
        if(!value_) { value_ = compute(); }
        return *value_;
    }
};

} // namespace detail

/**
 * The complete metainfo (the contents of a .torrent file): the info dictionary and
 * the optional hints as to where to find peers and the content.
 *
 * A metainfo is immutable once constructed, so its info hash is computed only once,
 * when it's first requested.
 */
class metainfo
{
    std::vector<std::vector<std::string>> announce_;
    std::vector<dht_node> nodes_;
    std::vector<std::string> http_seeds_;
    std::vector<std::string> url_list_;
    std::string comment_;
    std::string created_by_;
    int64_t creation_date_;
    info_dict info_;

    detail::memoized<sha1_hash> info_hash_;

public:

    /**
     * The announce, nodes, seed, mirror and comment fields are taken from args (empty
     * announce tiers are dropped), the rest of args was already used to build info.
     */
    metainfo(const metainfo_args& args, info_dict info, const int64_t creation_date);

    const std::vector<std::vector<std::string>>& announce() const noexcept
    {
        return announce_;
    }

    const std::vector<dht_node>& nodes() const noexcept { return nodes_; }
    const std::vector<std::string>& http_seeds() const noexcept { return http_seeds_; }
    const std::vector<std::string>& url_list() const noexcept { return url_list_; }
    const std::string& comment() const noexcept { return comment_; }
    const std::string& created_by() const noexcept { return created_by_; }
    int64_t creation_date() const noexcept { return creation_date_; }
    const info_dict& info() const noexcept { return info_; }

    /** The SHA-1 hash of the encoded info dictionary. */
    sha1_hash info_hash() const;
    std::string info_hash_hex() const;
    /** Whether info_hash has already been computed. */
    bool has_info_hash() const { return info_hash_.has_value(); }

    bvalue to_bvalue() const;

    /** The canonical encoding of the whole metainfo, i.e. the .torrent file. */
    std::string encode() const;
};

/**
 * The final element of the absolute and lexically normalized root path, ignoring
 * trailing separators, e.g. "/data/videos/" and "/data/videos/clip/.." both yield
 * "videos".
 */
std::string make_display_name(const fs::path& root);

/**
 * Builds the metainfo of root, which is either a single file or a directory whose
 * files are collected recursively and hashed in the ascending order of their relative
 * paths.
 *
 * A metainfo_error is thrown if root does not exist (path_not_found), is not a file or
 * directory (unsupported_file_type), has no content (empty_content), if
 * args.piece_length is not positive (invalid_piece_length), or if reading any of the
 * files fails (read_failed, file_size_changed). Nothing is returned in that case.
 */
metainfo create_metainfo(const fs::path& root, const metainfo_args& args);

/**
 * Writes the encoded metainfo to file_path. The data is written to a temporary file
 * next to file_path first, which is then renamed, so file_path is either left
 * untouched or holds the complete metainfo. Throws a metainfo_error with write_failed
 * on failure.
 */
void save_metainfo(const metainfo& m, const fs::path& file_path);

/** The input path with trailing separators removed and ".torrent" appended. */
fs::path default_output_path(const fs::path& input);

} // namespace torgen

#endif // TORGEN_METAINFO_HEADER
