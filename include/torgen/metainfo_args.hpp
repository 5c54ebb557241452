#ifndef TORGEN_METAINFO_ARGS_HEADER
#define TORGEN_METAINFO_ARGS_HEADER

#include "piece_hasher.hpp"
#include "types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace torgen {

constexpr int64_t default_piece_length = 256 * 1024;

/** A DHT bootstrap node, see BEP 5. */
struct dht_node
{
    // A hostname or an IPv4 or IPv6 address, the latter without brackets.
    std::string host;
    int port;
};

inline bool operator==(const dht_node& a, const dht_node& b) noexcept
{
    return (a.host == b.host) && (a.port == b.port);
}

/**
 * Parses the "host:port" notation of a node. IPv6 addresses must be enclosed in
 * brackets, e.g. "[2001:db8::42]:51413". Ports must be between 1 and 65535.
 *
 * A metainfo_error with invalid_node_address is thrown if s is not of this form.
 */
dht_node parse_dht_node(const std::string& s);

/**
 * These are the arguments with which a metainfo is built. All strings are used as
 * bytes, unchanged; converting user input to the desired encoding (usually UTF-8) is
 * up to the caller.
 *
 * Either announce or nodes should be provided so that peers can find each other, but
 * this is not enforced.
 */
struct metainfo_args
{
    // Tracker announce URLs grouped into tiers, the first being the primary tier and
    // the rest backups, e.g. {{"main1", "main2"}, {"backup1"}}, see BEP 12. Empty tiers
    // are ignored.
    std::vector<std::vector<std::string>> announce;

    // See BEP 5.
    std::vector<dht_node> nodes;

    // See BEP 17.
    std::vector<std::string> http_seeds;

    // HTTP/FTP mirrors (GetRight style), see BEP 19.
    std::vector<std::string> url_list;

    // Omitted from the metainfo if empty.
    std::string comment;

    // The length of the pieces into which the content is split. Must be positive.
    int64_t piece_length = default_piece_length;

    // The creation date in seconds since the epoch. If it's values::none, the time of
    // the build is used. Setting a fixed value makes the output reproducible.
    int64_t creation_date = values::none;

    // The number of bytes read from disk at a time.
    int read_buffer_size = default_read_buffer_size;

    // Include the MD5 checksum of each file. This is not required by the protocol and
    // costs additional computation.
    bool md5sum = false;

    // Store the root of the piece hash tree ("root hash") instead of all piece hashes
    // ("pieces"), see BEP 30. This produces a much smaller file, but few clients
    // support it.
    bool merkle = false;

    // Forbid DHT and peer exchange, see BEP 27.
    bool is_private = false;
};

} // namespace torgen

#endif // TORGEN_METAINFO_ARGS_HEADER
