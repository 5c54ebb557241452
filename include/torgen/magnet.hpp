#ifndef TORGEN_MAGNET_HEADER
#define TORGEN_MAGNET_HEADER

#include <string>

namespace torgen {

class metainfo;

/**
 * Produces the magnet link of m:
 *
 * magnet:?dn=<name>[&xl=<length>]&xt=urn:btih:<info hash>[&tr=<tracker>]...[&as=<mirror>]...
 *
 * The exact length (xl) is only given for single-file content. Trackers are listed
 * tier by tier, and each tracker and mirror gets its own parameter. Every value but
 * xt is percent-encoded.
 */
std::string make_magnet_uri(const metainfo& m);

} // namespace torgen

#endif // TORGEN_MAGNET_HEADER
