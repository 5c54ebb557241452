#include "torgen/md5_hasher.hpp"
#include "torgen/string_utils.hpp"

namespace torgen {

md5_hasher::md5_hasher()
{
    reset();
}

void md5_hasher::reset()
{
    MD5_Init(&context_);
}

md5_hasher& md5_hasher::update(std::string_view buffer)
{
    MD5_Update(&context_, buffer.data(), buffer.size());
    return *this;
}

md5_hash md5_hasher::finish()
{
    md5_hash digest;
    MD5_Final(digest.data(), &context_);
    return digest;
}

std::string md5_hasher::finish_hex()
{
    return util::to_hex(finish());
}

} // namespace torgen
