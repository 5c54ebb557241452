#include "torgen/merkle.hpp"
#include "torgen/sha1_hasher.hpp"

#include <stdexcept>

namespace torgen {

std::string concat_piece_hashes(const std::vector<sha1_hash>& piece_hashes)
{
    std::string result;
    result.reserve(piece_hashes.size() * sizeof(sha1_hash));
    for(const auto& hash : piece_hashes)
    {
        result.append(reinterpret_cast<const char*>(hash.data()), hash.size());
    }
    return result;
}

namespace {

sha1_hash hash_pair(const sha1_hash& left, const sha1_hash& right)
{
    sha1_hasher hasher;
    hasher.update(left);
    hasher.update(right);
    return hasher.finish();
}

} // namespace

sha1_hash merkle_root(std::vector<sha1_hash> piece_hashes)
{
    if(piece_hashes.empty())
    {
        throw std::invalid_argument("cannot build a merkle tree without piece hashes");
    }

    sha1_hash padding{};
    while(piece_hashes.size() > 1)
    {
        if(piece_hashes.size() % 2 != 0)
        {
            piece_hashes.push_back(padding);
        }
        // the parents are stored in place, in the first half of the level
        const size_t num_parents = piece_hashes.size() / 2;
        for(size_t i = 0; i < num_parents; ++i)
        {
            piece_hashes[i] = hash_pair(piece_hashes[2 * i], piece_hashes[2 * i + 1]);
        }
        piece_hashes.resize(num_parents);
        padding = hash_pair(padding, padding);
    }
    return piece_hashes.front();
}

} // namespace torgen
