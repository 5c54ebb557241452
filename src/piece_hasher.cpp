#include "torgen/piece_hasher.hpp"
#include "torgen/metainfo_error.hpp"
#include "torgen/md5_hasher.hpp"
#include "torgen/log.hpp"

#include <algorithm>
#include <stdexcept>
#include <fstream>
#include <cstring> // strerror
#include <cerrno>

namespace torgen {

piece_hasher::piece_hasher(const int64_t piece_length)
    : piece_length_(piece_length)
{
    if(piece_length <= 0)
    {
        throw std::invalid_argument("piece length must be positive");
    }
}

void piece_hasher::update(std::string_view buffer)
{
    num_bytes_ += buffer.length();
    while(!buffer.empty())
    {
        const int64_t num_missing = piece_length_ - num_pending_bytes_;
        const auto n = static_cast<size_t>(
            std::min<int64_t>(num_missing, buffer.length()));
        hasher_.update(buffer.substr(0, n));
        num_pending_bytes_ += n;
        buffer.remove_prefix(n);
        if(num_pending_bytes_ == piece_length_)
        {
            pieces_.emplace_back(hasher_.finish());
            hasher_.reset();
            num_pending_bytes_ = 0;
        }
    }
}

void piece_hasher::finish()
{
    if(num_pending_bytes_ > 0)
    {
        pieces_.emplace_back(hasher_.finish());
        hasher_.reset();
        num_pending_bytes_ = 0;
    }
}

namespace {

std::string errno_message()
{
    return std::strerror(errno);
}

} // namespace

hashed_files hash_files(const std::vector<source_file>& files, const int64_t piece_length,
        const bool compute_md5sums, const int read_buffer_size)
{
    piece_hasher pieces(piece_length);
    md5_hasher md5;
    hashed_files result;
    if(compute_md5sums) { result.md5sums.reserve(files.size()); }

    std::vector<char> buffer(std::max(read_buffer_size, 1));
    for(const auto& file : files)
    {
        log::log_disk_io("hash_files", "reading " + file.path.string() + " ("
                + std::to_string(file.length) + " bytes)", log::priority::low);

        std::ifstream in(file.path, std::ios::binary);
        if(!in.is_open())
        {
            const auto reason = errno_message();
            log::log_disk_io("hash_files", "cannot open " + file.path.string() + ": "
                    + reason, log::priority::high);
            throw metainfo_error(metainfo_errc::read_failed, file.path, reason);
        }

        int64_t num_read = 0;
        while(in)
        {
            in.read(buffer.data(), buffer.size());
            const std::streamsize n = in.gcount();
            if(n <= 0) { break; }
            const std::string_view chunk(buffer.data(), n);
            pieces.update(chunk);
            if(compute_md5sums) { md5.update(chunk); }
            num_read += n;
        }
        if(in.bad())
        {
            const auto reason = errno_message();
            log::log_disk_io("hash_files", "error reading " + file.path.string() + ": "
                    + reason, log::priority::high);
            throw metainfo_error(metainfo_errc::read_failed, file.path, reason);
        }
        if(num_read != file.length)
        {
            log::log_disk_io("hash_files", file.path.string() + " has "
                    + std::to_string(num_read) + " bytes, expected "
                    + std::to_string(file.length), log::priority::high);
            throw metainfo_error(metainfo_errc::file_size_changed, file.path,
                    "expected " + std::to_string(file.length) + " bytes, read "
                    + std::to_string(num_read));
        }

        if(compute_md5sums)
        {
            result.md5sums.emplace_back(md5.finish_hex());
            md5.reset();
        }
    }
    pieces.finish();

    log::log_disk_io("hash_files", "hashed " + std::to_string(pieces.num_bytes())
            + " bytes into " + std::to_string(pieces.num_pieces()) + " pieces");
    result.piece_hashes = pieces.pieces();
    return result;
}

} // namespace torgen
