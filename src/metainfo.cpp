#include "torgen/metainfo.hpp"
#include "torgen/metainfo_error.hpp"
#include "torgen/piece_hasher.hpp"
#include "torgen/string_utils.hpp"
#include "torgen/sha1_hasher.hpp"
#include "torgen/merkle.hpp"
#include "torgen/log.hpp"

#include <algorithm>
#include <fstream>
#include <cstring> // strerror
#include <cerrno>
#include <ctime>

namespace torgen {

int64_t info_dict::total_length() const noexcept
{
    if(!is_multi_file()) { return length; }
    int64_t total = 0;
    for(const auto& file : files) { total += file.length; }
    return total;
}

bvalue to_bvalue(const info_dict& info)
{
    bvalue map = bvalue::empty_map();
    map["name"] = info.name;
    map["piece length"] = info.piece_length;
    if(info.is_private) { map["private"] = 1; }

    if(info.is_multi_file())
    {
        bvalue files = bvalue::empty_list();
        for(const auto& file : info.files)
        {
            bvalue entry = bvalue::empty_map();
            entry["length"] = file.length;
            bvalue path = bvalue::empty_list();
            for(const auto& element : file.path) { path.push_back(element); }
            entry["path"] = std::move(path);
            if(!file.md5sum.empty()) { entry["md5sum"] = file.md5sum; }
            files.push_back(std::move(entry));
        }
        map["files"] = std::move(files);
    }
    else
    {
        map["length"] = info.length;
        if(!info.md5sum.empty()) { map["md5sum"] = info.md5sum; }
    }

    if(info.is_merkle)
        map["root hash"] = info.piece_hashes;
    else
        map["pieces"] = info.piece_hashes;
    return map;
}

// --------------
// -- metainfo --
// --------------

metainfo::metainfo(const metainfo_args& args, info_dict info, const int64_t creation_date)
    : nodes_(args.nodes)
    , http_seeds_(args.http_seeds)
    , url_list_(args.url_list)
    , comment_(args.comment)
    , created_by_(generator_name)
    , creation_date_(creation_date)
    , info_(std::move(info))
{
    for(const auto& tier : args.announce)
    {
        if(!tier.empty()) { announce_.push_back(tier); }
    }
}

sha1_hash metainfo::info_hash() const
{
    return info_hash_.get([this] {
        return create_sha1_digest(torgen::encode(torgen::to_bvalue(info_)));
    });
}

std::string metainfo::info_hash_hex() const
{
    return util::to_hex(info_hash());
}

bvalue metainfo::to_bvalue() const
{
    bvalue map = bvalue::empty_map();

    // http://bittorrent.org/beps/bep_0012.html
    // the announce key holds the first tracker for clients that don't support
    // announce-list, which is only needed if there is more than one tracker
    if(!announce_.empty())
    {
        map["announce"] = announce_.front().front();
        if((announce_.size() > 1) || (announce_.front().size() > 1))
        {
            bvalue tiers = bvalue::empty_list();
            for(const auto& tier : announce_)
            {
                bvalue urls = bvalue::empty_list();
                for(const auto& url : tier) { urls.push_back(url); }
                tiers.push_back(std::move(urls));
            }
            map["announce-list"] = std::move(tiers);
        }
    }

    if(!nodes_.empty())
    {
        bvalue nodes = bvalue::empty_list();
        for(const auto& node : nodes_)
        {
            bvalue pair = bvalue::empty_list();
            pair.push_back(node.host);
            pair.push_back(node.port);
            nodes.push_back(std::move(pair));
        }
        map["nodes"] = std::move(nodes);
    }

    if(!http_seeds_.empty())
    {
        bvalue seeds = bvalue::empty_list();
        for(const auto& url : http_seeds_) { seeds.push_back(url); }
        map["httpseeds"] = std::move(seeds);
    }

    if(!url_list_.empty())
    {
        bvalue urls = bvalue::empty_list();
        for(const auto& url : url_list_) { urls.push_back(url); }
        map["url-list"] = std::move(urls);
    }

    map["creation date"] = creation_date_;
    if(!comment_.empty()) { map["comment"] = comment_; }
    map["created by"] = created_by_;
    map["info"] = torgen::to_bvalue(info_);
    return map;
}

std::string metainfo::encode() const
{
    return torgen::encode(to_bvalue());
}

// -------------
// -- builder --
// -------------

std::string make_display_name(const fs::path& root)
{
    std::error_code ec;
    fs::path p = fs::absolute(root, ec);
    if(ec) { p = root; }
    p = p.lexically_normal();
    // a trailing separator leaves an empty filename
    if(!p.has_filename()) { p = p.parent_path(); }
    const auto name = p.filename().string();
    return name.empty() ? root.string() : name;
}

namespace {

struct enumerated_file
{
    std::vector<std::string> elements;
    source_file source;
};

std::vector<std::string> split_path(const fs::path& relative_path)
{
    std::vector<std::string> elements;
    for(const auto& element : relative_path)
    {
        elements.emplace_back(element.string());
    }
    return elements;
}

std::vector<enumerated_file> enumerate_files(const fs::path& root)
{
    std::vector<enumerated_file> files;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, ec);
    const fs::recursive_directory_iterator end;
    if(ec)
    {
        throw metainfo_error(metainfo_errc::read_failed, root, ec.message());
    }

    for(; it != end; it.increment(ec))
    {
        if(ec) { break; }
        const auto& entry = *it;
        // this follows symlinks to files, while symlinked directories are listed but
        // not descended into by the iterator
        if(!entry.is_regular_file(ec))
        {
            if(ec == std::errc::no_such_file_or_directory)
            {
                log::log_metainfo("enumerate", "skipping dangling symlink "
                        + entry.path().string(), log::priority::normal);
                ec.clear();
            }
            else if(ec)
            {
                throw metainfo_error(metainfo_errc::read_failed, entry.path(),
                        ec.message());
            }
            continue;
        }
        const auto length = entry.file_size(ec);
        if(ec)
        {
            throw metainfo_error(metainfo_errc::read_failed, entry.path(), ec.message());
        }
        files.push_back({split_path(entry.path().lexically_relative(root)),
                {entry.path(), static_cast<int64_t>(length)}});
    }
    if(ec)
    {
        throw metainfo_error(metainfo_errc::read_failed, root, ec.message());
    }

    // the traversal order of the OS is unspecified, but the order of the files
    // determines the pieces, so sort them to make the result reproducible
    std::sort(files.begin(), files.end(),
        [](const enumerated_file& a, const enumerated_file& b)
        { return a.elements < b.elements; });
    return files;
}

int64_t current_time()
{
    return static_cast<int64_t>(std::time(nullptr));
}

} // namespace

metainfo create_metainfo(const fs::path& root, const metainfo_args& args)
{
    if(args.piece_length <= 0)
    {
        throw metainfo_error(metainfo_errc::invalid_piece_length, {},
                std::to_string(args.piece_length));
    }

    std::error_code ec;
    const auto status = fs::status(root, ec);
    if(!fs::exists(status))
    {
        log::log_metainfo("create", root.string() + " does not exist", log::priority::high);
        throw metainfo_error(metainfo_errc::path_not_found, root,
                ec ? ec.message() : std::string());
    }

    info_dict info;
    info.name = make_display_name(root);
    info.piece_length = args.piece_length;
    info.is_private = args.is_private;
    info.is_merkle = args.merkle;

    std::vector<source_file> sources;
    if(fs::is_regular_file(status))
    {
        const auto length = fs::file_size(root, ec);
        if(ec) { throw metainfo_error(metainfo_errc::read_failed, root, ec.message()); }
        info.length = length;
        sources.push_back({root, info.length});
    }
    else if(fs::is_directory(status))
    {
        auto files = enumerate_files(root);
        info.files.reserve(files.size());
        sources.reserve(files.size());
        for(auto& file : files)
        {
            info.files.push_back({std::move(file.elements), file.source.length, {}});
            sources.push_back(std::move(file.source));
        }
    }
    else
    {
        throw metainfo_error(metainfo_errc::unsupported_file_type, root);
    }

    if(info.total_length() == 0)
    {
        throw metainfo_error(metainfo_errc::empty_content, root);
    }

    log::log_metainfo("create", "hashing " + std::to_string(sources.size())
            + " file(s), " + std::to_string(info.total_length()) + " bytes, piece length "
            + std::to_string(info.piece_length));

    auto hashed = hash_files(sources, args.piece_length, args.md5sum,
            args.read_buffer_size);
    if(args.md5sum)
    {
        if(info.is_multi_file())
        {
            for(size_t i = 0; i < info.files.size(); ++i)
            {
                info.files[i].md5sum = std::move(hashed.md5sums[i]);
            }
        }
        else
        {
            info.md5sum = std::move(hashed.md5sums.front());
        }
    }

    if(args.merkle)
    {
        const sha1_hash root_hash = merkle_root(std::move(hashed.piece_hashes));
        info.piece_hashes.assign(
            reinterpret_cast<const char*>(root_hash.data()), root_hash.size());
    }
    else
    {
        info.piece_hashes = concat_piece_hashes(hashed.piece_hashes);
    }

    const int64_t creation_date = args.creation_date == values::none
        ? current_time() : args.creation_date;
    metainfo m(args, std::move(info), creation_date);
    // the info hash is left to be computed on first use
    log::log_metainfo("create", "built metainfo for '" + m.info().name + "'");
    return m;
}

void save_metainfo(const metainfo& m, const fs::path& file_path)
{
    const std::string encoded = m.encode();

    fs::path tmp_path = file_path;
    tmp_path += ".part";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if(!out.is_open())
        {
            throw metainfo_error(metainfo_errc::write_failed, tmp_path,
                    std::strerror(errno));
        }
        out.write(encoded.data(), encoded.size());
        out.close();
        if(out.fail())
        {
            const std::string reason = std::strerror(errno);
            std::error_code ec;
            fs::remove(tmp_path, ec);
            throw metainfo_error(metainfo_errc::write_failed, tmp_path, reason);
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, file_path, ec);
    if(ec)
    {
        const std::string reason = ec.message();
        fs::remove(tmp_path, ec);
        throw metainfo_error(metainfo_errc::write_failed, file_path, reason);
    }
    log::log_metainfo("save", "wrote " + std::to_string(encoded.size()) + " bytes to "
            + file_path.string());
}

fs::path default_output_path(const fs::path& input)
{
    std::string s = input.string();
    while((s.length() > 1) && (s.back() == fs::path::preferred_separator))
    {
        s.pop_back();
    }
    return fs::path(s + ".torrent");
}

} // namespace torgen
