#include "torgen/metainfo_error.hpp"

namespace torgen {

std::string metainfo_error_category::message(int env) const
{
    switch(static_cast<metainfo_errc>(env))
    {
    case metainfo_errc::path_not_found: return "No such file or directory";
    case metainfo_errc::read_failed: return "Could not read file";
    case metainfo_errc::file_size_changed: return "File changed while it was hashed";
    case metainfo_errc::invalid_piece_length: return "Piece length must be positive";
    case metainfo_errc::empty_content: return "No content to hash";
    case metainfo_errc::unsupported_file_type:
        return "Not a regular file or directory";
    case metainfo_errc::invalid_node_address:
        return "Invalid DHT node address (expected host:port)";
    case metainfo_errc::write_failed: return "Could not write metainfo file";
    default: return "Unknown";
    }
}

std::error_condition
metainfo_error_category::default_error_condition(int ev) const noexcept
{
    switch(static_cast<metainfo_errc>(ev))
    {
    default:
        return std::error_condition(ev, *this);
    }
}

const metainfo_error_category& metainfo_category()
{
    static metainfo_error_category instance;
    return instance;
}

std::error_code make_error_code(metainfo_errc e)
{
    return std::error_code(static_cast<int>(e), metainfo_category());
}

std::error_condition make_error_condition(metainfo_errc e)
{
    return std::error_condition(static_cast<int>(e), metainfo_category());
}

namespace {

std::string make_what(const fs::path& p, const std::string& detail)
{
    std::string what = p.string();
    if(!detail.empty())
    {
        if(!what.empty()) { what += ": "; }
        what += detail;
    }
    return what;
}

} // namespace

metainfo_error::metainfo_error(std::error_code ec, fs::path p, const std::string& detail)
    : std::system_error(ec, make_what(p, detail))
    , path_(std::move(p))
{}

} // namespace torgen
