#include "torgen/magnet.hpp"
#include "torgen/metainfo.hpp"
#include "torgen/string_utils.hpp"

namespace torgen {

namespace {

void append_raw_param(std::string& uri, const char* key, const std::string& value)
{
    if(uri.back() != '?') { uri += '&'; }
    uri += key;
    uri += '=';
    uri += value;
}

void append_param(std::string& uri, const char* key, const std::string& value)
{
    append_raw_param(uri, key, util::url_encode(value));
}

} // namespace

std::string make_magnet_uri(const metainfo& m)
{
    const info_dict& info = m.info();
    std::string uri = "magnet:?";
    append_param(uri, "dn", info.name);
    if(!info.is_multi_file())
    {
        append_param(uri, "xl", std::to_string(info.length));
    }
    // the urn prefix stays literal and the hex digits are all unreserved
    append_raw_param(uri, "xt", "urn:btih:" + m.info_hash_hex());
    for(const auto& tier : m.announce())
    {
        for(const auto& tracker : tier) { append_param(uri, "tr", tracker); }
    }
    for(const auto& mirror : m.url_list()) { append_param(uri, "as", mirror); }
    return uri;
}

} // namespace torgen
