#include "torgen/metainfo_args.hpp"
#include "torgen/metainfo_error.hpp"
#include "torgen/string_utils.hpp"

#include <cctype>

namespace torgen {

namespace {

[[noreturn]] void throw_invalid_node(const std::string& s)
{
    throw metainfo_error(metainfo_errc::invalid_node_address, {}, "'" + s + "'");
}

bool is_ipv6_char(const char c) noexcept
{
    return std::isxdigit(static_cast<unsigned char>(c)) || (c == ':');
}

} // namespace

dht_node parse_dht_node(const std::string& s)
{
    // the port follows the last colon, which also works for IPv6 addresses as they
    // are bracketed
    const auto colon_pos = s.rfind(':');
    if((colon_pos == std::string::npos) || (colon_pos == 0))
    {
        throw_invalid_node(s);
    }

    const std::string port_str = s.substr(colon_pos + 1);
    // more than 5 digits can't be a valid port and would overflow stoi
    if(!util::is_all_digits(port_str) || (port_str.length() > 5))
    {
        throw_invalid_node(s);
    }
    const int port = std::stoi(port_str);
    if((port < 1) || (port > 65535))
    {
        throw_invalid_node(s);
    }

    std::string host = s.substr(0, colon_pos);
    if(host.front() == '[')
    {
        if((host.length() < 3) || (host.back() != ']'))
        {
            throw_invalid_node(s);
        }
        host = host.substr(1, host.length() - 2);
        for(const char c : host)
        {
            if(!is_ipv6_char(c)) { throw_invalid_node(s); }
        }
    }
    else if(host.find(':') != std::string::npos)
    {
        // an unbracketed IPv6 address is ambiguous
        throw_invalid_node(s);
    }

    return {std::move(host), port};
}

} // namespace torgen
