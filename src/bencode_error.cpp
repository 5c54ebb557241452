#include "torgen/bencode_error.hpp"

namespace torgen {

std::string bencode_error_category::message(int env) const
{
    switch(static_cast<bencode_errc>(env))
    {
    case bencode_errc::bstring_missing_colon:
        return "invalid length-prefixed string: no ':' after length";
    case bencode_errc::bstring_truncated:
        return "invalid length-prefixed string: input shorter than declared length";
    case bencode_errc::bnumber_invalid: return "invalid integer";
    case bencode_errc::unterminated_container: return "unterminated container";
    case bencode_errc::unknown_type: return "invalid encoding";
    case bencode_errc::bmap_key_not_string: return "map key is not a string";
    case bencode_errc::bmap_missing_value: return "no value assigned to key in map";
    case bencode_errc::nesting_too_deep: return "containers nested too deeply";
    case bencode_errc::unsupported_type: return "unsupported value type";
    default: return "Unknown";
    }
}

std::error_condition
bencode_error_category::default_error_condition(int ev) const noexcept
{
    switch(static_cast<bencode_errc>(ev))
    {
    default:
        return std::error_condition(ev, *this);
    }
}

const bencode_error_category& bencode_category()
{
    static bencode_error_category instance;
    return instance;
}

std::error_code make_error_code(bencode_errc e)
{
    return std::error_code(static_cast<int>(e), bencode_category());
}

std::error_condition make_error_condition(bencode_errc e)
{
    return std::error_condition(static_cast<int>(e), bencode_category());
}

bencode_error::bencode_error(std::error_code ec, size_t offset)
    : std::system_error(ec, "at offset " + std::to_string(offset))
    , offset_(offset)
{}

} // namespace torgen
