#include "torgen/bencode.hpp"
#include "torgen/string_utils.hpp"

#include <stdexcept>
#include <algorithm>
#include <sstream>
#include <limits>
#include <cctype>

namespace torgen {
namespace util {

    inline size_t bencoded_string_length(std::string_view s)
    {
        return s.length() + std::to_string(s.length()).length() + 1; /* + 1 for : */
    }

    inline size_t bencoded_number_length(const bnumber& n)
    {
        return 2 + n.to_string().length();
    }

    inline void bencode_string(std::string_view s, std::string& out)
    {
        out += std::to_string(s.length());
        out += ':';
        out.append(s.data(), s.length());
    }

    inline void bencode_number(const bnumber& n, std::string& out)
    {
        out += 'i';
        out += n.to_string();
        out += 'e';
    }

    inline const char* type_name(const btype t) noexcept
    {
        switch(t)
        {
        case btype::none: return "none";
        case btype::number: return "number";
        case btype::string: return "string";
        case btype::list: return "list";
        case btype::map: return "map";
        }
        return "unknown";
    }

    [[noreturn]] inline void throw_type_mismatch(const btype expected, const btype actual)
    {
        throw std::invalid_argument(std::string("bvalue is a ") + type_name(actual)
            + ", not a " + type_name(expected));
    }

} // namespace util

// -------------
// -- bnumber --
// -------------

bnumber bnumber::from_string(std::string_view s)
{
    bool negative = false;
    if(!s.empty() && s.front() == '-')
    {
        negative = true;
        s.remove_prefix(1);
    }
    if(s.empty() || !std::all_of(s.begin(), s.end(),
        [](const char c) { return std::isdigit(static_cast<unsigned char>(c)); }))
    {
        throw std::invalid_argument("not a decimal integer");
    }

    const auto first_nonzero = s.find_first_not_of('0');
    bnumber n;
    if(first_nonzero == std::string_view::npos)
    {
        // all zeros, and "-0" is just 0
        return n;
    }
    s.remove_prefix(first_nonzero);
    n.digits_.clear();
    if(negative) { n.digits_ += '-'; }
    n.digits_.append(s.data(), s.length());
    return n;
}

bool bnumber::fits_int64() const noexcept
{
    static const std::string max = std::to_string(std::numeric_limits<int64_t>::max());
    // the magnitude of the minimum is one greater than that of the maximum
    static const std::string min_magnitude
        = std::to_string(std::numeric_limits<int64_t>::min()).substr(1);

    const std::string_view magnitude = is_negative()
        ? std::string_view(digits_).substr(1)
        : std::string_view(digits_);
    const std::string& limit = is_negative() ? min_magnitude : max;
    // both are canonical, so a shorter magnitude is a smaller one and equal lengths
    // compare lexicographically
    if(magnitude.length() != limit.length())
    {
        return magnitude.length() < limit.length();
    }
    return magnitude <= std::string_view(limit);
}

int64_t bnumber::to_int64() const
{
    if(!fits_int64())
    {
        throw std::out_of_range(digits_ + " does not fit in a 64-bit integer");
    }
    return std::stoll(digits_);
}

// ------------
// -- bvalue --
// ------------

btype bvalue::type() const noexcept
{
    switch(value_.index())
    {
    case 1: return btype::string;
    case 2: return btype::number;
    case 3: return btype::list;
    case 4: return btype::map;
    default: return btype::none;
    }
}

const bvalue::string_type& bvalue::as_string() const
{
    if(!is_string()) { util::throw_type_mismatch(btype::string, type()); }
    return std::get<string_type>(value_);
}

bvalue::string_type& bvalue::as_string()
{
    if(!is_string()) { util::throw_type_mismatch(btype::string, type()); }
    return std::get<string_type>(value_);
}

const bnumber& bvalue::as_number() const
{
    if(!is_number()) { util::throw_type_mismatch(btype::number, type()); }
    return std::get<bnumber>(value_);
}

const bvalue::list_type& bvalue::as_list() const
{
    if(!is_list()) { util::throw_type_mismatch(btype::list, type()); }
    return std::get<list_type>(value_);
}

bvalue::list_type& bvalue::as_list()
{
    if(!is_list()) { util::throw_type_mismatch(btype::list, type()); }
    return std::get<list_type>(value_);
}

const bvalue::map_type& bvalue::as_map() const
{
    if(!is_map()) { util::throw_type_mismatch(btype::map, type()); }
    return std::get<map_type>(value_);
}

bvalue::map_type& bvalue::as_map()
{
    if(!is_map()) { util::throw_type_mismatch(btype::map, type()); }
    return std::get<map_type>(value_);
}

bvalue& bvalue::operator[](const std::string& key)
{
    if(is_none()) { value_ = map_type(); }
    return as_map()[key];
}

const bvalue* bvalue::find(const std::string& key) const noexcept
{
    if(!is_map()) { return nullptr; }
    const auto& map = std::get<map_type>(value_);
    const auto it = map.find(key);
    return it != map.end() ? &it->second : nullptr;
}

void bvalue::push_back(bvalue v)
{
    if(is_none()) { value_ = list_type(); }
    as_list().emplace_back(std::move(v));
}

size_t bvalue::size() const noexcept
{
    switch(type())
    {
    case btype::string: return std::get<string_type>(value_).length();
    case btype::list: return std::get<list_type>(value_).size();
    case btype::map: return std::get<map_type>(value_).size();
    case btype::number:
    case btype::none:
        return 0;
    }
    return 0;
}

bool operator==(const bvalue& a, const bvalue& b)
{
    return a.value_ == b.value_;
}

// --------------
// -- encoding --
// --------------

std::string bencode_number(const bnumber& n)
{
    std::string result;
    result.reserve(util::bencoded_number_length(n));
    util::bencode_number(n, result);
    return result;
}

std::string bencode_string(std::string_view s)
{
    std::string result;
    result.reserve(util::bencoded_string_length(s));
    util::bencode_string(s, result);
    return result;
}

size_t encoded_length(const bvalue& v)
{
    switch(v.type())
    {
    case btype::string:
        return util::bencoded_string_length(v.as_string());
    case btype::number:
        return util::bencoded_number_length(v.as_number());
    case btype::list:
    {
        // every list starts with a header token (l) and closes with an end token (e),
        // thus empty lists have an encoded length of 2
        size_t length = 2;
        for(const auto& e : v.as_list()) { length += encoded_length(e); }
        return length;
    }
    case btype::map:
    {
        size_t length = 2;
        for(const auto& entry : v.as_map())
        {
            length += util::bencoded_string_length(entry.first);
            length += encoded_length(entry.second);
        }
        return length;
    }
    case btype::none:
        return 0;
    }
    return 0;
}

namespace {

void encode_into(const bvalue& v, std::string& out, std::error_code& error)
{
    switch(v.type())
    {
    case btype::string:
        util::bencode_string(v.as_string(), out);
        return;
    case btype::number:
        util::bencode_number(v.as_number(), out);
        return;
    case btype::list:
        out += 'l';
        for(const auto& e : v.as_list())
        {
            encode_into(e, out, error);
            if(error) { return; }
        }
        out += 'e';
        return;
    case btype::map:
        out += 'd';
        for(const auto& entry : v.as_map())
        {
            util::bencode_string(entry.first, out);
            encode_into(entry.second, out, error);
            if(error) { return; }
        }
        out += 'e';
        return;
    case btype::none:
        error = make_error_code(bencode_errc::unsupported_type);
        return;
    }
}

} // namespace

std::string encode(const bvalue& v, std::error_code& error)
{
    error.clear();
    std::string result;
    result.reserve(encoded_length(v));
    encode_into(v, result, error);
    if(error) { result.clear(); }
    return result;
}

std::string encode(const bvalue& v)
{
    std::error_code error;
    std::string result;
    result.reserve(encoded_length(v));
    encode_into(v, result, error);
    if(error) { throw bencode_error(error, result.length()); }
    return result;
}

// ---------------
// -- to_string --
// ---------------

namespace {

void indent(std::stringstream& ss, const int nesting_level)
{
    for(auto i = 0; i < nesting_level; ++i)
    {
        ss << "  ";
    }
}

void format_string(std::stringstream& ss, const std::string& s)
{
    const bool is_printable = std::all_of(s.begin(), s.end(),
        [](const char c) { return std::isprint(static_cast<unsigned char>(c)); });
    if(is_printable)
    {
        ss << '"' << s << '"';
    }
    else
    {
        // most likely a piece hash or some other binary blob
        ss << "<0x" << util::to_hex(s) << '>';
    }
}

void format_value(std::stringstream& ss, const bvalue& v, const int nesting_level)
{
    switch(v.type())
    {
    case btype::none:
        ss << "none";
        break;
    case btype::number:
        ss << v.as_number().to_string();
        break;
    case btype::string:
        format_string(ss, v.as_string());
        break;
    case btype::list:
    {
        const auto& list = v.as_list();
        ss << '[';
        if(list.empty())
        {
            ss << ']';
            break;
        }
        for(auto it = list.begin(); it != list.end(); ++it)
        {
            if(it != list.begin()) { ss << ','; }
            ss << '\n';
            indent(ss, nesting_level + 1);
            format_value(ss, *it, nesting_level + 1);
        }
        ss << '\n';
        indent(ss, nesting_level);
        ss << ']';
        break;
    }
    case btype::map:
    {
        const auto& map = v.as_map();
        ss << '{';
        if(map.empty())
        {
            ss << '}';
            break;
        }
        for(auto it = map.begin(); it != map.end(); ++it)
        {
            if(it != map.begin()) { ss << ','; }
            ss << '\n';
            indent(ss, nesting_level + 1);
            format_string(ss, it->first);
            ss << ": ";
            format_value(ss, it->second, nesting_level + 1);
        }
        ss << '\n';
        indent(ss, nesting_level);
        ss << '}';
        break;
    }
    }
}

} // namespace

std::string to_string(const bvalue& v)
{
    std::stringstream ss;
    format_value(ss, v, 0);
    return ss.str();
}

} // namespace torgen
