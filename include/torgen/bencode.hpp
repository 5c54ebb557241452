#ifndef TORGEN_BENCODE_HEADER
#define TORGEN_BENCODE_HEADER

#include "bencode_error.hpp"

#include <type_traits>
#include <string_view>
#include <system_error>
#include <cstdint>
#include <ostream>
#include <variant>
#include <string>
#include <vector>
#include <map>

namespace torgen {

namespace detail {

// Characters and bools are integral types too, but encoding them as numbers is
// never what's meant.
template<typename T> struct is_bencode_integer
    : std::integral_constant<bool,
        std::is_integral<T>::value
        && !std::is_same<T, bool>::value
        && !std::is_same<T, char>::value
        && !std::is_same<T, wchar_t>::value
        && !std::is_same<T, char16_t>::value
        && !std::is_same<T, char32_t>::value>
{};

} // namespace detail

/** All the possible bencoded types. */
enum class btype
{
    // A default constructed bvalue. It has no encoding and encoding it is an error.
    none,
    // Encoded format: i<number>e, e.g.: i3244e
    number,
    // Encoded format: <len(str)>:<str>, e.g.: 6:string
    string,
    // Encoded format: l<elements>e, e.g.: l4:abcdi53452eli234ei234eee
    list,
    // Encoded format: d<<(str)key><value> pairs>e, and keys must be in lexicographical
    // order, e.g.: d4:eggsi324e4:spami432ee
    map
};

/**
 * An arbitrary precision bencoded integer. Since the only arithmetic ever done with
 * these is converting them to and from text, the number is kept in its canonical
 * decimal form: an optional minus sign followed by digits without leading zeros, and
 * "0" for zero (never "-0").
 */
class bnumber
{
    std::string digits_ = "0";

public:
    bnumber() = default;

    template<
        typename Int,
        typename = typename std::enable_if<detail::is_bencode_integer<Int>::value>::type
    > bnumber(Int n) : digits_(std::to_string(n)) {}

    /**
     * Parses an optional '-' followed by at least one decimal digit. Leading zeros are
     * accepted and stripped. An std::invalid_argument exception is thrown if s is not
     * of this form.
     */
    static bnumber from_string(std::string_view s);

    const std::string& to_string() const noexcept { return digits_; }

    bool is_negative() const noexcept { return digits_.front() == '-'; }
    bool fits_int64() const noexcept;

    /** Throws std::out_of_range if the number does not fit. */
    int64_t to_int64() const;

    friend bool operator==(const bnumber& a, const bnumber& b) noexcept
    {
        return a.digits_ == b.digits_;
    }

    friend bool operator!=(const bnumber& a, const bnumber& b) noexcept
    {
        return !(a == b);
    }
};

/**
 * A node in a bencoded value tree: a byte string, an integer, a list of values or a
 * map of byte string keys to values.
 *
 * Maps are std::maps, so iterating them always yields the keys in ascending order.
 * std::string's comparison compares bytes as unsigned chars, which is exactly the
 * ordering bencoding requires, so the encoding of a map does not depend on the order
 * in which its entries were inserted.
 */
class bvalue
{
public:
    using string_type = std::string;
    using list_type = std::vector<bvalue>;
    using map_type = std::map<std::string, bvalue>;

private:
    std::variant<std::monostate, string_type, bnumber, list_type, map_type> value_;

public:
    bvalue() = default;
    bvalue(string_type s) : value_(std::move(s)) {}
    bvalue(std::string_view s) : value_(string_type(s)) {}
    bvalue(const char* s) : value_(string_type(s)) {}
    bvalue(bnumber n) : value_(std::move(n)) {}
    template<
        typename Int,
        typename = typename std::enable_if<detail::is_bencode_integer<Int>::value>::type
    > bvalue(Int n) : value_(bnumber(n)) {}
    bvalue(list_type l) : value_(std::move(l)) {}
    bvalue(map_type m) : value_(std::move(m)) {}

    static bvalue empty_list() { return bvalue(list_type()); }
    static bvalue empty_map() { return bvalue(map_type()); }

    btype type() const noexcept;

    bool is_none() const noexcept { return type() == btype::none; }
    bool is_string() const noexcept { return type() == btype::string; }
    bool is_number() const noexcept { return type() == btype::number; }
    bool is_list() const noexcept { return type() == btype::list; }
    bool is_map() const noexcept { return type() == btype::map; }

    /**
     * The accessors throw std::invalid_argument if the value is not of the requested
     * type.
     */
    const string_type& as_string() const;
    string_type& as_string();
    const bnumber& as_number() const;
    int64_t as_int() const { return as_number().to_int64(); }
    const list_type& as_list() const;
    list_type& as_list();
    const map_type& as_map() const;
    map_type& as_map();

    /**
     * Returns the value mapped to key, inserting a none value if it is not yet in the
     * map. A none value is turned into an empty map first, so that a tree can be built
     * with chained subscripts.
     */
    bvalue& operator[](const std::string& key);

    /** Returns nullptr if this is not a map or if key is not in it. */
    const bvalue* find(const std::string& key) const noexcept;

    /** Appends to a list. A none value is turned into an empty list first. */
    void push_back(bvalue v);

    /**
     * The length of a string, or the number of elements in a list or map, and 0 for
     * numbers and none.
     */
    size_t size() const noexcept;

    friend bool operator==(const bvalue& a, const bvalue& b);
    friend bool operator!=(const bvalue& a, const bvalue& b) { return !(a == b); }
};

std::string bencode_string(std::string_view s);
std::string bencode_number(const bnumber& n);

/**
 * Returns the exact number of bytes encode would produce for v. none values are not
 * counted.
 */
size_t encoded_length(const bvalue& v);

/**
 * Produces the canonical encoding of v. Map entries are written in ascending key
 * order. If v or any of its descendants is none, bencode_errc::unsupported_type is
 * reported and the returned string is empty.
 */
std::string encode(const bvalue& v, std::error_code& error);
std::string encode(const bvalue& v);

/** Returns a JSON-like, human readable string of v. */
std::string to_string(const bvalue& v);

inline std::ostream& operator<<(std::ostream& out, const bvalue& v)
{
    return out << to_string(v);
}

} // namespace torgen

#endif // TORGEN_BENCODE_HEADER
