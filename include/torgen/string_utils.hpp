#ifndef TORGEN_STRING_UTILS_HEADER
#define TORGEN_STRING_UTILS_HEADER

#include <algorithm>
#include <cctype> // std::isdigit, std::isalnum
#include <cstdint>
#include <iterator> // std::begin, std::end
#include <string>

namespace torgen {
namespace util {

template <typename Bytes>
std::string to_hex(const Bytes& data)
{
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string hex_str;
    const size_t size = std::end(data) - std::begin(data);
    hex_str.reserve(size * 2);
    for(size_t i = 0; i < size; ++i) {
        const uint8_t byte = data[i];
        hex_str += hex_chars[byte >> 4];
        hex_str += hex_chars[byte & 0xf];
    }
    return hex_str;
}

/** Determines whether `s` is a non-empty sequence of decimal digits. */
template <typename String>
bool is_all_digits(const String& s)
{
    return std::begin(s) != std::end(s)
            && std::all_of(std::begin(s), std::end(s), [](const char c) {
                   return std::isdigit(static_cast<unsigned char>(c));
               });
}

/**
 * Percent-encodes everything but the unreserved characters of RFC 3986 (ALPHA, DIGIT,
 * '-', '.', '_', '~'), using uppercase hex digits.
 */
template <typename InputIt>
std::string url_encode(InputIt begin, InputIt end)
{
    static constexpr char hex_chars[] = "0123456789ABCDEF";
    std::string encoded;
    while(begin != end) {
        const auto c = static_cast<unsigned char>(*begin++);
        if(std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
            encoded += static_cast<char>(c);
        } else {
            encoded += '%';
            encoded += hex_chars[c >> 4];
            encoded += hex_chars[c & 0xf];
        }
    }
    return encoded;
}

template <typename Iterable>
std::string url_encode(const Iterable& iterable)
{
    return url_encode(std::begin(iterable), std::end(iterable));
}

} // namespace util
} // namespace torgen

#endif // TORGEN_STRING_UTILS_HEADER
