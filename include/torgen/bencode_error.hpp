#ifndef TORGEN_BENCODE_ERROR_HEADER
#define TORGEN_BENCODE_ERROR_HEADER

#include <system_error>
#include <cstddef>
#include <string>

namespace torgen {

enum class bencode_errc
{
    // The string header (<length>:) is not followed by a colon.
    bstring_missing_colon = 1,
    // Fewer bytes are left in the input than the string header declares.
    bstring_truncated,
    // Not a valid i<digits>e sequence.
    bnumber_invalid,
    // Input ended before a list's or map's 'e' end token.
    unterminated_container,
    // The leading byte is not a digit, 'i', 'l' or 'd'.
    unknown_type,
    bmap_key_not_string,
    bmap_missing_value,
    nesting_too_deep,
    // Raised while encoding: the value tree contains a default constructed (none)
    // value, which has no encoding.
    unsupported_type
};

inline bool operator==(const bencode_errc e, const int i) noexcept
{
    return static_cast<int>(e) == i;
}

inline bool operator!=(const int i, const bencode_errc e) noexcept
{
    return !(e == i);
}

struct bencode_error_category : public std::error_category
{
    const char* name() const noexcept override { return "bencode"; }
    std::string message(int env) const override;
    std::error_condition default_error_condition(int ev) const noexcept override;
};

const bencode_error_category& bencode_category();
std::error_code make_error_code(bencode_errc e);
std::error_condition make_error_condition(bencode_errc e);

/**
 * Thrown by the throwing overloads of encode and decode. For decoding errors offset
 * is the position in the input at which the malformed element was detected, for
 * encoding errors it is the number of bytes that had been produced.
 */
class bencode_error : public std::system_error
{
    size_t offset_;

public:
    bencode_error(std::error_code ec, size_t offset);

    size_t offset() const noexcept { return offset_; }
};

} // namespace torgen

namespace std
{
    template<> struct is_error_code_enum<torgen::bencode_errc> : public true_type {};
}

#endif // TORGEN_BENCODE_ERROR_HEADER
