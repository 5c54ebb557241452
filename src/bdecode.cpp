#include "torgen/bdecode.hpp"

#include <limits>
#include <cctype> // isdigit

namespace torgen {

// Malicious input such as "llllllll..." would otherwise exhaust the stack.
constexpr int max_nesting_depth = 1024;

namespace {

inline bool is_digit(const char c) noexcept
{
    return std::isdigit(static_cast<unsigned char>(c));
}

} // namespace

class bdecoder
{
    std::string_view encoded_;

    // The index of the current character in encoded_.
    size_t pos_;

    int depth_ = 0;

public:

    bdecoder(std::string_view s, size_t offset) : encoded_(s), pos_(offset) {}

    size_t pos() const noexcept { return pos_; }

    bvalue decode(std::error_code& error)
    {
        error.clear();
        return decode_dispatch(error);
    }

private:

    bool at_end() const noexcept { return pos_ >= encoded_.length(); }

    bvalue decode_dispatch(std::error_code& error)
    {
        if(at_end())
        {
            error = make_error_code(bencode_errc::unknown_type);
            return {};
        }
        switch(encoded_[pos_])
        {
        case '0': case '1': case '2': case '3': case '4':
        case '5': case '6': case '7': case '8': case '9':
            return decode_bstring(error);
        case 'i':
            return decode_bnumber(error);
        case 'l':
            return decode_blist(error);
        case 'd':
            return decode_bmap(error);
        default:
            error = make_error_code(bencode_errc::unknown_type);
            return {};
        }
    }

    bvalue decode_bstring(std::error_code& error)
    {
        size_t str_length = 0;
        size_t colon_index = pos_;
        while((colon_index < encoded_.length()) && is_digit(encoded_[colon_index]))
        {
            const size_t digit = encoded_[colon_index] - '0';
            if(str_length > (std::numeric_limits<size_t>::max() - digit) / 10)
            {
                // no input is this large, so the string is necessarily truncated
                error = make_error_code(bencode_errc::bstring_truncated);
                return {};
            }
            str_length = str_length * 10 + digit;
            ++colon_index;
        }
        // the first character after the digits in a string must be a colon
        if((colon_index == encoded_.length()) || (encoded_[colon_index] != ':'))
        {
            pos_ = colon_index;
            error = make_error_code(bencode_errc::bstring_missing_colon);
            return {};
        }

        const size_t str_start = colon_index + 1;
        if(str_length > encoded_.length() - str_start)
        {
            error = make_error_code(bencode_errc::bstring_truncated);
            return {};
        }

        // go to the next element
        pos_ = str_start + str_length;
        return bvalue(encoded_.substr(str_start, str_length));
    }

    bvalue decode_bnumber(std::error_code& error)
    {
        const size_t start = pos_ + 1;
        size_t end = start;
        if((end < encoded_.length()) && (encoded_[end] == '-'))
        {
            ++end;
        }
        while((end < encoded_.length()) && is_digit(encoded_[end]))
        {
            ++end;
        }
        // the first character after the digits in number must be the 'e' end token,
        // and there must have been at least one digit
        if((end == encoded_.length()) || (encoded_[end] != 'e')
           || !is_digit(encoded_[end - 1]))
        {
            error = make_error_code(bencode_errc::bnumber_invalid);
            return {};
        }

        bnumber n = bnumber::from_string(encoded_.substr(start, end - start));
        // go to the next element
        pos_ = end + 1;
        return bvalue(std::move(n));
    }

    bool enter_container(std::error_code& error)
    {
        if(++depth_ > max_nesting_depth)
        {
            error = make_error_code(bencode_errc::nesting_too_deep);
            return false;
        }
        // go past the header token to the first element
        ++pos_;
        return true;
    }

    bvalue decode_blist(std::error_code& error)
    {
        if(!enter_container(error)) { return {}; }
        bvalue::list_type list;
        while(!at_end() && (encoded_[pos_] != 'e'))
        {
            list.emplace_back(decode_dispatch(error));
            if(error) { return {}; }
        }

        if(at_end())
        {
            error = make_error_code(bencode_errc::unterminated_container);
            return {};
        }
        // go past the 'e' end token to the next element
        ++pos_;
        --depth_;
        return bvalue(std::move(list));
    }

    bvalue decode_bmap(std::error_code& error)
    {
        if(!enter_container(error)) { return {}; }
        bvalue::map_type map;
        while(!at_end() && (encoded_[pos_] != 'e'))
        {
            if(!is_digit(encoded_[pos_]))
            {
                // keys must be strings
                error = make_error_code(bencode_errc::bmap_key_not_string);
                return {};
            }
            bvalue key = decode_bstring(error);
            if(error) { return {}; }

            if(at_end())
            {
                error = make_error_code(bencode_errc::unterminated_container);
                return {};
            }
            else if(encoded_[pos_] == 'e')
            {
                error = make_error_code(bencode_errc::bmap_missing_value);
                return {};
            }

            // key order is not validated and duplicates overwrite the previous value
            map[std::move(key.as_string())] = decode_dispatch(error);
            if(error) { return {}; }
        }

        if(at_end())
        {
            error = make_error_code(bencode_errc::unterminated_container);
            return {};
        }
        // go past the 'e' end token to the next element
        ++pos_;
        --depth_;
        return bvalue(std::move(map));
    }
};

decode_result decode(std::string_view encoded, size_t offset, std::error_code& error)
{
    bdecoder decoder(encoded, offset);
    decode_result result;
    result.value = decoder.decode(error);
    if(error) { result.value = bvalue(); }
    result.length = decoder.pos() - offset;
    return result;
}

decode_result decode(std::string_view encoded, size_t offset)
{
    std::error_code error;
    bdecoder decoder(encoded, offset);
    decode_result result;
    result.value = decoder.decode(error);
    if(error) { throw bencode_error(error, decoder.pos()); }
    result.length = decoder.pos() - offset;
    return result;
}

} // namespace torgen
