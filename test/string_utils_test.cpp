#include "torgen/string_utils.hpp"
#include "torgen/types.hpp"

#include <gtest/gtest.h>

using namespace torgen;

TEST(StringUtilsTest, ToHex)
{
    EXPECT_EQ(util::to_hex(std::string("\x00\x7f\x80\xff", 4)), "007f80ff");
    sha1_hash h{};
    h[19] = 0xab;
    EXPECT_EQ(util::to_hex(h), std::string(38, '0') + "ab");
}

TEST(StringUtilsTest, UrlEncode)
{
    EXPECT_EQ(util::url_encode(std::string("AZaz09-._~")), "AZaz09-._~");
    EXPECT_EQ(util::url_encode(std::string("a b/c:d?e=f&g")), "a%20b%2Fc%3Ad%3Fe%3Df%26g");
    EXPECT_EQ(util::url_encode(std::string("\xc3\xa9\xff", 3)), "%C3%A9%FF");
    EXPECT_EQ(util::url_encode(std::string()), "");
}

TEST(StringUtilsTest, IsAllDigits)
{
    EXPECT_TRUE(util::is_all_digits(std::string("0123456789")));
    EXPECT_FALSE(util::is_all_digits(std::string()));
    EXPECT_FALSE(util::is_all_digits(std::string("12a")));
    EXPECT_FALSE(util::is_all_digits(std::string("-1")));
}
