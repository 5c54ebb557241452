#include "torgen/bencode.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <limits>
#include <type_traits>

using namespace torgen;

TEST(BencodeTest, EncodesStrings)
{
    EXPECT_EQ(encode(bvalue("spam")), "4:spam");
    EXPECT_EQ(encode(bvalue("")), "0:");
    // strings are byte strings and may contain anything, including NUL
    EXPECT_EQ(encode(bvalue(std::string("a\0b", 3))), std::string("3:a\0b", 5));
}

TEST(BencodeTest, EncodesStandaloneStrings)
{
    EXPECT_EQ(bencode_string("spam"), "4:spam");
    EXPECT_EQ(bencode_string(""), "0:");
    EXPECT_EQ(bencode_string(std::string_view("\0\xff", 2)), std::string("2:\0\xff", 4));
}

TEST(BencodeTest, CharactersAreNotNumbers)
{
    static_assert(!std::is_constructible<bvalue, char>::value, "");
    static_assert(!std::is_constructible<bvalue, wchar_t>::value, "");
    static_assert(!std::is_constructible<bvalue, char16_t>::value, "");
    static_assert(!std::is_constructible<bvalue, char32_t>::value, "");
    static_assert(!std::is_constructible<bvalue, bool>::value, "");
    static_assert(!std::is_constructible<bnumber, char>::value, "");
    static_assert(std::is_constructible<bvalue, int>::value, "");
    static_assert(std::is_constructible<bvalue, uint8_t>::value, "");
    static_assert(std::is_constructible<bvalue, int64_t>::value, "");

    EXPECT_EQ(encode(bvalue(uint8_t(97))), "i97e");
}

TEST(BencodeTest, EncodesNumbers)
{
    EXPECT_EQ(encode(bvalue(42)), "i42e");
    EXPECT_EQ(encode(bvalue(0)), "i0e");
    EXPECT_EQ(encode(bvalue(-3)), "i-3e");
    EXPECT_EQ(encode(bvalue(int64_t(9223372036854775807))), "i9223372036854775807e");
}

TEST(BencodeTest, EncodesNumbersBeyond64Bits)
{
    const auto n = bnumber::from_string("123456789012345678901234567890");
    EXPECT_EQ(encode(bvalue(n)), "i123456789012345678901234567890e");
    EXPECT_FALSE(n.fits_int64());
    EXPECT_THROW(n.to_int64(), std::out_of_range);

    const auto m = bnumber::from_string("-98765432109876543210");
    EXPECT_TRUE(m.is_negative());
    EXPECT_EQ(bencode_number(m), "i-98765432109876543210e");
}

TEST(BencodeTest, NumbersAreCanonicalized)
{
    EXPECT_EQ(bnumber::from_string("007"), bnumber(7));
    EXPECT_EQ(bnumber::from_string("-0"), bnumber(0));
    EXPECT_EQ(bnumber::from_string("000").to_string(), "0");
    EXPECT_EQ(bnumber::from_string("-0012").to_string(), "-12");
    EXPECT_THROW(bnumber::from_string(""), std::invalid_argument);
    EXPECT_THROW(bnumber::from_string("-"), std::invalid_argument);
    EXPECT_THROW(bnumber::from_string("1a"), std::invalid_argument);
}

TEST(BencodeTest, Int64Limits)
{
    const auto min = bnumber::from_string("-9223372036854775808");
    EXPECT_TRUE(min.fits_int64());
    EXPECT_EQ(min.to_int64(), std::numeric_limits<int64_t>::min());
    EXPECT_FALSE(bnumber::from_string("9223372036854775808").fits_int64());
    EXPECT_FALSE(bnumber::from_string("-9223372036854775809").fits_int64());
}

TEST(BencodeTest, EncodesLists)
{
    bvalue list;
    list.push_back("spam");
    list.push_back(42);
    list.push_back(bvalue::empty_list());
    EXPECT_EQ(encode(list), "l4:spami42elee");
    EXPECT_EQ(encode(bvalue::empty_list()), "le");
}

TEST(BencodeTest, MapKeysAreSorted)
{
    bvalue a;
    a["zeta"] = 1;
    a["alpha"] = "x";
    a["mid"] = bvalue::empty_map();

    bvalue b;
    b["mid"] = bvalue::empty_map();
    b["alpha"] = "x";
    b["zeta"] = 1;

    EXPECT_EQ(encode(a), "d5:alpha1:x3:midde4:zetai1ee");
    EXPECT_EQ(encode(a), encode(b));
    EXPECT_EQ(a, b);
}

TEST(BencodeTest, MapKeysCompareAsUnsignedBytes)
{
    bvalue map;
    map["\xff"] = 1;
    map["a"] = 2;
    map["B"] = 3;
    EXPECT_EQ(encode(map), "d1:Bi3e1:ai2e1:\xffi1ee");
}

TEST(BencodeTest, NoneValueCannotBeEncoded)
{
    bvalue map;
    map["ok"] = 1;
    map["missing"];

    std::error_code ec;
    EXPECT_TRUE(encode(map, ec).empty());
    EXPECT_EQ(ec, std::error_code(bencode_errc::unsupported_type));

    EXPECT_THROW(encode(bvalue()), bencode_error);

    bvalue list;
    list.push_back(bvalue());
    try
    {
        encode(list);
        FAIL() << "encoding a list with a none element should fail";
    }
    catch(const bencode_error& e)
    {
        EXPECT_EQ(e.code(), std::error_code(bencode_errc::unsupported_type));
    }
}

TEST(BencodeTest, EncodedLengthMatchesEncoding)
{
    bvalue v;
    v["announce"] = "http://tracker.example.org/announce";
    v["info"]["length"] = 600000;
    v["info"]["name"] = "file.bin";
    v["info"]["pieces"] = std::string(60, '\x01');
    v["list"].push_back(-17);
    EXPECT_EQ(encoded_length(v), encode(v).length());
}

TEST(BencodeTest, Accessors)
{
    bvalue v;
    EXPECT_TRUE(v.is_none());
    v["n"] = 5;
    v["s"] = "text";
    EXPECT_TRUE(v.is_map());
    EXPECT_EQ(v.size(), 2u);
    EXPECT_EQ(v.find("n")->as_int(), 5);
    EXPECT_EQ(v.find("s")->as_string(), "text");
    EXPECT_EQ(v.find("x"), nullptr);
    EXPECT_THROW(v.find("s")->as_number(), std::invalid_argument);
    EXPECT_THROW(v.as_list(), std::invalid_argument);
    EXPECT_EQ(bvalue(5).find("n"), nullptr);
}

TEST(BencodeTest, ToStringShowsBinaryAsHex)
{
    bvalue v;
    v["name"] = "a";
    v["hash"] = std::string("\x01\xab", 2);
    const std::string s = to_string(v);
    EXPECT_NE(s.find("\"name\": \"a\""), std::string::npos);
    EXPECT_NE(s.find("<0x01ab>"), std::string::npos);
}
