#include "torgen/bdecode.hpp"

#include <gtest/gtest.h>

using namespace torgen;

TEST(BdecodeTest, DecodesScalars)
{
    auto r = decode("4:spam");
    EXPECT_EQ(r.value, bvalue("spam"));
    EXPECT_EQ(r.length, 6u);

    r = decode("i-42e");
    EXPECT_EQ(r.value.as_int(), -42);
    EXPECT_EQ(r.length, 5u);

    r = decode("0:");
    EXPECT_EQ(r.value, bvalue(""));
}

TEST(BdecodeTest, CanonicalInputRoundTrips)
{
    const std::string inputs[] = {
        "d3:cow3:moo4:spaml1:a1:bee",
        "ld1:ai1eelee",
        "d4:infod6:lengthi600000e4:name8:file.binee",
        "i123456789012345678901234567890e",
    };
    for(const auto& input : inputs)
    {
        SCOPED_TRACE(input);
        const auto r = decode(input);
        EXPECT_EQ(r.length, input.length());
        EXPECT_EQ(encode(r.value), input);
    }
}

TEST(BdecodeTest, ConstructedTreesRoundTrip)
{
    std::string all_bytes;
    for(int c = 0; c < 256; ++c) { all_bytes += static_cast<char>(c); }

    bvalue nested_empty;
    nested_empty.push_back(bvalue::empty_list());
    nested_empty.push_back(bvalue::empty_map());
    nested_empty.push_back(bvalue(bvalue::list_type{bvalue::empty_list()}));

    bvalue tree;
    tree[std::string("\0key", 4)] = std::string("\0\0", 2);
    tree["\xff\xfe"] = all_bytes;
    tree["big"] = bnumber::from_string("-340282366920938463463374607431768211456");
    tree["zero"] = 0;
    tree["empty"] = "";
    tree["nested"] = nested_empty;
    tree["map"]["inner"]["deeper"] = bvalue::empty_map();
    tree["map"]["list"].push_back(-1);

    const std::vector<bvalue> values = {
        tree, nested_empty, bvalue(all_bytes), bvalue::empty_map(),
        bvalue(bnumber::from_string("98765432109876543210987654321"))};
    for(const auto& v : values)
    {
        const std::string encoded = encode(v);
        SCOPED_TRACE(to_string(v));
        const auto r = decode(encoded);
        EXPECT_EQ(r.value, v);
        EXPECT_EQ(r.length, encoded.length());
    }
}

TEST(BdecodeTest, StartsAtOffsetAndIgnoresTrailingData)
{
    const auto r = decode("xxi5eJUNK", 2);
    EXPECT_EQ(r.value.as_int(), 5);
    EXPECT_EQ(r.length, 3u);
}

TEST(BdecodeTest, AcceptsNonCanonicalInput)
{
    EXPECT_EQ(decode("i007e").value.as_int(), 7);
    EXPECT_EQ(decode("i-0e").value.as_int(), 0);

    // unsorted keys are accepted and come out sorted
    const auto r = decode("d1:bi1e1:ai2ee");
    EXPECT_EQ(encode(r.value), "d1:ai2e1:bi1ee");
}

TEST(BdecodeTest, LaterDuplicateKeyWins)
{
    const auto r = decode("d1:ai1e1:ai2ee");
    ASSERT_TRUE(r.value.is_map());
    EXPECT_EQ(r.value.size(), 1u);
    EXPECT_EQ(r.value.find("a")->as_int(), 2);
}

TEST(BdecodeTest, ReportsMalformedInput)
{
    const struct { std::string input; bencode_errc error; } cases[] = {
        {"", bencode_errc::unknown_type},
        {"x", bencode_errc::unknown_type},
        {"3:ab", bencode_errc::bstring_truncated},
        {"3ab", bencode_errc::bstring_missing_colon},
        {"3", bencode_errc::bstring_missing_colon},
        {"i3x", bencode_errc::bnumber_invalid},
        {"i3", bencode_errc::bnumber_invalid},
        {"ie", bencode_errc::bnumber_invalid},
        {"i-e", bencode_errc::bnumber_invalid},
        {"i--1e", bencode_errc::bnumber_invalid},
        {"l4:spam", bencode_errc::unterminated_container},
        {"d1:ai1e", bencode_errc::unterminated_container},
        {"d3:keye", bencode_errc::bmap_missing_value},
        {"di1ei2ee", bencode_errc::bmap_key_not_string},
        {std::string(2000, 'l'), bencode_errc::nesting_too_deep},
    };
    for(const auto& c : cases)
    {
        SCOPED_TRACE(c.input.substr(0, 16));
        std::error_code ec;
        const auto r = decode(c.input, 0, ec);
        EXPECT_EQ(ec, std::error_code(c.error));
        EXPECT_TRUE(r.value.is_none());
        EXPECT_THROW(decode(c.input), bencode_error);
    }
}

TEST(BdecodeTest, ErrorCarriesPosition)
{
    try
    {
        decode("l4:spami1exe");
        FAIL() << "decoding should have failed";
    }
    catch(const bencode_error& e)
    {
        EXPECT_EQ(e.code(), std::error_code(bencode_errc::unknown_type));
        EXPECT_EQ(e.offset(), 10u);
    }
}

TEST(BdecodeTest, ErrorMessages)
{
    EXPECT_EQ(std::error_code(bencode_errc::unknown_type).message(), "invalid encoding");
    EXPECT_EQ(std::error_code(bencode_errc::bnumber_invalid).message(), "invalid integer");
    EXPECT_EQ(std::error_code(bencode_errc::unterminated_container).message(),
            "unterminated container");
    EXPECT_STREQ(std::error_code(bencode_errc::bstring_truncated).category().name(),
            "bencode");
}
