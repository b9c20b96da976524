#include "atlex/encoding.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace atlex::encoding::test {

namespace {

Bytes bytes_of(std::string_view text)
{
    return Bytes(text.begin(), text.end());
}

}  // namespace

TEST(EncodingTest, Base32MatchesRfc4648Vectors)
{
    EXPECT_EQ(encode_base32(bytes_of("f")), "my");
    EXPECT_EQ(encode_base32(bytes_of("fo")), "mzxq");
    EXPECT_EQ(encode_base32(bytes_of("foobar")), "mzxw6ytboi");

    auto decoded = decode_base32("mzxw6ytboi");
    ASSERT_TRUE(decoded);
    EXPECT_EQ(*decoded, bytes_of("foobar"));

    auto upper = decode_base32("MZXW6YTBOI", true);
    ASSERT_TRUE(upper);
    EXPECT_EQ(*upper, bytes_of("foobar"));
}

TEST(EncodingTest, Base32RejectsBadInput)
{
    EXPECT_FALSE(decode_base32("MZXW6YTBOI"));  // wrong case
    EXPECT_FALSE(decode_base32("mzxw1"));       // '1' is not in the alphabet
    EXPECT_FALSE(decode_base32("m"));           // dangling 5 bits
    EXPECT_FALSE(decode_base32("mz"));          // nonzero leftover bits
}

TEST(EncodingTest, Base58HandlesLeadingZeros)
{
    const Bytes data = {0x00, 0x00, 0x01, 0x02};
    const std::string encoded = encode_base58btc(data);
    EXPECT_EQ(encoded.substr(0, 2), "11");

    auto decoded = decode_base58btc(encoded);
    ASSERT_TRUE(decoded);
    EXPECT_EQ(*decoded, data);

    EXPECT_EQ(encode_base58btc(bytes_of("hello world")), "StV1DL6CwTryKyV");
    EXPECT_FALSE(decode_base58btc("0OIl"));
}

TEST(EncodingTest, Base64AcceptsPaddedAndUnpadded)
{
    EXPECT_EQ(encode_base64(bytes_of("hi")), "aGk");

    auto unpadded = decode_base64("aGk");
    auto padded = decode_base64("aGk=");
    ASSERT_TRUE(unpadded);
    ASSERT_TRUE(padded);
    EXPECT_EQ(*unpadded, bytes_of("hi"));
    EXPECT_EQ(*padded, bytes_of("hi"));

    const Bytes url_bytes = {0xfb, 0xff};
    EXPECT_EQ(encode_base64(url_bytes, Base64Alphabet::kUrl), "-_8");
    EXPECT_EQ(encode_base64(url_bytes, Base64Alphabet::kStandard), "+/8");
    EXPECT_FALSE(decode_base64("-_8", Base64Alphabet::kStandard));
    EXPECT_FALSE(decode_base64("a"));
}

TEST(EncodingTest, Base16RespectsCase)
{
    auto lower = decode_base16("00ff10");
    ASSERT_TRUE(lower);
    EXPECT_EQ(*lower, (Bytes{0x00, 0xff, 0x10}));
    EXPECT_FALSE(decode_base16("00FF10"));
    EXPECT_TRUE(decode_base16("00FF10", true));
    EXPECT_FALSE(decode_base16("abc"));
}

TEST(EncodingTest, SortableBase32PreservesOrder)
{
    const std::uint64_t small = 0x0000'0000'0000'0001ULL;
    const std::uint64_t large = 0x1842'dbf9'f660'01ffULL;
    EXPECT_EQ(encode_sortable_u64(large), "3kkqvzbva22jz");
    EXPECT_LT(encode_sortable_u64(small), encode_sortable_u64(large));

    auto decoded = decode_sortable_u64("3kkqvzbva22jz");
    ASSERT_TRUE(decoded);
    EXPECT_EQ(*decoded, large);

    // First character above 'j' would set the 65th bit
    EXPECT_FALSE(decode_sortable_u64("kkkqvzbva22jz"));
    EXPECT_FALSE(decode_sortable_u64("3kkqvzbva22j"));
}

TEST(EncodingTest, VarintRoundTripAndMinimality)
{
    Bytes out;
    write_uvarint(300, out);
    EXPECT_EQ(out, (Bytes{0xac, 0x02}));

    auto varint = read_uvarint(out);
    ASSERT_TRUE(varint);
    EXPECT_EQ(varint->value, 300U);
    EXPECT_EQ(varint->length, 2U);

    const Bytes non_minimal = {0x81, 0x00};
    EXPECT_FALSE(read_uvarint(non_minimal));
    const Bytes truncated = {0x80};
    EXPECT_FALSE(read_uvarint(truncated));
}

TEST(EncodingTest, PercentDecode)
{
    EXPECT_EQ(percent_decode("example.com%3A8080"), "example.com:8080");
    EXPECT_EQ(percent_decode("plain"), "plain");
    EXPECT_FALSE(percent_decode("bad%2"));
    EXPECT_FALSE(percent_decode("bad%zz"));
    EXPECT_FALSE(percent_decode("%"));
}

}  // namespace atlex::encoding::test
