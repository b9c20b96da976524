/**
 * @file encoding.cpp
 * @brief Multibase alphabets, varints and percent-decoding (standalone)
 */

#include "atlex/encoding.hpp"

#include <algorithm>

namespace atlex::encoding {

namespace {

constexpr std::string_view kBase32Lower = "abcdefghijklmnopqrstuvwxyz234567";
constexpr std::string_view kBase58Alphabet =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
constexpr std::string_view kBase64Standard =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr std::string_view kBase64Url =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

// Multiformats caps unsigned varints at 63 bits (9 bytes)
constexpr std::size_t kMaxVarintBytes = 9;

[[nodiscard]] constexpr int base32_value(char c, bool upper) noexcept
{
    const char first = upper ? 'A' : 'a';
    if (c >= first && c <= first + 25) {
        return c - first;
    }
    if (c >= '2' && c <= '7') {
        return c - '2' + 26;
    }
    return -1;
}

[[nodiscard]] constexpr int hex_value(char c, bool allow_upper, bool allow_lower) noexcept
{
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (allow_lower && c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (allow_upper && c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

[[nodiscard]] int alphabet_index(std::string_view alphabet, char c) noexcept
{
    auto pos = alphabet.find(c);
    return pos == std::string_view::npos ? -1 : static_cast<int>(pos);
}

}  // namespace

std::string encode_base32(std::span<const std::uint8_t> data)
{
    std::string out;
    out.reserve((data.size() * 8 + 4) / 5);
    std::uint32_t buffer = 0;
    int bits = 0;
    for (std::uint8_t byte : data) {
        buffer = (buffer << 8U) | byte;
        bits += 8;
        while (bits >= 5) {
            out.push_back(kBase32Lower[(buffer >> (bits - 5)) & 0x1FU]);
            bits -= 5;
        }
    }
    if (bits > 0) {
        out.push_back(kBase32Lower[(buffer << (5 - bits)) & 0x1FU]);
    }
    return out;
}

std::optional<Bytes> decode_base32(std::string_view input, bool upper)
{
    Bytes out;
    out.reserve(input.size() * 5 / 8);
    std::uint32_t buffer = 0;
    int bits = 0;
    for (char c : input) {
        int value = base32_value(c, upper);
        if (value < 0) {
            return std::nullopt;
        }
        buffer = (buffer << 5U) | static_cast<std::uint32_t>(value);
        bits += 5;
        if (bits >= 8) {
            out.push_back(static_cast<std::uint8_t>((buffer >> (bits - 8)) & 0xFFU));
            bits -= 8;
        }
    }
    // A dangling group of 5+ bits means a truncated character sequence
    if (bits >= 5 || (buffer & ((1U << bits) - 1U)) != 0) {
        return std::nullopt;
    }
    return out;
}

std::string encode_base58btc(std::span<const std::uint8_t> data)
{
    std::size_t zeros = 0;
    while (zeros < data.size() && data[zeros] == 0) {
        ++zeros;
    }
    std::vector<std::uint8_t> digits((data.size() - zeros) * 138 / 100 + 1, 0);
    std::size_t length = 0;
    for (std::size_t i = zeros; i < data.size(); ++i) {
        int carry = data[i];
        std::size_t j = 0;
        for (auto it = digits.rbegin(); (carry != 0 || j < length) && it != digits.rend();
             ++it, ++j) {
            carry += 256 * (*it);
            *it = static_cast<std::uint8_t>(carry % 58);
            carry /= 58;
        }
        length = j;
    }
    auto it = digits.begin() + static_cast<std::ptrdiff_t>(digits.size() - length);
    while (it != digits.end() && *it == 0) {
        ++it;
    }
    std::string out(zeros, '1');
    out.reserve(zeros + static_cast<std::size_t>(digits.end() - it));
    for (; it != digits.end(); ++it) {
        out.push_back(kBase58Alphabet[*it]);
    }
    return out;
}

std::optional<Bytes> decode_base58btc(std::string_view input)
{
    std::size_t zeros = 0;
    while (zeros < input.size() && input[zeros] == '1') {
        ++zeros;
    }
    std::vector<std::uint8_t> b256((input.size() - zeros) * 733 / 1000 + 1, 0);
    std::size_t length = 0;
    for (std::size_t i = zeros; i < input.size(); ++i) {
        int carry = alphabet_index(kBase58Alphabet, input[i]);
        if (carry < 0) {
            return std::nullopt;
        }
        std::size_t j = 0;
        for (auto it = b256.rbegin(); (carry != 0 || j < length) && it != b256.rend();
             ++it, ++j) {
            carry += 58 * (*it);
            *it = static_cast<std::uint8_t>(carry % 256);
            carry /= 256;
        }
        if (carry != 0) {
            return std::nullopt;
        }
        length = j;
    }
    Bytes out(zeros, 0);
    out.insert(out.end(), b256.end() - static_cast<std::ptrdiff_t>(length), b256.end());
    return out;
}

std::optional<Bytes> decode_base16(std::string_view input, bool upper)
{
    if (input.size() % 2 != 0) {
        return std::nullopt;
    }
    Bytes out;
    out.reserve(input.size() / 2);
    for (std::size_t i = 0; i < input.size(); i += 2) {
        int hi = hex_value(input[i], upper, !upper);
        int lo = hex_value(input[i + 1], upper, !upper);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return out;
}

std::string encode_base64(std::span<const std::uint8_t> data, Base64Alphabet alphabet)
{
    const std::string_view table =
        alphabet == Base64Alphabet::kStandard ? kBase64Standard : kBase64Url;
    std::string out;
    out.reserve((data.size() * 4 + 2) / 3);
    std::uint32_t buffer = 0;
    int bits = 0;
    for (std::uint8_t byte : data) {
        buffer = (buffer << 8U) | byte;
        bits += 8;
        while (bits >= 6) {
            out.push_back(table[(buffer >> (bits - 6)) & 0x3FU]);
            bits -= 6;
        }
    }
    if (bits > 0) {
        out.push_back(table[(buffer << (6 - bits)) & 0x3FU]);
    }
    return out;
}

std::optional<Bytes> decode_base64(std::string_view input, Base64Alphabet alphabet)
{
    const std::string_view table =
        alphabet == Base64Alphabet::kStandard ? kBase64Standard : kBase64Url;
    if (input.size() % 4 == 0) {
        int padding = 0;
        while (padding < 2 && !input.empty() && input.back() == '=') {
            input.remove_suffix(1);
            ++padding;
        }
    }
    if (input.size() % 4 == 1) {
        return std::nullopt;
    }
    Bytes out;
    out.reserve(input.size() * 3 / 4);
    std::uint32_t buffer = 0;
    int bits = 0;
    for (char c : input) {
        int value = alphabet_index(table, c);
        if (value < 0) {
            return std::nullopt;
        }
        buffer = (buffer << 6U) | static_cast<std::uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            out.push_back(static_cast<std::uint8_t>((buffer >> (bits - 8)) & 0xFFU));
            bits -= 8;
        }
    }
    return out;
}

std::string encode_sortable_u64(std::uint64_t value)
{
    std::string out(13, '2');
    for (std::size_t i = 0; i < out.size(); ++i) {
        const auto shift = static_cast<unsigned>(60 - 5 * i);
        out[i] = kSortableBase32Alphabet[(value >> shift) & 0x1FU];
    }
    return out;
}

std::optional<std::uint64_t> decode_sortable_u64(std::string_view input)
{
    if (input.size() != 13) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < input.size(); ++i) {
        int digit = alphabet_index(kSortableBase32Alphabet, input[i]);
        if (digit < 0 || (i == 0 && digit >= 16)) {
            return std::nullopt;
        }
        value = (value << 5U) | static_cast<std::uint64_t>(digit);
    }
    return value;
}

std::optional<Varint> read_uvarint(std::span<const std::uint8_t> data)
{
    std::uint64_t value = 0;
    const std::size_t limit = std::min(data.size(), kMaxVarintBytes);
    for (std::size_t i = 0; i < limit; ++i) {
        const std::uint8_t byte = data[i];
        value |= static_cast<std::uint64_t>(byte & 0x7FU) << (7 * i);
        if ((byte & 0x80U) == 0) {
            // A final zero byte after continuation bytes is a non-minimal encoding
            if (i > 0 && byte == 0) {
                return std::nullopt;
            }
            return Varint{.value = value, .length = i + 1};
        }
    }
    return std::nullopt;
}

void write_uvarint(std::uint64_t value, Bytes& out)
{
    while (value >= 0x80U) {
        out.push_back(static_cast<std::uint8_t>((value & 0x7FU) | 0x80U));
        value >>= 7U;
    }
    out.push_back(static_cast<std::uint8_t>(value));
}

std::optional<std::string> percent_decode(std::string_view input)
{
    std::string out;
    out.reserve(input.size());
    for (std::size_t i = 0; i < input.size(); ++i) {
        if (input[i] != '%') {
            out.push_back(input[i]);
            continue;
        }
        if (i + 2 >= input.size()) {
            return std::nullopt;
        }
        int hi = hex_value(input[i + 1], true, true);
        int lo = hex_value(input[i + 2], true, true);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    return out;
}

}  // namespace atlex::encoding
