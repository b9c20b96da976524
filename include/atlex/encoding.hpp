#pragma once

/**
 * @file encoding.hpp
 * @brief Binary-to-text codecs used by the identifier validators
 *
 * Standalone implementations (no external dependency) of the multibase
 * alphabets that appear in DIDs, TIDs and CIDs, plus unsigned varints and
 * RFC 3986 percent-decoding. Decoders return std::nullopt on malformed input;
 * callers map that to the specific FormatErrorKind they report.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace atlex::encoding {

using Bytes = std::vector<std::uint8_t>;

enum class Base64Alphabet {
    kStandard,  ///< RFC 4648 section 4 ('+', '/')
    kUrl        ///< RFC 4648 section 5 ('-', '_')
};

/// RFC 4648 base32, lowercase alphabet, no padding
[[nodiscard]] std::string encode_base32(std::span<const std::uint8_t> data);

/**
 * Decode unpadded RFC 4648 base32.
 * @param input Encoded text
 * @param upper Expect the uppercase alphabet instead of the lowercase one
 */
[[nodiscard]] std::optional<Bytes> decode_base32(std::string_view input, bool upper = false);

[[nodiscard]] std::string encode_base58btc(std::span<const std::uint8_t> data);
[[nodiscard]] std::optional<Bytes> decode_base58btc(std::string_view input);

[[nodiscard]] std::optional<Bytes> decode_base16(std::string_view input, bool upper = false);

/// Unpadded base64 (the form used by `$bytes` in JSON records)
[[nodiscard]] std::string encode_base64(std::span<const std::uint8_t> data,
                                        Base64Alphabet alphabet = Base64Alphabet::kStandard);

/// Accepts input with or without '=' padding
[[nodiscard]] std::optional<Bytes>
decode_base64(std::string_view input, Base64Alphabet alphabet = Base64Alphabet::kStandard);

/// Alphabet of the sortable base32 used by TIDs
inline constexpr std::string_view kSortableBase32Alphabet = "234567abcdefghijklmnopqrstuvwxyz";

/// Encode a 64-bit value as 13 sortable base32 characters (most significant first)
[[nodiscard]] std::string encode_sortable_u64(std::uint64_t value);

/// Decode exactly 13 sortable base32 characters; the 65th (top) bit must be clear
[[nodiscard]] std::optional<std::uint64_t> decode_sortable_u64(std::string_view input);

struct Varint
{
    std::uint64_t value;
    std::size_t length;  ///< Number of bytes consumed
};

/**
 * Read a multiformats unsigned varint (at most 9 bytes, minimally encoded).
 */
[[nodiscard]] std::optional<Varint> read_uvarint(std::span<const std::uint8_t> data);

void write_uvarint(std::uint64_t value, Bytes& out);

/**
 * RFC 3986 percent-decoding.
 * @return std::nullopt if a '%' is not followed by two hex digits
 */
[[nodiscard]] std::optional<std::string> percent_decode(std::string_view input);

}  // namespace atlex::encoding
