/**
 * @file cid.cpp
 * @brief Multibase CID parsing and canonical encoding
 */

#include "atlex/cid.hpp"

#include "atlex/encoding.hpp"

#include <optional>

namespace atlex::identifiers {

namespace {

/// Expected digest length of a supported hash function; 0 means any length
[[nodiscard]] std::optional<std::size_t> digest_length(std::uint64_t hash_code)
{
    switch (hash_code) {
        case multicodec::kIdentity:
            return 0;
        case multicodec::kSha1:
            return 20;
        case multicodec::kSha2_256:
        case multicodec::kSha3_256:
        case multicodec::kBlake2b_256:
        case multicodec::kBlake3:
            return 32;
        case multicodec::kSha2_512:
        case multicodec::kSha3_512:
            return 64;
        default:
            return std::nullopt;
    }
}

[[nodiscard]] std::string to_hex(std::uint64_t value)
{
    constexpr std::string_view kHex = "0123456789abcdef";
    std::string hex;
    do {
        hex.insert(hex.begin(), kHex[value & 0xF]);
        value >>= 4;
    } while (value != 0);
    return hex;
}

[[nodiscard]] FormatError bad_varint(std::string_view what)
{
    return FormatError::make(FormatErrorKind::kBadVarint,
                             "malformed varint for CID " + std::string(what));
}

/// Parse a multihash that must span the rest of @p data
[[nodiscard]] FormatResult<void> parse_multihash(std::span<const std::uint8_t> data, Cid& cid)
{
    auto code = encoding::read_uvarint(data);
    if (!code) {
        return std::unexpected(bad_varint("hash function"));
    }
    data = data.subspan(code->length);
    auto length = encoding::read_uvarint(data);
    if (!length) {
        return std::unexpected(bad_varint("digest length"));
    }
    data = data.subspan(length->length);

    auto expected = digest_length(code->value);
    if (!expected) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kUnsupportedHashFunction,
            "unsupported multihash function 0x" + to_hex(code->value)));
    }
    if (*expected != 0 && length->value != *expected) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kDigestLengthMismatch,
            "digest length " + std::to_string(length->value) + " does not match expected "
                + std::to_string(*expected)));
    }
    if (data.size() < length->value) {
        return std::unexpected(FormatError::make(FormatErrorKind::kDigestLengthMismatch,
                                                 "CID digest is truncated"));
    }
    if (data.size() > length->value) {
        return std::unexpected(
            FormatError::make(FormatErrorKind::kTrailingBytes, "trailing bytes after CID digest"));
    }

    cid.hash_code = code->value;
    cid.digest.assign(data.begin(), data.end());
    return {};
}

[[nodiscard]] FormatResult<Cid> parse_v0(std::string_view input)
{
    if (input.size() != kCidV0Length) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kBadMultibaseEncoding,
            "CIDv0 must be " + std::to_string(kCidV0Length) + " characters"));
    }
    auto bytes = encoding::decode_base58btc(input);
    if (!bytes) {
        return std::unexpected(FormatError::make(FormatErrorKind::kBadMultibaseEncoding,
                                                 "CIDv0 is not valid base58btc"));
    }
    Cid cid{.version = 0, .codec = multicodec::kDagPb};
    if (bytes->size() < 2 || (*bytes)[0] != multicodec::kSha2_256 || (*bytes)[1] != 32) {
        return std::unexpected(FormatError::make(FormatErrorKind::kUnsupportedHashFunction,
                                                 "CIDv0 must be a sha2-256 multihash"));
    }
    if (auto multihash = parse_multihash(*bytes, cid); !multihash) {
        return std::unexpected(multihash.error());
    }
    return cid;
}

[[nodiscard]] std::optional<encoding::Bytes> decode_multibase(char prefix, std::string_view body)
{
    switch (prefix) {
        case 'b':
            return encoding::decode_base32(body);
        case 'B':
            return encoding::decode_base32(body, true);
        case 'z':
            return encoding::decode_base58btc(body);
        case 'f':
            return encoding::decode_base16(body);
        case 'F':
            return encoding::decode_base16(body, true);
        case 'm':
            return encoding::decode_base64(body, encoding::Base64Alphabet::kStandard);
        case 'u':
            return encoding::decode_base64(body, encoding::Base64Alphabet::kUrl);
        default:
            return std::nullopt;
    }
}

}  // namespace

std::vector<std::uint8_t> Cid::to_bytes() const
{
    encoding::Bytes out;
    if (version != 0) {
        encoding::write_uvarint(version, out);
        encoding::write_uvarint(codec, out);
    }
    encoding::write_uvarint(hash_code, out);
    encoding::write_uvarint(digest.size(), out);
    out.insert(out.end(), digest.begin(), digest.end());
    return out;
}

std::string Cid::to_string() const
{
    const auto bytes = to_bytes();
    if (version == 0) {
        return encoding::encode_base58btc(bytes);
    }
    return "b" + encoding::encode_base32(bytes);
}

FormatResult<Cid> parse_cid(std::string_view input)
{
    if (input.empty()) {
        return std::unexpected(FormatError::make(FormatErrorKind::kEmpty, "empty CID"));
    }
    if (input.starts_with("Qm")) {
        return parse_v0(input);
    }

    constexpr std::string_view kPrefixes = "bBzfFmu";
    const char prefix = input.front();
    if (kPrefixes.find(prefix) == std::string_view::npos) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kBadMultibasePrefix,
            "unsupported multibase prefix '" + std::string(1, prefix) + "'"));
    }
    auto bytes = decode_multibase(prefix, input.substr(1));
    if (!bytes || bytes->empty()) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kBadMultibaseEncoding,
            "CID body is not valid for multibase prefix '" + std::string(1, prefix) + "'"));
    }

    std::span<const std::uint8_t> data(*bytes);
    auto version = encoding::read_uvarint(data);
    if (!version) {
        return std::unexpected(bad_varint("version"));
    }
    if (version->value != 1) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kUnsupportedCidVersion,
            "unsupported CID version " + std::to_string(version->value)));
    }
    data = data.subspan(version->length);
    auto codec = encoding::read_uvarint(data);
    if (!codec) {
        return std::unexpected(bad_varint("codec"));
    }
    data = data.subspan(codec->length);

    Cid cid{.version = 1, .codec = codec->value};
    if (auto multihash = parse_multihash(data, cid); !multihash) {
        return std::unexpected(multihash.error());
    }
    return cid;
}

}  // namespace atlex::identifiers
