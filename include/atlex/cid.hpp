#pragma once

/**
 * @file cid.hpp
 * @brief Content identifiers (CIDv0 and CIDv1)
 */

#include "atlex/identifiers.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace atlex::identifiers {

namespace multicodec {
inline constexpr std::uint64_t kDagPb = 0x70;
inline constexpr std::uint64_t kDagCbor = 0x71;
inline constexpr std::uint64_t kRaw = 0x55;

inline constexpr std::uint64_t kIdentity = 0x00;
inline constexpr std::uint64_t kSha1 = 0x11;
inline constexpr std::uint64_t kSha2_256 = 0x12;
inline constexpr std::uint64_t kSha2_512 = 0x13;
inline constexpr std::uint64_t kSha3_512 = 0x14;
inline constexpr std::uint64_t kSha3_256 = 0x16;
inline constexpr std::uint64_t kBlake3 = 0x1e;
inline constexpr std::uint64_t kBlake2b_256 = 0xb220;
}  // namespace multicodec

inline constexpr std::size_t kCidV0Length = 46;

struct Cid
{
    std::uint64_t version = 1;
    std::uint64_t codec = multicodec::kDagCbor;
    std::uint64_t hash_code = multicodec::kSha2_256;
    std::vector<std::uint8_t> digest;

    /// Binary form: version, codec, multihash (CIDv0 is the bare multihash)
    [[nodiscard]] std::vector<std::uint8_t> to_bytes() const;

    /// Canonical text: base58btc for CIDv0, lowercase base32 ("b...") for CIDv1
    [[nodiscard]] std::string to_string() const;

    bool operator==(const Cid&) const = default;
};

[[nodiscard]] FormatResult<Cid> parse_cid(std::string_view input);

}  // namespace atlex::identifiers
