/**
 * @file did.cpp
 * @brief Decentralized identifier syntax (did:<method>:<id>)
 */

#include "atlex/encoding.hpp"
#include "atlex/identifiers.hpp"

#include "ascii.hpp"

#include <algorithm>

namespace atlex::identifiers {

namespace {

constexpr std::string_view kDidPrefix = "did:";

// did:plc ids are 15 bytes of lowercase base32
constexpr std::size_t kPlcIdLength = 24;
constexpr std::size_t kPlcIdBytes = 15;

[[nodiscard]] constexpr bool is_method_char(char c) noexcept
{
    return (c >= 'a' && c <= 'z') || ascii::is_digit(c);
}

[[nodiscard]] constexpr bool is_id_char(char c) noexcept
{
    return ascii::is_alnum(c) || c == '.' || c == '_' || c == ':' || c == '%' || c == '-';
}

[[nodiscard]] FormatResult<void> check_plc_id(std::string_view id)
{
    if (id.size() != kPlcIdLength) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kBadPlcIdentifier,
            "did:plc identifier must be " + std::to_string(kPlcIdLength) + " characters"));
    }
    auto decoded = encoding::decode_base32(id);
    if (!decoded || decoded->size() != kPlcIdBytes) {
        return std::unexpected(FormatError::make(FormatErrorKind::kBadPlcIdentifier,
                                                 "did:plc identifier is not lowercase base32"));
    }
    return {};
}

[[nodiscard]] FormatResult<void> check_web_host(std::string_view decoded)
{
    std::string_view host = decoded;
    if (auto colon = decoded.find(':'); colon != std::string_view::npos) {
        host = decoded.substr(0, colon);
        std::string_view port = decoded.substr(colon + 1);
        if (port.empty() || !ascii::all_of(port, ascii::is_digit)) {
            return std::unexpected(FormatError::make(
                FormatErrorKind::kBadWebHost, "did:web port must be numeric: '" +
                                                  std::string(decoded) + "'"));
        }
    }
    if (auto handle = normalize_handle(host, false); !handle) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kBadWebHost, "did:web host is invalid: " + handle.error().message));
    }
    return {};
}

}  // namespace

FormatResult<Did> parse_did(std::string_view input)
{
    if (input.empty()) {
        return std::unexpected(FormatError::make(FormatErrorKind::kEmpty, "empty DID"));
    }
    if (input.size() > kMaxDidLength) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kTooLong,
            "DID exceeds " + std::to_string(kMaxDidLength) + " bytes"));
    }
    if (!input.starts_with(kDidPrefix)) {
        return std::unexpected(
            FormatError::make(FormatErrorKind::kMissingDidPrefix, "missing did: prefix"));
    }
    if (input.back() == ':') {
        return std::unexpected(
            FormatError::make(FormatErrorKind::kTrailingColon, "DID must not end with ':'"));
    }

    std::string_view rest = input.substr(kDidPrefix.size());
    const auto colon = rest.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return std::unexpected(
            FormatError::make(FormatErrorKind::kBadDidMethod, "missing DID method"));
    }
    std::string_view method = rest.substr(0, colon);
    if (!std::ranges::all_of(method, is_method_char)) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kBadDidMethod,
            "DID method must be lowercase letters and digits: '" + std::string(method) + "'"));
    }

    std::string_view id = rest.substr(colon + 1);
    if (auto bad = std::ranges::find_if_not(id, is_id_char); bad != id.end()) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kBadCharacter,
            "invalid character in DID identifier: '" + std::string(1, *bad) + "'"));
    }
    auto decoded = encoding::percent_decode(id);
    if (!decoded) {
        return std::unexpected(FormatError::make(FormatErrorKind::kBadPercentEncoding,
                                                 "invalid percent-encoding in DID identifier"));
    }

    if (method == "plc") {
        if (auto plc = check_plc_id(id); !plc) {
            return std::unexpected(plc.error());
        }
    } else if (method == "web") {
        if (auto web = check_web_host(*decoded); !web) {
            return std::unexpected(web.error());
        }
    }

    return Did{.method = std::string(method), .identifier = std::string(id)};
}

}  // namespace atlex::identifiers
