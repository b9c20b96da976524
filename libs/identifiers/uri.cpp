/**
 * @file uri.cpp
 * @brief at:// URIs and generic URIs
 */

#include "atlex/identifiers.hpp"

#include "ascii.hpp"

#include <algorithm>

namespace atlex::identifiers {

namespace {

constexpr std::string_view kAtUriScheme = "at://";

[[nodiscard]] FormatResult<void> check_at_uri_delimiters(std::string_view rest)
{
    for (char c : rest) {
        switch (c) {
            case '?':
                return std::unexpected(FormatError::make(FormatErrorKind::kUnexpectedQuery,
                                                         "unexpected ?query in at:// URI"));
            case '#':
                return std::unexpected(FormatError::make(FormatErrorKind::kUnexpectedFragment,
                                                         "unexpected #fragment in at:// URI"));
            case '@':
                return std::unexpected(FormatError::make(
                    FormatErrorKind::kUnexpectedCredentials, "unexpected credentials@ in at:// URI"));
            default:
                break;
        }
    }
    return {};
}

}  // namespace

std::string AtUri::to_string() const
{
    std::string out = std::string(kAtUriScheme) + authority;
    if (collection) {
        out += "/" + collection->to_string();
        if (record_key) {
            out += "/" + *record_key;
        }
    }
    return out;
}

FormatResult<AtUri> parse_at_uri(std::string_view input, bool strict)
{
    if (input.size() > kMaxUriLength) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kTooLong, "URI exceeds " + std::to_string(kMaxUriLength) + " bytes"));
    }
    if (!input.starts_with(kAtUriScheme)) {
        return std::unexpected(
            FormatError::make(FormatErrorKind::kBadScheme, "URI must start with at://"));
    }

    std::string_view rest = input.substr(kAtUriScheme.size());
    if (auto delimiters = check_at_uri_delimiters(rest); !delimiters) {
        return std::unexpected(delimiters.error());
    }
    if (rest.size() > 1 && rest.ends_with('/')) {
        rest.remove_suffix(1);
    }

    const auto parts = ascii::split(rest, '/');
    if (parts.size() > 3) {
        return std::unexpected(
            FormatError::make(FormatErrorKind::kBadPath, "too many path segments in at:// URI"));
    }

    AtUri uri;
    auto authority = normalize_at_identifier(parts[0], strict);
    if (!authority) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kBadAuthority, "invalid at:// authority: " + authority.error().message));
    }
    uri.authority = std::move(*authority);

    if (parts.size() > 1) {
        auto collection = parse_nsid(parts[1]);
        if (!collection) {
            return std::unexpected(FormatError::make(
                FormatErrorKind::kBadPath, "invalid collection: " + collection.error().message));
        }
        uri.collection = std::move(*collection);
    }
    if (parts.size() > 2) {
        auto record_key = validate_record_key(parts[2]);
        if (!record_key) {
            return std::unexpected(FormatError::make(
                FormatErrorKind::kBadPath, "invalid record key: " + record_key.error().message));
        }
        uri.record_key = std::move(*record_key);
    }
    return uri;
}

FormatResult<std::string> validate_uri(std::string_view input)
{
    if (input.empty()) {
        return std::unexpected(FormatError::make(FormatErrorKind::kEmpty, "empty URI"));
    }
    if (input.size() > kMaxUriLength) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kTooLong, "URI exceeds " + std::to_string(kMaxUriLength) + " bytes"));
    }

    const auto colon = input.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return std::unexpected(
            FormatError::make(FormatErrorKind::kBadScheme, "URI has no scheme"));
    }
    std::string_view scheme = input.substr(0, colon);
    const bool scheme_ok = ascii::is_alpha(scheme.front())
                           && std::ranges::all_of(scheme, [](char c) {
                                  return ascii::is_alnum(c) || c == '+' || c == '.' || c == '-';
                              });
    if (!scheme_ok) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kBadScheme, "invalid URI scheme: '" + std::string(scheme) + "'"));
    }
    if (colon + 1 == input.size()) {
        return std::unexpected(FormatError::make(FormatErrorKind::kBadPath, "URI has no body"));
    }
    for (char c : input) {
        const auto byte = static_cast<unsigned char>(c);
        if (byte <= 0x20 || byte == 0x7F) {
            return std::unexpected(FormatError::make(
                FormatErrorKind::kBadCharacter, "URI must not contain whitespace"));
        }
    }
    return std::string(input);
}

}  // namespace atlex::identifiers
