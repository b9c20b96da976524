/**
 * @file handle.cpp
 * @brief Handles (DNS hostnames) and at-identifiers
 */

#include "atlex/identifiers.hpp"

#include "ascii.hpp"

#include <algorithm>
#include <array>

namespace atlex::identifiers {

namespace {

// Top-level domains that can never resolve to a public handle
constexpr std::array<std::string_view, 8> kDisallowedTlds = {
    "alt", "arpa", "example", "internal", "invalid", "local", "localhost", "onion"};

[[nodiscard]] FormatResult<void> check_label(std::string_view label)
{
    if (label.empty()) {
        return std::unexpected(
            FormatError::make(FormatErrorKind::kLabelEmpty, "empty handle label"));
    }
    if (label.size() > kMaxLabelLength) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kLabelTooLong,
            "handle label exceeds " + std::to_string(kMaxLabelLength) + " characters"));
    }
    for (char c : label) {
        if (!ascii::is_alnum(c) && c != '-') {
            return std::unexpected(FormatError::make(
                FormatErrorKind::kBadCharacter,
                "invalid character in handle label '" + std::string(label) + "'"));
        }
    }
    if (label.front() == '-' || label.back() == '-') {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kLabelHyphen,
            "handle label starts or ends with '-': '" + std::string(label) + "'"));
    }
    return {};
}

}  // namespace

FormatResult<std::string> normalize_handle(std::string_view input, bool strict)
{
    if (input.empty()) {
        return std::unexpected(FormatError::make(FormatErrorKind::kEmpty, "empty handle"));
    }
    if (input.size() > kMaxHandleLength) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kTooLong,
            "handle exceeds " + std::to_string(kMaxHandleLength) + " characters"));
    }

    const auto labels = ascii::split(input, '.');
    if (strict && labels.size() < 2) {
        return std::unexpected(FormatError::make(FormatErrorKind::kMissingDot,
                                                 "handle must contain at least one '.'"));
    }
    for (std::string_view label : labels) {
        if (auto checked = check_label(label); !checked) {
            return std::unexpected(checked.error());
        }
    }

    const std::string_view tld = labels.back();
    if (ascii::is_digit(tld.front())) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kNumericTld,
            "top-level label must not start with a digit: '" + std::string(tld) + "'"));
    }
    const std::string lowered_tld = ascii::lower(tld);
    if (strict && std::ranges::find(kDisallowedTlds, std::string_view(lowered_tld))
                      != kDisallowedTlds.end()) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kDisallowedTld,
            "top-level domain is not allowed in handles: '" + std::string(tld) + "'"));
    }

    return ascii::lower(input);
}

FormatResult<std::string> normalize_at_identifier(std::string_view input, bool strict)
{
    if (input.starts_with("did:")) {
        auto did = parse_did(input);
        if (!did) {
            return std::unexpected(did.error());
        }
        return did->to_string();
    }
    return normalize_handle(input, strict);
}

}  // namespace atlex::identifiers
