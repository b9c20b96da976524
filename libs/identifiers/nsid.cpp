/**
 * @file nsid.cpp
 * @brief Namespaced identifiers and record keys
 */

#include "atlex/identifiers.hpp"

#include "ascii.hpp"

#include <algorithm>

namespace atlex::identifiers {

namespace {

constexpr std::size_t kMinNsidSegments = 3;
constexpr std::size_t kMaxAuthorityLength = 253;

[[nodiscard]] FormatResult<void> check_authority_segment(std::string_view segment, bool first)
{
    if (segment.empty()) {
        return std::unexpected(
            FormatError::make(FormatErrorKind::kLabelEmpty, "empty NSID segment"));
    }
    if (segment.size() > kMaxLabelLength) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kLabelTooLong,
            "NSID segment exceeds " + std::to_string(kMaxLabelLength) + " characters"));
    }
    if (!std::ranges::all_of(segment, [](char c) { return ascii::is_alnum(c) || c == '-'; })) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kBadCharacter,
            "invalid character in NSID segment '" + std::string(segment) + "'"));
    }
    if (segment.front() == '-' || segment.back() == '-') {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kLabelHyphen,
            "NSID segment starts or ends with '-': '" + std::string(segment) + "'"));
    }
    // The first segment is the top-level domain
    if (first && ascii::is_digit(segment.front())) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kNumericTld,
            "NSID must not start with a digit: '" + std::string(segment) + "'"));
    }
    return {};
}

[[nodiscard]] FormatResult<void> check_name_segment(std::string_view name)
{
    if (name.empty() || name.size() > kMaxLabelLength || !ascii::is_alpha(name.front())
        || !ascii::all_of(name, ascii::is_alnum)) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kBadNameSegment,
            "NSID name must match [a-zA-Z][a-zA-Z0-9]{0,62}: '" + std::string(name) + "'"));
    }
    return {};
}

}  // namespace

FormatResult<Nsid> parse_nsid(std::string_view input)
{
    if (input.empty()) {
        return std::unexpected(FormatError::make(FormatErrorKind::kEmpty, "empty NSID"));
    }
    if (input.size() > kMaxNsidLength) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kTooLong, "NSID exceeds " + std::to_string(kMaxNsidLength) + " bytes"));
    }

    const auto segments = ascii::split(input, '.');
    if (segments.size() < kMinNsidSegments) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kTooFewSegments,
            "NSID needs at least " + std::to_string(kMinNsidSegments) + " segments: '"
                + std::string(input) + "'"));
    }
    for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
        if (auto checked = check_authority_segment(segments[i], i == 0); !checked) {
            return std::unexpected(checked.error());
        }
    }
    if (auto name = check_name_segment(segments.back()); !name) {
        return std::unexpected(name.error());
    }

    const std::string_view authority = input.substr(0, input.size() - segments.back().size() - 1);
    if (authority.size() > kMaxAuthorityLength) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kTooLong,
            "NSID authority exceeds " + std::to_string(kMaxAuthorityLength) + " bytes"));
    }
    return Nsid{.authority = ascii::lower(authority), .name = std::string(segments.back())};
}

FormatResult<std::string> validate_record_key(std::string_view input)
{
    if (input.empty()) {
        return std::unexpected(FormatError::make(FormatErrorKind::kEmpty, "empty record key"));
    }
    if (input.size() > kMaxRecordKeyLength) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kTooLong,
            "record key exceeds " + std::to_string(kMaxRecordKeyLength) + " bytes"));
    }
    if (input == "." || input == "..") {
        return std::unexpected(FormatError::make(FormatErrorKind::kReservedRecordKey,
                                                 "record key must not be '.' or '..'"));
    }
    for (char c : input) {
        const auto byte = static_cast<unsigned char>(c);
        if (c == '/' || byte <= 0x20 || byte == 0x7F) {
            return std::unexpected(FormatError::make(
                FormatErrorKind::kBadCharacter,
                "record key must not contain '/', whitespace or control characters"));
        }
    }
    return std::string(input);
}

}  // namespace atlex::identifiers
