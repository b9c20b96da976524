#pragma once

/**
 * @file identifiers.hpp
 * @brief Validators and canonical forms for protocol identifier strings
 *
 * Every validator is a pure function. On success it returns the parsed value
 * (whose to_string() is the canonical on-wire form) or the canonical string
 * directly; on failure a FormatError naming the violated rule.
 * Canonicalization is deterministic and idempotent.
 */

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace atlex::identifiers {

/**
 * @brief The specific syntax rule an identifier broke
 *
 * Naming convention: kPascalCase for enum constants (Google C++ Style Guide)
 */
enum class FormatErrorKind {
    kEmpty,
    kTooLong,
    kBadCharacter,
    // DID
    kMissingDidPrefix,
    kBadDidMethod,
    kTrailingColon,
    kBadPercentEncoding,
    kBadPlcIdentifier,
    kBadWebHost,
    // Handles and domain labels
    kMissingDot,
    kLabelEmpty,
    kLabelTooLong,
    kLabelHyphen,
    kNumericTld,
    kDisallowedTld,
    // NSID
    kTooFewSegments,
    kBadNameSegment,
    // Record keys and TIDs
    kReservedRecordKey,
    kBadTidLength,
    kBadTidEncoding,
    // CID
    kBadMultibasePrefix,
    kBadMultibaseEncoding,
    kBadVarint,
    kUnsupportedCidVersion,
    kUnsupportedHashFunction,
    kDigestLengthMismatch,
    kTrailingBytes,
    // Language tags
    kBadLanguageSubtag,
    kReservedLanguageLength,
    kBadSubtag,
    kDuplicateSubtag,
    // Datetimes
    kBadDatetimeSyntax,
    kMissingTimezone,
    kUnknownLocalOffset,
    kBadDate,
    kBadTime,
    // URIs
    kBadScheme,
    kBadAuthority,
    kBadPath,
    kUnexpectedQuery,
    kUnexpectedFragment,
    kUnexpectedCredentials,
};

/// Stable name of a kind without the k prefix, e.g. "LabelTooLong"
[[nodiscard]] std::string_view to_string(FormatErrorKind kind) noexcept;

struct FormatError
{
    FormatErrorKind kind;
    std::string message;

    [[nodiscard]] static FormatError make(FormatErrorKind kind, std::string message)
    {
        return FormatError{.kind = kind, .message = std::move(message)};
    }
};

template <typename T>
using FormatResult = std::expected<T, FormatError>;

struct FormatOptions
{
    bool strict_handles = true;
};

// ============================================================================
// DID
// ============================================================================

inline constexpr std::size_t kMaxDidLength = 2048;

struct Did
{
    std::string method;
    std::string identifier;  ///< Method-specific id, still percent-encoded

    [[nodiscard]] std::string to_string() const { return "did:" + method + ":" + identifier; }

    bool operator==(const Did&) const = default;
};

[[nodiscard]] FormatResult<Did> parse_did(std::string_view input);

// ============================================================================
// Handle
// ============================================================================

inline constexpr std::size_t kMaxHandleLength = 253;
inline constexpr std::size_t kMaxLabelLength = 63;

/**
 * Validate a handle and return its lowercase form.
 * @param strict Require a dot and reject reserved top-level domains
 */
[[nodiscard]] FormatResult<std::string> normalize_handle(std::string_view input,
                                                         bool strict = true);

/// A DID when prefixed with "did:", a handle otherwise
[[nodiscard]] FormatResult<std::string> normalize_at_identifier(std::string_view input,
                                                                bool strict = true);

// ============================================================================
// NSID
// ============================================================================

inline constexpr std::size_t kMaxNsidLength = 317;

struct Nsid
{
    std::string authority;  ///< Reverse-domain part, lowercase ("dev.atprose.test")
    std::string name;       ///< Final segment, case preserved ("post")

    [[nodiscard]] std::string to_string() const { return authority + "." + name; }

    bool operator==(const Nsid&) const = default;
};

[[nodiscard]] FormatResult<Nsid> parse_nsid(std::string_view input);

// ============================================================================
// Record key
// ============================================================================

inline constexpr std::size_t kMaxRecordKeyLength = 512;

[[nodiscard]] FormatResult<std::string> validate_record_key(std::string_view input);

// ============================================================================
// Language tag (BCP-47)
// ============================================================================

struct LanguageTag
{
    std::string language;  ///< Primary language subtag plus extlangs, or empty for x-/irregular
    std::string script;
    std::string region;
    std::string canonical;
};

[[nodiscard]] FormatResult<LanguageTag> parse_language_tag(std::string_view input);

// ============================================================================
// Datetime (RFC 3339)
// ============================================================================

[[nodiscard]] FormatResult<std::string> normalize_datetime(std::string_view input);

// ============================================================================
// URIs
// ============================================================================

inline constexpr std::size_t kMaxUriLength = 8192;

struct AtUri
{
    std::string authority;  ///< Canonical DID or handle
    std::optional<Nsid> collection;
    std::optional<std::string> record_key;

    [[nodiscard]] std::string to_string() const;
};

[[nodiscard]] FormatResult<AtUri> parse_at_uri(std::string_view input, bool strict = true);

[[nodiscard]] FormatResult<std::string> validate_uri(std::string_view input);

}  // namespace atlex::identifiers
