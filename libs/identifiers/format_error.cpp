/**
 * @file format_error.cpp
 * @brief Names of identifier format errors
 */

#include "atlex/identifiers.hpp"

namespace atlex::identifiers {

std::string_view to_string(FormatErrorKind kind) noexcept
{
    switch (kind) {
        case FormatErrorKind::kEmpty:
            return "Empty";
        case FormatErrorKind::kTooLong:
            return "TooLong";
        case FormatErrorKind::kBadCharacter:
            return "BadCharacter";
        case FormatErrorKind::kMissingDidPrefix:
            return "MissingDidPrefix";
        case FormatErrorKind::kBadDidMethod:
            return "BadDidMethod";
        case FormatErrorKind::kTrailingColon:
            return "TrailingColon";
        case FormatErrorKind::kBadPercentEncoding:
            return "BadPercentEncoding";
        case FormatErrorKind::kBadPlcIdentifier:
            return "BadPlcIdentifier";
        case FormatErrorKind::kBadWebHost:
            return "BadWebHost";
        case FormatErrorKind::kMissingDot:
            return "MissingDot";
        case FormatErrorKind::kLabelEmpty:
            return "LabelEmpty";
        case FormatErrorKind::kLabelTooLong:
            return "LabelTooLong";
        case FormatErrorKind::kLabelHyphen:
            return "LabelHyphen";
        case FormatErrorKind::kNumericTld:
            return "NumericTld";
        case FormatErrorKind::kDisallowedTld:
            return "DisallowedTld";
        case FormatErrorKind::kTooFewSegments:
            return "TooFewSegments";
        case FormatErrorKind::kBadNameSegment:
            return "BadNameSegment";
        case FormatErrorKind::kReservedRecordKey:
            return "ReservedRecordKey";
        case FormatErrorKind::kBadTidLength:
            return "BadTidLength";
        case FormatErrorKind::kBadTidEncoding:
            return "BadTidEncoding";
        case FormatErrorKind::kBadMultibasePrefix:
            return "BadMultibasePrefix";
        case FormatErrorKind::kBadMultibaseEncoding:
            return "BadMultibaseEncoding";
        case FormatErrorKind::kBadVarint:
            return "BadVarint";
        case FormatErrorKind::kUnsupportedCidVersion:
            return "UnsupportedCidVersion";
        case FormatErrorKind::kUnsupportedHashFunction:
            return "UnsupportedHashFunction";
        case FormatErrorKind::kDigestLengthMismatch:
            return "DigestLengthMismatch";
        case FormatErrorKind::kTrailingBytes:
            return "TrailingBytes";
        case FormatErrorKind::kBadLanguageSubtag:
            return "BadLanguageSubtag";
        case FormatErrorKind::kReservedLanguageLength:
            return "ReservedLanguageLength";
        case FormatErrorKind::kBadSubtag:
            return "BadSubtag";
        case FormatErrorKind::kDuplicateSubtag:
            return "DuplicateSubtag";
        case FormatErrorKind::kBadDatetimeSyntax:
            return "BadDatetimeSyntax";
        case FormatErrorKind::kMissingTimezone:
            return "MissingTimezone";
        case FormatErrorKind::kUnknownLocalOffset:
            return "UnknownLocalOffset";
        case FormatErrorKind::kBadDate:
            return "BadDate";
        case FormatErrorKind::kBadTime:
            return "BadTime";
        case FormatErrorKind::kBadScheme:
            return "BadScheme";
        case FormatErrorKind::kBadAuthority:
            return "BadAuthority";
        case FormatErrorKind::kBadPath:
            return "BadPath";
        case FormatErrorKind::kUnexpectedQuery:
            return "UnexpectedQuery";
        case FormatErrorKind::kUnexpectedFragment:
            return "UnexpectedFragment";
        case FormatErrorKind::kUnexpectedCredentials:
            return "UnexpectedCredentials";
    }
    return "Unknown";
}

}  // namespace atlex::identifiers
