#pragma once

/**
 * @file violation.hpp
 * @brief Instance-data violations reported by the value validator
 */

#include "atlex/identifiers.hpp"

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace atlex::validation {

enum class ViolationKind {
    kMissingRequiredField,
    kUnexpectedType,
    kStringTooLong,
    kStringTooShort,
    kStringTooManyGraphemes,
    kStringTooFewGraphemes,
    kOutOfRange,
    kFormatMismatch,
    kEnumMismatch,
    kConstMismatch,
    kUnknownUnionTag,
    kArrayLengthOutOfBounds,
    kBytesLengthOutOfBounds,
    kBlobConstraint,
    kUnknownField,
    kUnresolvedReference,
    kNestingTooDeep,
    kInvalidKey,
};

/// Stable name without the k prefix, e.g. "MissingRequiredField"
[[nodiscard]] std::string_view to_string(ViolationKind kind) noexcept;

/// Object property name or array index
using PathSegment = std::variant<std::string, std::size_t>;
using Path = std::vector<PathSegment>;

struct Violation
{
    Path path;
    ViolationKind kind;
    std::string detail;
    std::optional<identifiers::FormatErrorKind> format_error;  ///< Only for kFormatMismatch
};

using Violations = std::vector<Violation>;

/// Normalized value on success, every violation found otherwise
using ValidationOutcome = std::expected<nlohmann::json, Violations>;

/// Path as a JSON array, e.g. ["body","languages",0]
[[nodiscard]] nlohmann::json to_json(const Path& path);
[[nodiscard]] nlohmann::json to_json(const Violation& violation);
[[nodiscard]] nlohmann::json to_json(const Violations& violations);

/// Path in accessor form, e.g. "$.body.languages[0]"
[[nodiscard]] std::string to_string(const Path& path);

/// One line: "<path>: <Kind>: <detail>"
[[nodiscard]] std::string to_string(const Violation& violation);

/// {"valid": true, "value": ...} or {"valid": false, "violations": [...]}
[[nodiscard]] nlohmann::json to_json(const ValidationOutcome& outcome);

}  // namespace atlex::validation
