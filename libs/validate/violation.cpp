/**
 * @file violation.cpp
 * @brief Violation names and JSON/text rendering
 */

#include "atlex/violation.hpp"

namespace atlex::validation {

std::string_view to_string(ViolationKind kind) noexcept
{
    switch (kind) {
        case ViolationKind::kMissingRequiredField:
            return "MissingRequiredField";
        case ViolationKind::kUnexpectedType:
            return "UnexpectedType";
        case ViolationKind::kStringTooLong:
            return "StringTooLong";
        case ViolationKind::kStringTooShort:
            return "StringTooShort";
        case ViolationKind::kStringTooManyGraphemes:
            return "StringTooManyGraphemes";
        case ViolationKind::kStringTooFewGraphemes:
            return "StringTooFewGraphemes";
        case ViolationKind::kOutOfRange:
            return "OutOfRange";
        case ViolationKind::kFormatMismatch:
            return "FormatMismatch";
        case ViolationKind::kEnumMismatch:
            return "EnumMismatch";
        case ViolationKind::kConstMismatch:
            return "ConstMismatch";
        case ViolationKind::kUnknownUnionTag:
            return "UnknownUnionTag";
        case ViolationKind::kArrayLengthOutOfBounds:
            return "ArrayLengthOutOfBounds";
        case ViolationKind::kBytesLengthOutOfBounds:
            return "BytesLengthOutOfBounds";
        case ViolationKind::kBlobConstraint:
            return "BlobConstraint";
        case ViolationKind::kUnknownField:
            return "UnknownField";
        case ViolationKind::kUnresolvedReference:
            return "UnresolvedReference";
        case ViolationKind::kNestingTooDeep:
            return "NestingTooDeep";
        case ViolationKind::kInvalidKey:
            return "InvalidKey";
    }
    return "Unknown";
}

nlohmann::json to_json(const Path& path)
{
    nlohmann::json out = nlohmann::json::array();
    for (const auto& segment : path) {
        std::visit([&out](const auto& value) { out.push_back(value); }, segment);
    }
    return out;
}

nlohmann::json to_json(const Violation& violation)
{
    nlohmann::json out = {
        {  "path",                 to_json(violation.path)},
        {  "kind", std::string(to_string(violation.kind))},
        {"detail",                        violation.detail}
    };
    if (violation.format_error) {
        out["format_error"] = std::string(identifiers::to_string(*violation.format_error));
    }
    return out;
}

nlohmann::json to_json(const Violations& violations)
{
    nlohmann::json out = nlohmann::json::array();
    for (const auto& violation : violations) {
        out.push_back(to_json(violation));
    }
    return out;
}

std::string to_string(const Path& path)
{
    std::string out = "$";
    for (const auto& segment : path) {
        if (const auto* name = std::get_if<std::string>(&segment)) {
            out += "." + *name;
        } else {
            out += "[" + std::to_string(std::get<std::size_t>(segment)) + "]";
        }
    }
    return out;
}

std::string to_string(const Violation& violation)
{
    return to_string(violation.path) + ": " + std::string(to_string(violation.kind)) + ": "
           + violation.detail;
}

nlohmann::json to_json(const ValidationOutcome& outcome)
{
    if (outcome) {
        return {
            {"valid",   true},
            {"value", *outcome}
        };
    }
    return {
        {     "valid",                 false},
        {"violations", to_json(outcome.error())}
    };
}

}  // namespace atlex::validation
