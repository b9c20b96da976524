/**
 * @file format_registry.cpp
 * @brief Standard protocol string formats
 */

#include "atlex/format_registry.hpp"

#include "atlex/cid.hpp"
#include "atlex/tid.hpp"

namespace atlex {

namespace {

namespace ids = atlex::identifiers;

using ids::FormatOptions;
using ids::FormatResult;

template <typename Parsed>
[[nodiscard]] FormatResult<std::string> canonical(FormatResult<Parsed> parsed)
{
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    return parsed->to_string();
}

using ValidatorMap = std::map<std::string, FormatValidator, std::less<>>;

[[nodiscard]] ValidatorMap make_standard_validators()
{
    ValidatorMap validators;
    const auto add = [&validators](std::string name, FormatValidator validator) {
        validators.emplace(std::move(name), std::move(validator));
    };

    add("datetime", [](std::string_view v, const FormatOptions&) {
        return ids::normalize_datetime(v);
    });
    add("language", [](std::string_view v, const FormatOptions&) -> FormatResult<std::string> {
        auto tag = ids::parse_language_tag(v);
        if (!tag) {
            return std::unexpected(tag.error());
        }
        return tag->canonical;
    });
    add("did", [](std::string_view v, const FormatOptions&) { return canonical(ids::parse_did(v)); });
    add("handle", [](std::string_view v, const FormatOptions& options) {
        return ids::normalize_handle(v, options.strict_handles);
    });
    add("at-identifier", [](std::string_view v, const FormatOptions& options) {
        return ids::normalize_at_identifier(v, options.strict_handles);
    });
    add("at-uri", [](std::string_view v, const FormatOptions& options) {
        return canonical(ids::parse_at_uri(v, options.strict_handles));
    });
    add("cid", [](std::string_view v, const FormatOptions&) { return canonical(ids::parse_cid(v)); });
    add("nsid", [](std::string_view v, const FormatOptions&) { return canonical(ids::parse_nsid(v)); });
    add("tid", [](std::string_view v, const FormatOptions&) { return canonical(ids::parse_tid(v)); });
    add("record-key", [](std::string_view v, const FormatOptions&) {
        return ids::validate_record_key(v);
    });
    add("uri", [](std::string_view v, const FormatOptions&) { return ids::validate_uri(v); });
    return validators;
}

}  // namespace

const FormatRegistry& FormatRegistry::standard()
{
    static const FormatRegistry kStandard = [] {
        FormatRegistry registry;
        registry.m_validators = make_standard_validators();
        return registry;
    }();
    return kStandard;
}

VoidResult FormatRegistry::add(std::string name, FormatValidator validator)
{
    if (m_validators.contains(name)) {
        return std::unexpected(
            Error::make("DuplicateFormat", "Format already registered: " + name));
    }
    m_validators.emplace(std::move(name), std::move(validator));
    return {};
}

const FormatValidator* FormatRegistry::find(std::string_view name) const
{
    auto it = m_validators.find(name);
    return it == m_validators.end() ? nullptr : &it->second;
}

std::vector<std::string> FormatRegistry::names() const
{
    std::vector<std::string> out;
    out.reserve(m_validators.size());
    for (const auto& [name, validator] : m_validators) {
        out.push_back(name);
    }
    return out;
}

}  // namespace atlex
