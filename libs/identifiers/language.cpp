/**
 * @file language.cpp
 * @brief BCP-47 language tag validation and canonical casing
 */

#include "atlex/identifiers.hpp"

#include "ascii.hpp"

#include <algorithm>
#include <array>
#include <vector>

namespace atlex::identifiers {

namespace {

// Irregular grandfathered tags do not match the langtag production.
// Regular grandfathered tags (art-lojban, zh-min-nan, ...) parse as langtags.
constexpr std::array<std::string_view, 17> kIrregularTags = {
    "en-GB-oed", "i-ami",     "i-bnn",     "i-default", "i-enochian", "i-hak",
    "i-klingon", "i-lux",     "i-mingo",   "i-navajo",  "i-pwn",      "i-tao",
    "i-tay",     "i-tsu",     "sgn-BE-FR", "sgn-BE-NL", "sgn-CH-DE",
};

[[nodiscard]] bool equals_ignore_case(std::string_view a, std::string_view b)
{
    return a.size() == b.size() && ascii::lower(a) == ascii::lower(b);
}

[[nodiscard]] bool is_alpha_n(std::string_view s, std::size_t min, std::size_t max)
{
    return s.size() >= min && s.size() <= max && ascii::all_of(s, ascii::is_alpha);
}

[[nodiscard]] bool is_alnum_n(std::string_view s, std::size_t min, std::size_t max)
{
    return s.size() >= min && s.size() <= max && ascii::all_of(s, ascii::is_alnum);
}

[[nodiscard]] bool is_script(std::string_view s)
{
    return is_alpha_n(s, 4, 4);
}

[[nodiscard]] bool is_region(std::string_view s)
{
    return is_alpha_n(s, 2, 2) || (s.size() == 3 && ascii::all_of(s, ascii::is_digit));
}

[[nodiscard]] bool is_variant(std::string_view s)
{
    return is_alnum_n(s, 5, 8) || (s.size() == 4 && ascii::is_digit(s.front()) && is_alnum_n(s, 4, 4));
}

[[nodiscard]] bool is_singleton(std::string_view s)
{
    return s.size() == 1 && ascii::is_alnum(s.front()) && ascii::to_lower(s.front()) != 'x';
}

[[nodiscard]] FormatError bad_subtag(std::string_view subtag, std::string_view input)
{
    return FormatError::make(FormatErrorKind::kBadSubtag,
                             "unexpected subtag '" + std::string(subtag) + "' in language tag '"
                                 + std::string(input) + "'");
}

/// Parse "x-..." private use starting at parts[index]; parts[index] is the 'x'
[[nodiscard]] FormatResult<std::size_t> parse_private_use(const std::vector<std::string_view>& parts,
                                                          std::size_t index,
                                                          std::string_view input)
{
    std::size_t i = index + 1;
    if (i == parts.size()) {
        return std::unexpected(bad_subtag(parts[index], input));
    }
    for (; i < parts.size(); ++i) {
        if (!is_alnum_n(parts[i], 1, 8)) {
            return std::unexpected(bad_subtag(parts[i], input));
        }
    }
    return i;
}

}  // namespace

FormatResult<LanguageTag> parse_language_tag(std::string_view input)
{
    if (input.empty()) {
        return std::unexpected(FormatError::make(FormatErrorKind::kEmpty, "empty language tag"));
    }

    for (std::string_view irregular : kIrregularTags) {
        if (equals_ignore_case(input, irregular)) {
            return LanguageTag{.canonical = std::string(irregular)};
        }
    }

    const auto parts = ascii::split(input, '-');
    if (std::ranges::any_of(parts, [](std::string_view p) { return p.empty(); })) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kBadSubtag, "empty subtag in language tag '" + std::string(input) + "'"));
    }

    LanguageTag tag;
    std::vector<std::string> canonical_parts;
    std::size_t i = 0;

    if (equals_ignore_case(parts[0], "x")) {
        auto end = parse_private_use(parts, 0, input);
        if (!end) {
            return std::unexpected(end.error());
        }
        tag.canonical = ascii::lower(input);
        return tag;
    }

    // Primary language
    const std::string_view primary = parts[0];
    if (is_alpha_n(primary, 4, 8)) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kReservedLanguageLength,
            "primary language subtag of 4-8 letters is not assignable: '" + std::string(primary)
                + "'"));
    }
    if (!is_alpha_n(primary, 2, 3)) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kBadLanguageSubtag,
            "primary language subtag must be 2-3 letters: '" + std::string(primary) + "'"));
    }
    tag.language = ascii::lower(primary);
    canonical_parts.push_back(tag.language);
    ++i;

    // Up to three extended language subtags
    for (int extlangs = 0; extlangs < 3 && i < parts.size() && is_alpha_n(parts[i], 3, 3);
         ++extlangs, ++i) {
        std::string extlang = ascii::lower(parts[i]);
        tag.language += "-" + extlang;
        canonical_parts.push_back(std::move(extlang));
    }

    if (i < parts.size() && is_script(parts[i])) {
        tag.script = ascii::lower(parts[i]);
        tag.script.front() = ascii::to_upper(tag.script.front());
        canonical_parts.push_back(tag.script);
        ++i;
    }

    if (i < parts.size() && is_region(parts[i])) {
        tag.region = ascii::upper(parts[i]);
        canonical_parts.push_back(tag.region);
        ++i;
    }

    std::vector<std::string> seen_variants;
    for (; i < parts.size() && is_variant(parts[i]); ++i) {
        std::string variant = ascii::lower(parts[i]);
        if (std::ranges::find(seen_variants, variant) != seen_variants.end()) {
            return std::unexpected(FormatError::make(
                FormatErrorKind::kDuplicateSubtag, "duplicate variant '" + variant + "'"));
        }
        seen_variants.push_back(variant);
        canonical_parts.push_back(std::move(variant));
    }

    std::vector<char> seen_singletons;
    while (i < parts.size() && is_singleton(parts[i])) {
        const char singleton = ascii::to_lower(parts[i].front());
        if (std::ranges::find(seen_singletons, singleton) != seen_singletons.end()) {
            return std::unexpected(FormatError::make(
                FormatErrorKind::kDuplicateSubtag,
                "duplicate extension singleton '" + std::string(1, singleton) + "'"));
        }
        seen_singletons.push_back(singleton);
        canonical_parts.emplace_back(1, singleton);
        ++i;

        std::size_t extension_subtags = 0;
        for (; i < parts.size() && is_alnum_n(parts[i], 2, 8);
             ++i, ++extension_subtags) {
            canonical_parts.push_back(ascii::lower(parts[i]));
        }
        if (extension_subtags == 0) {
            return std::unexpected(bad_subtag(std::string(1, singleton), input));
        }
    }

    if (i < parts.size() && equals_ignore_case(parts[i], "x")) {
        auto end = parse_private_use(parts, i, input);
        if (!end) {
            return std::unexpected(end.error());
        }
        for (; i < *end; ++i) {
            canonical_parts.push_back(ascii::lower(parts[i]));
        }
    }

    if (i < parts.size()) {
        return std::unexpected(bad_subtag(parts[i], input));
    }

    for (const auto& part : canonical_parts) {
        if (!tag.canonical.empty()) {
            tag.canonical += '-';
        }
        tag.canonical += part;
    }
    return tag;
}

}  // namespace atlex::identifiers
