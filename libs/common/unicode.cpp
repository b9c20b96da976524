/**
 * @file unicode.cpp
 * @brief Grapheme counting on top of the ICU character break iterator
 */

#include "atlex/unicode.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>

#include <unicode/brkiter.h>
#include <unicode/locid.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>
#include <unicode/utypes.h>

namespace atlex::unicode {

namespace {

/**
 * @brief Shared root-locale character iterator; callers work on clones
 *
 * The prototype is never used to iterate, so concurrent clone() calls are safe.
 */
[[nodiscard]] const icu::BreakIterator* character_prototype()
{
    static const std::unique_ptr<icu::BreakIterator> kPrototype = [] {
        UErrorCode status = U_ZERO_ERROR;
        std::unique_ptr<icu::BreakIterator> iter(
            icu::BreakIterator::createCharacterInstance(icu::Locale::getRoot(), status));
        if (U_FAILURE(status)) {
            iter.reset();
        }
        return iter;
    }();
    return kPrototype.get();
}

[[nodiscard]] bool is_simple_ascii(std::string_view text)
{
    // "\r\n" is a single cluster, so CR disables the fast path
    return std::ranges::all_of(text, [](char c) noexcept {
        const auto byte = static_cast<unsigned char>(c);
        return byte < 0x80 && byte != '\r';
    });
}

}  // namespace

namespace detail {

bool is_valid_utf8(std::string_view text, std::size_t window)
{
    // U8_NEXT indexes with int32_t
    window = std::clamp<std::size_t>(window, 4, std::numeric_limits<std::int32_t>::max());
    const auto* bytes = reinterpret_cast<const std::uint8_t*>(text.data());
    std::size_t base = 0;
    while (base < text.size()) {
        const std::size_t remaining = text.size() - base;
        const bool last = remaining <= window;
        const auto length = static_cast<std::int32_t>(last ? remaining : window);
        // Sequences are at most 4 bytes; none may start within 3 bytes of a window cut
        const std::int32_t stop = last ? length : length - 3;
        const std::uint8_t* chunk = bytes + base;
        std::int32_t offset = 0;
        while (offset < stop) {
            UChar32 c = 0;
            U8_NEXT(chunk, offset, length, c);
            if (c < 0) {
                return false;
            }
        }
        base += static_cast<std::size_t>(offset);
    }
    return true;
}

}  // namespace detail

bool is_valid_utf8(std::string_view text)
{
    return detail::is_valid_utf8(text, std::numeric_limits<std::int32_t>::max());
}

Result<std::size_t> grapheme_count(std::string_view text)
{
    if (is_simple_ascii(text)) {
        return text.size();
    }
    if (!is_valid_utf8(text)) {
        return std::unexpected(Error::make("InvalidUtf8", "Text is not valid UTF-8"));
    }
    if (text.size() > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max())) {
        return std::unexpected(
            Error::make("TextTooLong", "Text exceeds the 2 GiB ICU string limit"));
    }
    const icu::BreakIterator* prototype = character_prototype();
    if (prototype == nullptr) {
        return std::unexpected(
            Error::make("IcuError", "Failed to create ICU character break iterator"));
    }
    std::unique_ptr<icu::BreakIterator> iter(prototype->clone());
    if (!iter) {
        return std::unexpected(Error::make("IcuError", "Failed to clone ICU break iterator"));
    }

    icu::UnicodeString ustr = icu::UnicodeString::fromUTF8(
        icu::StringPiece(text.data(), static_cast<std::int32_t>(text.size())));
    iter->setText(ustr);

    std::size_t count = 0;
    for (std::int32_t pos = iter->next(); pos != icu::BreakIterator::DONE; pos = iter->next()) {
        ++count;
    }
    return count;
}

}  // namespace atlex::unicode
