#pragma once

/**
 * @file unicode.hpp
 * @brief UTF-8 checks and grapheme counting (ICU)
 */

#include "atlex/common.hpp"

#include <cstddef>
#include <string_view>

namespace atlex::unicode {

[[nodiscard]] bool is_valid_utf8(std::string_view text);

namespace detail {
/// is_valid_utf8 scanning at most @p window bytes per ICU call (clamped to [4, INT32_MAX])
[[nodiscard]] bool is_valid_utf8(std::string_view text, std::size_t window);
}  // namespace detail

/**
 * Count user-perceived characters (extended grapheme clusters, UAX #29).
 * @param text UTF-8 text
 * @return Number of grapheme clusters, or InvalidUtf8 / TextTooLong / IcuError
 */
[[nodiscard]] Result<std::size_t> grapheme_count(std::string_view text);

}  // namespace atlex::unicode
