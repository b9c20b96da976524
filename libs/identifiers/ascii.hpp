#pragma once

/**
 * @file ascii.hpp
 * @brief Locale-independent ASCII helpers shared by the identifier validators
 */

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace atlex::identifiers::ascii {

[[nodiscard]] constexpr bool is_alpha(char c) noexcept
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

[[nodiscard]] constexpr bool is_digit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

[[nodiscard]] constexpr bool is_alnum(char c) noexcept
{
    return is_alpha(c) || is_digit(c);
}

[[nodiscard]] constexpr char to_lower(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

[[nodiscard]] constexpr char to_upper(char c) noexcept
{
    return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
}

[[nodiscard]] inline std::string lower(std::string_view input)
{
    std::string out(input);
    std::ranges::transform(out, out.begin(), to_lower);
    return out;
}

[[nodiscard]] inline std::string upper(std::string_view input)
{
    std::string out(input);
    std::ranges::transform(out, out.begin(), to_upper);
    return out;
}

[[nodiscard]] inline bool all_of(std::string_view input, bool (*pred)(char) noexcept)
{
    return std::ranges::all_of(input, pred);
}

/// Split on a separator, keeping empty parts
[[nodiscard]] inline std::vector<std::string_view> split(std::string_view input, char separator)
{
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        std::size_t pos = input.find(separator, start);
        if (pos == std::string_view::npos) {
            parts.push_back(input.substr(start));
            return parts;
        }
        parts.push_back(input.substr(start, pos - start));
        start = pos + 1;
    }
}

}  // namespace atlex::identifiers::ascii
