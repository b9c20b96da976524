/**
 * @file datetime.cpp
 * @brief RFC 3339 datetime validation
 */

#include "atlex/identifiers.hpp"

#include "ascii.hpp"

namespace atlex::identifiers {

namespace {

// YYYY-MM-DDTHH:MM:SS
constexpr std::size_t kDateTimeLength = 19;

[[nodiscard]] bool digits_at(std::string_view s, std::size_t pos, std::size_t count, int& out)
{
    if (pos + count > s.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
        if (!ascii::is_digit(s[i])) {
            return false;
        }
        value = value * 10 + (s[i] - '0');
    }
    out = value;
    return true;
}

[[nodiscard]] constexpr bool is_leap_year(int year) noexcept
{
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

[[nodiscard]] constexpr int days_in_month(int year, int month) noexcept
{
    constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return kDays[month - 1];
}

[[nodiscard]] FormatError syntax_error(std::string_view input)
{
    return FormatError::make(FormatErrorKind::kBadDatetimeSyntax,
                             "not an RFC 3339 datetime: '" + std::string(input) + "'");
}

}  // namespace

FormatResult<std::string> normalize_datetime(std::string_view input)
{
    if (input.empty()) {
        return std::unexpected(FormatError::make(FormatErrorKind::kEmpty, "empty datetime"));
    }
    if (input.size() < kDateTimeLength) {
        return std::unexpected(syntax_error(input));
    }

    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    const bool shape_ok = digits_at(input, 0, 4, year) && input[4] == '-'
                          && digits_at(input, 5, 2, month) && input[7] == '-'
                          && digits_at(input, 8, 2, day)
                          && (input[10] == 'T' || input[10] == 't')
                          && digits_at(input, 11, 2, hour) && input[13] == ':'
                          && digits_at(input, 14, 2, minute) && input[16] == ':'
                          && digits_at(input, 17, 2, second);
    if (!shape_ok) {
        return std::unexpected(syntax_error(input));
    }

    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kBadDate, "invalid calendar date in '" + std::string(input) + "'"));
    }
    if (hour > 23 || minute > 59 || second > 60) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kBadTime, "invalid time of day in '" + std::string(input) + "'"));
    }

    std::size_t pos = kDateTimeLength;
    if (pos < input.size() && input[pos] == '.') {
        const std::size_t fraction_start = ++pos;
        while (pos < input.size() && ascii::is_digit(input[pos])) {
            ++pos;
        }
        if (pos == fraction_start) {
            return std::unexpected(syntax_error(input));
        }
    }

    if (pos == input.size()) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kMissingTimezone,
            "datetime has no timezone offset: '" + std::string(input) + "'"));
    }

    std::string out(input);
    out[10] = 'T';
    const char zone = input[pos];
    if (zone == 'Z' || zone == 'z') {
        if (pos + 1 != input.size()) {
            return std::unexpected(syntax_error(input));
        }
        out[pos] = 'Z';
        return out;
    }
    if (zone != '+' && zone != '-') {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kMissingTimezone,
            "datetime has no timezone offset: '" + std::string(input) + "'"));
    }

    int offset_hour = 0;
    int offset_minute = 0;
    if (input.size() != pos + 6 || !digits_at(input, pos + 1, 2, offset_hour)
        || input[pos + 3] != ':' || !digits_at(input, pos + 4, 2, offset_minute)) {
        return std::unexpected(syntax_error(input));
    }
    if (offset_hour > 23 || offset_minute > 59) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kBadTime, "invalid timezone offset in '" + std::string(input) + "'"));
    }
    if (zone == '-' && offset_hour == 0 && offset_minute == 0) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kUnknownLocalOffset,
            "-00:00 (unknown local offset) is not allowed: '" + std::string(input) + "'"));
    }
    return out;
}

}  // namespace atlex::identifiers
