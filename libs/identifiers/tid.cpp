/**
 * @file tid.cpp
 * @brief TID parsing, formatting and generation
 */

#include "atlex/tid.hpp"

#include "atlex/encoding.hpp"

#include <chrono>

namespace atlex::identifiers {

std::string Tid::to_string() const
{
    return encoding::encode_sortable_u64(m_value);
}

FormatResult<Tid> parse_tid(std::string_view input)
{
    if (input.size() != kTidLength) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kBadTidLength,
            "TID must be " + std::to_string(kTidLength) + " characters, got "
                + std::to_string(input.size())));
    }
    auto value = encoding::decode_sortable_u64(input);
    if (!value) {
        return std::unexpected(FormatError::make(
            FormatErrorKind::kBadTidEncoding,
            "TID is not sortable base32 with a clear top bit: '" + std::string(input) + "'"));
    }
    return Tid(*value);
}

TidGenerator::TidGenerator(std::uint16_t clock_id) noexcept
    : m_clock_id(static_cast<std::uint16_t>(clock_id & Tid::kClockIdMask))
{}

Tid TidGenerator::next()
{
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    auto timestamp = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(now).count());

    std::scoped_lock lock(m_mutex);
    if (timestamp <= m_last_timestamp) {
        timestamp = m_last_timestamp + 1;
    }
    m_last_timestamp = timestamp;
    return Tid::make(timestamp, m_clock_id);
}

}  // namespace atlex::identifiers
