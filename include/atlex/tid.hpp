#pragma once

/**
 * @file tid.hpp
 * @brief Timestamp identifiers (TIDs) and a monotonic generator
 */

#include "atlex/identifiers.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>

namespace atlex::identifiers {

inline constexpr std::size_t kTidLength = 13;

/**
 * @brief 64-bit value: 53-bit microsecond timestamp, then a 10-bit clock id
 *
 * The top bit is always clear. String form is 13 sortable base32 characters,
 * so lexicographic order matches numeric order.
 */
class Tid
{
public:
    static constexpr std::uint64_t kTimestampMask = 0x1F'FFFF'FFFF'FFFFULL;
    static constexpr std::uint64_t kClockIdMask = 0x3FFULL;

    constexpr explicit Tid(std::uint64_t value) noexcept
        : m_value(value & 0x7FFF'FFFF'FFFF'FFFFULL)
    {}

    [[nodiscard]] static constexpr Tid make(std::uint64_t timestamp_us,
                                            std::uint16_t clock_id) noexcept
    {
        return Tid(((timestamp_us & kTimestampMask) << 10) | (clock_id & kClockIdMask));
    }

    [[nodiscard]] constexpr std::uint64_t value() const noexcept { return m_value; }
    [[nodiscard]] constexpr std::uint64_t timestamp() const noexcept
    {
        return (m_value >> 10) & kTimestampMask;
    }
    [[nodiscard]] constexpr std::uint16_t clock_id() const noexcept
    {
        return static_cast<std::uint16_t>(m_value & kClockIdMask);
    }

    [[nodiscard]] std::string to_string() const;

    constexpr auto operator<=>(const Tid&) const noexcept = default;

private:
    std::uint64_t m_value;
};

[[nodiscard]] FormatResult<Tid> parse_tid(std::string_view input);

/**
 * @brief Produces strictly increasing TIDs for one instance
 *
 * Uses the system clock in microseconds; when the clock has not advanced past
 * the previous TID, the previous timestamp is bumped by one. Safe to share
 * between threads.
 */
class TidGenerator
{
public:
    explicit TidGenerator(std::uint16_t clock_id = 0) noexcept;

    [[nodiscard]] Tid next();

private:
    std::mutex m_mutex;
    std::uint16_t m_clock_id;
    std::uint64_t m_last_timestamp = 0;
};

}  // namespace atlex::identifiers
