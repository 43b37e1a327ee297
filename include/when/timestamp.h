#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace when {

using SystemClock = std::chrono::system_clock;
using TimePoint = std::chrono::sys_seconds;

// Absolute timestamp: wall-clock fields as seen at `offset` from UTC.
struct Timestamp {
    int year{};
    int month{};
    int day{};
    int hour{};
    int minute{};
    int second{};
    std::chrono::minutes offset{};

    /// @brief  Instant in UTC.
    [[nodiscard]] TimePoint to_sys() const;

    /// @brief  Same instant, with fields expressed at `offset`.
    static Timestamp from_sys(TimePoint tp,
                              std::chrono::minutes offset = {});

    /// @brief  e.g. 2025-01-31T14:30:00+02:00
    [[nodiscard]] std::string to_iso() const;

    [[nodiscard]] std::chrono::year_month_day date() const;
    [[nodiscard]] std::chrono::weekday weekday() const;

    bool operator==(Timestamp const &) const = default;
};

// Parses a complete offset-aware ISO 8601 / RFC 3339 timestamp, e.g.
// "2025-01-31T14:30:00Z" or "2025-01-31 14:30+02:00". The whole string must
// match. Case-insensitive.
std::optional<Timestamp> parse_iso(std::string_view str);

} // namespace when
