#pragma once

namespace when {

struct CalendarDate {
    int year;
    int month;
    int day;

    bool operator==(CalendarDate const &) const = default;
};

[[nodiscard]] bool is_leap_year(int year) noexcept;

/// @param month  Must be in [1, 12].
[[nodiscard]] int days_in_month(int year, int month);

/// @brief  Brings `day` into the range of its month by carrying whole months
/// forward (day 32 of January is February 1st) or backward (day 0 of March
/// is the last day of February). Years roll over as needed.
///
/// Throws ParseError if `month` is not in [1, 12].
[[nodiscard]] CalendarDate normalize(int year, int month, int day);

} // namespace when
