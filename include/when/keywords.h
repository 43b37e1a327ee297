#pragma once
#include <chrono>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace when {

// Foreign token -> canonical English token. Order matters: at a given
// position the first key in this order wins.
using Keyword = std::pair<std::string_view, std::string_view>;

// Weekday name -> ordinal, Monday=0 .. Sunday=6.
struct WeekdayName {
    std::string_view name;
    int ordinal;
};

// Abbreviation -> fixed offset in whole hours. No DST handling.
struct ZoneAbbreviation {
    std::string_view name;
    std::chrono::hours offset;
};

[[nodiscard]] std::span<Keyword const> keyword_table();
[[nodiscard]] std::span<WeekdayName const> weekday_table();
[[nodiscard]] std::span<ZoneAbbreviation const> zone_table();

/// @brief  Trims, transliterates and lower-cases `raw`, then rewrites every
/// whole-word keyword of `keyword_table()` to its canonical token.
///
/// e.g. "Jutro o 15" -> "tomorrow  at  15"
[[nodiscard]] std::string translate(std::string_view raw);

/// @brief  Monday=0 .. Sunday=6.
[[nodiscard]] constexpr int weekday_ordinal(std::chrono::weekday wd) noexcept
{
    return static_cast<int>(wd.iso_encoding()) - 1;
}

} // namespace when
