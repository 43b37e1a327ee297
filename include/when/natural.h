#pragma once
#include <when/timestamp.h>

#include <string>

namespace when {

/// @brief  Human-friendly rendering of `ts` relative to `now`, both shifted
/// by `offset_hours` from UTC first.
///
/// - same day: "13:37", or "Today, 13:37" if still ahead of `now`
/// - one day apart: "Yesterday, 13:37" / "Tomorrow, 13:37"
/// - within a week: "Mon, 13:37"
/// - same year: "Jan 05, 13:37"
/// - otherwise: "2024-01-05, 13:37"
///
/// Without `include_time` the time part is dropped and a same-day timestamp
/// is "Today".
[[nodiscard]] std::string to_natural_string(Timestamp const &ts,
                                            int offset_hours,
                                            bool include_time, TimePoint now);

[[nodiscard]] std::string to_natural_string(Timestamp const &ts,
                                            int offset_hours = 0,
                                            bool include_time = true);

} // namespace when
