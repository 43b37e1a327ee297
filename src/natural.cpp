#include <when/natural.h>

#include <fmt/format.h>

#include <array>
#include <string_view>

namespace when {

using namespace std::chrono;
using namespace std::string_view_literals;

namespace {

constexpr auto weekday_abbreviations = std::to_array(
    {"Sun"sv, "Mon"sv, "Tue"sv, "Wed"sv, "Thu"sv, "Fri"sv, "Sat"sv});

constexpr auto month_abbreviations =
    std::to_array({"Jan"sv, "Feb"sv, "Mar"sv, "Apr"sv, "May"sv, "Jun"sv,
                   "Jul"sv, "Aug"sv, "Sep"sv, "Oct"sv, "Nov"sv, "Dec"sv});

std::string clock_time(Timestamp const &t)
{
    return fmt::format("{:02}:{:02}", t.hour, t.minute);
}

} // namespace

std::string to_natural_string(Timestamp const &ts, int offset_hours,
                              bool include_time, TimePoint now)
{
    auto const shift = hours{offset_hours};
    auto const target = Timestamp::from_sys(ts.to_sys(), shift);
    auto const current = Timestamp::from_sys(now, shift);

    auto const target_day = sys_days{target.date()};
    auto const current_day = sys_days{current.date()};
    auto const diff = (target_day - current_day).count();

    auto const with_time = [&](std::string prefix) {
        return include_time ? fmt::format("{}, {}", prefix, clock_time(target))
                            : prefix;
    };

    if (diff == 0) {
        if (!include_time) {
            return "Today";
        }
        return ts.to_sys() > now ? fmt::format("Today, {}", clock_time(target))
                                 : clock_time(target);
    }
    if (diff == -1) {
        return with_time("Yesterday");
    }
    if (diff == 1) {
        return with_time("Tomorrow");
    }
    if (diff >= -7 && diff <= 7) {
        return with_time(std::string{
            weekday_abbreviations[target.weekday().c_encoding()]});
    }
    if (target.year == current.year) {
        return with_time(fmt::format(
            "{} {:02}", month_abbreviations[target.month - 1], target.day));
    }
    return with_time(fmt::format("{:04}-{:02}-{:02}", target.year,
                                 target.month, target.day));
}

std::string to_natural_string(Timestamp const &ts, int offset_hours,
                              bool include_time)
{
    return to_natural_string(ts, offset_hours, include_time,
                             floor<seconds>(SystemClock::now()));
}

} // namespace when
