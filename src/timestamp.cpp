#include <when/timestamp.h>

#include <boost/regex.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>

namespace when {

using namespace std::chrono;

TimePoint Timestamp::to_sys() const
{
    auto const local = sys_days{date()} + hours{hour} + minutes{minute} +
                       seconds{second};
    return local - offset;
}

Timestamp Timestamp::from_sys(TimePoint tp, minutes offset)
{
    auto const local = tp + offset;
    auto const days_part = floor<days>(local);
    auto const ymd = year_month_day{days_part};
    auto const hms = hh_mm_ss{local - days_part};
    return Timestamp{.year = static_cast<int>(ymd.year()),
                     .month = static_cast<int>(unsigned{ymd.month()}),
                     .day = static_cast<int>(unsigned{ymd.day()}),
                     .hour = static_cast<int>(hms.hours().count()),
                     .minute = static_cast<int>(hms.minutes().count()),
                     .second = static_cast<int>(hms.seconds().count()),
                     .offset = offset};
}

std::string Timestamp::to_iso() const
{
    auto const sign = offset < minutes::zero() ? '-' : '+';
    auto const abs_offset = abs(offset);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}{}{:02}:{:02}",
                       year, month, day, hour, minute, second, sign,
                       abs_offset.count() / 60, abs_offset.count() % 60);
}

year_month_day Timestamp::date() const
{
    return std::chrono::year{year} /
           std::chrono::month{static_cast<unsigned>(month)} /
           std::chrono::day{static_cast<unsigned>(day)};
}

weekday Timestamp::weekday() const
{
    return std::chrono::weekday{sys_days{date()}};
}

std::optional<Timestamp> parse_iso(std::string_view str)
{
    // Fraction of seconds is accepted but dropped.
    static boost::regex const iso_re{
        R"((\d{4})-(\d{2})-(\d{2})[t ](\d{2}):(\d{2})(?::(\d{2})(?:[.,]\d+)?)?)"
        R"(\s*(z|([+-])(\d{2})(?::?(\d{2}))?))",
        boost::regex::perl | boost::regex::icase};

    boost::cmatch m;
    if (!boost::regex_match(str.data(), str.data() + str.size(), m, iso_re)) {
        return std::nullopt;
    }

    auto const field = [&m](int i) {
        return m[i].matched ? std::atoi(m[i].str().c_str()) : 0;
    };

    auto ts = Timestamp{.year = field(1),
                        .month = field(2),
                        .day = field(3),
                        .hour = field(4),
                        .minute = field(5),
                        .second = field(6)};
    if (m[8].matched) {
        auto const off = hours{field(9)} + minutes{field(10)};
        if (off > hours{14} || field(10) > 59) {
            return std::nullopt;
        }
        ts.offset = m[8].str() == "-" ? -off : off;
    }

    if (!ts.date().ok() || ts.hour > 23 || ts.minute > 59 || ts.second > 59) {
        spdlog::debug("'{}' looks like ISO 8601 but is out of range", str);
        return std::nullopt;
    }
    return ts;
}

} // namespace when
