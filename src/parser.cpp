#include <when/parser.h>

#include <when/keywords.h>
#include <when/normalize.h>

#include <boost/regex.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <array>
#include <charconv>
#include <vector>

namespace when {

using namespace std::string_view_literals;

namespace {

struct MonthName {
    std::string_view name;
    std::string_view abbreviation;
    int month;
};

constexpr auto months = std::to_array<MonthName>({
    {"january"sv, "jan"sv, 1},
    {"february"sv, "feb"sv, 2},
    {"march"sv, "mar"sv, 3},
    {"april"sv, "apr"sv, 4},
    {"may"sv, "may"sv, 5},
    {"june"sv, "jun"sv, 6},
    {"july"sv, "jul"sv, 7},
    {"august"sv, "aug"sv, 8},
    {"september"sv, "sep"sv, 9},
    {"october"sv, "oct"sv, 10},
    {"november"sv, "nov"sv, 11},
    {"december"sv, "dec"sv, 12},
});

struct TimeOfDay {
    std::string_view name;
    int hour;
};

// "afternoon" contains "noon" and "midnight" contains "night", so the longer
// word comes later.
constexpr auto times_of_day = std::to_array<TimeOfDay>({
    {"morning"sv, 8},
    {"noon"sv, 12},
    {"afternoon"sv, 14},
    {"evening"sv, 18},
    {"night"sv, 22},
    {"midnight"sv, 0},
});

constexpr auto max_offset = std::chrono::hours{14};

int to_int(std::string_view s)
{
    auto value = 0;
    auto const *const end = s.data() + s.size();
    auto const [ptr, ec] = std::from_chars(s.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        throw ParseError{fmt::format("'{}' is not a valid number", s)};
    }
    return value;
}

int to_int(boost::ssub_match const &m)
{
    return to_int(std::string_view{&*m.first,
                                   static_cast<std::size_t>(m.length())});
}

} // namespace

struct Parser::NamedRule {
    std::string_view name;
    Rule rule;
};

std::span<Parser::NamedRule const> Parser::rules()
{
    static constexpr auto table = std::to_array<NamedRule>({
        {"year"sv, &Parser::extract_year},
        {"at-clause"sv, &Parser::extract_at_clause},
        {"day"sv, &Parser::extract_day},
        {"weekday"sv, &Parser::resolve_weekday},
        {"slash-date"sv, &Parser::extract_slash_date},
        {"short-dot-date"sv, &Parser::extract_short_dot_date},
        {"dot-date"sv, &Parser::extract_dot_date},
        {"reverse-dot-date"sv, &Parser::extract_reverse_dot_date},
        {"hyphenated-date"sv, &Parser::extract_hyphenated_date},
        {"reverse-hyphenated-date"sv,
         &Parser::extract_reverse_hyphenated_date},
        {"month-name"sv, &Parser::extract_month_name},
        {"ordinal-day"sv, &Parser::extract_ordinal_day},
        {"relative-day"sv, &Parser::resolve_relative_day},
        {"time-of-day"sv, &Parser::resolve_time_of_day},
        {"time"sv, &Parser::extract_time},
        {"am-pm"sv, &Parser::adjust_am_pm},
        {"zone-abbreviation"sv, &Parser::resolve_zone_abbreviation},
        {"explicit-offset"sv, &Parser::extract_explicit_offset},
    });
    return table;
}

std::span<std::string_view const> Parser::rule_order()
{
    static auto const names = [] {
        std::vector<std::string_view> v;
        for (auto const &r : rules()) {
            v.push_back(r.name);
        }
        return v;
    }();
    return names;
}

Parser::Parser(std::string_view text, TimePoint now)
    : text_{translate(text)}, now_{Timestamp::from_sys(now)},
      now_weekday_{weekday_ordinal(now_.weekday())}
{
    if (text_.empty()) {
        throw ParseError{"Nothing to parse: input is empty"};
    }
    before_at_ = text_;

    fields_ = DateTimeFields{.year = now_.year,
                             .month = now_.month,
                             .day = now_.day,
                             .hour = now_.hour,
                             .minute = 0,
                             .second = 0,
                             .utc_offset = {}};
}

Timestamp Parser::run()
{
    if (text_ == "now") {
        spdlog::debug("'{}': now", text_);
        return now_;
    }
    if (auto const iso = parse_iso(text_); iso) {
        spdlog::debug("'{}': complete ISO 8601 timestamp", text_);
        return *iso;
    }

    for (auto const &[name, rule] : rules()) {
        if ((this->*rule)()) {
            auto const &f = fields_;
            spdlog::debug("rule {:<24} -> {}-{}-{} {}:{}:{} {:+}h", name,
                          f.year, f.month, f.day, f.hour, f.minute, f.second,
                          f.utc_offset.count());
        }
    }
    return build();
}

bool Parser::extract_year()
{
    static boost::regex const re{R"(\b\d{4}\b)"};
    boost::smatch m;
    if (!boost::regex_search(text_, m, re)) {
        return false;
    }
    fields_.year = to_int(m[0]);
    return true;
}

// Everything after the first "at" is read as hour, minute and second;
// everything before it is left for the day rule.
bool Parser::extract_at_clause()
{
    auto const pos = text_.find("at");
    if (pos == std::string::npos) {
        return false;
    }
    before_at_ = text_.substr(0, pos);
    auto const after_at = text_.substr(pos + 2);

    static boost::regex const re{R"(\d{1,2})"};
    std::array<int *, 3> const targets{&fields_.hour, &fields_.minute,
                                       &fields_.second};
    auto n = 0UZ;
    for (auto it = boost::sregex_iterator(after_at.begin(), after_at.end(), re);
         it != boost::sregex_iterator{} && n != targets.size(); ++it, ++n) {
        *targets[n] = to_int((*it)[0]);
    }
    return n != 0;
}

bool Parser::extract_day()
{
    static boost::regex const re{R"(\b\d{1,2}\b)"};
    boost::smatch m;
    if (!boost::regex_search(before_at_, m, re)) {
        return false;
    }
    fields_.day = to_int(m[0]);
    return true;
}

bool Parser::resolve_weekday()
{
    auto const is_last = contains("last");
    auto const is_next = contains("next");

    for (auto const &[name, ordinal] : weekday_table()) {
        if (!contains(name)) {
            continue;
        }
        auto const difference = ordinal - now_weekday_;
        if (is_last) {
            fields_.day = now_.day + difference - 7;
        }
        else if (is_next) {
            fields_.day = now_.day + difference + 7;
        }
        else {
            fields_.day = now_.day + difference;
        }
        return true;
    }
    return false;
}

// Month first: 01/31/2025 is January 31st.
bool Parser::extract_slash_date()
{
    static boost::regex const re{R"(\b(\d{1,2})/(\d{1,2})/(\d{4})\b)"};
    boost::smatch m;
    if (!boost::regex_search(text_, m, re)) {
        return false;
    }
    fields_.month = to_int(m[1]);
    fields_.day = to_int(m[2]);
    fields_.year = to_int(m[3]);
    return true;
}

bool Parser::extract_short_dot_date()
{
    static boost::regex const re{R"(\b(\d{1,2})\.(\d{1,2})\b)"};
    boost::smatch m;
    if (!boost::regex_search(text_, m, re)) {
        return false;
    }
    fields_.day = to_int(m[1]);
    fields_.month = to_int(m[2]);
    return true;
}

bool Parser::extract_dot_date()
{
    static boost::regex const re{R"(\b(\d{1,2})\.(\d{1,2})\.(\d{4})\b)"};
    boost::smatch m;
    if (!boost::regex_search(text_, m, re)) {
        return false;
    }
    fields_.day = to_int(m[1]);
    fields_.month = to_int(m[2]);
    fields_.year = to_int(m[3]);
    return true;
}

bool Parser::extract_reverse_dot_date()
{
    static boost::regex const re{R"(\b(\d{4})\.(\d{1,2})\.(\d{1,2})\b)"};
    boost::smatch m;
    if (!boost::regex_search(text_, m, re)) {
        return false;
    }
    fields_.year = to_int(m[1]);
    fields_.month = to_int(m[2]);
    fields_.day = to_int(m[3]);
    return true;
}

bool Parser::extract_hyphenated_date()
{
    static boost::regex const re{R"(\b(\d{4})-(\d{1,2})-(\d{1,2})\b)"};
    boost::smatch m;
    if (!boost::regex_search(text_, m, re)) {
        return false;
    }
    fields_.year = to_int(m[1]);
    fields_.month = to_int(m[2]);
    fields_.day = to_int(m[3]);
    return true;
}

bool Parser::extract_reverse_hyphenated_date()
{
    static boost::regex const re{R"(\b(\d{1,2})-(\d{1,2})-(\d{4})\b)"};
    boost::smatch m;
    if (!boost::regex_search(text_, m, re)) {
        return false;
    }
    fields_.day = to_int(m[1]);
    fields_.month = to_int(m[2]);
    fields_.year = to_int(m[3]);
    return true;
}

// Plain substring checks in calendar order, so "dec" inside "decide" still
// means December and a later month beats an earlier one.
bool Parser::extract_month_name()
{
    auto matched = false;
    for (auto const &[name, abbreviation, month] : months) {
        if (contains(name) || contains(abbreviation)) {
            fields_.month = month;
            matched = true;
        }
    }
    return matched;
}

bool Parser::extract_ordinal_day()
{
    auto matched = false;
    if (contains("1st")) {
        fields_.day = 1;
        matched = true;
    }
    if (contains("2nd")) {
        fields_.day = 2;
        matched = true;
    }
    if (contains("3rd")) {
        fields_.day = 3;
        matched = true;
    }

    static boost::regex const re{R"(\b(\d{1,2})(?:st|nd|rd|th)\b)"};
    boost::smatch m;
    if (boost::regex_search(text_, m, re)) {
        fields_.day = to_int(m[1]);
        matched = true;
    }
    return matched;
}

bool Parser::resolve_relative_day()
{
    auto matched = false;
    if (contains("yesterday")) {
        fields_.day = now_.day - 1;
        matched = true;
    }
    if (contains("today")) {
        fields_.day = now_.day;
        matched = true;
    }
    if (contains("tomorrow")) {
        fields_.day = now_.day + 1;
        matched = true;
    }
    return matched;
}

bool Parser::resolve_time_of_day()
{
    auto matched = false;
    for (auto const &[name, hour] : times_of_day) {
        if (contains(name)) {
            fields_.hour = hour;
            fields_.minute = 0;
            fields_.second = 0;
            matched = true;
        }
    }
    return matched;
}

bool Parser::extract_time()
{
    static boost::regex const re{R"(\b(\d{1,2}):(\d{1,2})(?::(\d{1,2}))?\b)"};
    boost::smatch m;
    if (!boost::regex_search(text_, m, re)) {
        return false;
    }
    fields_.hour = to_int(m[1]);
    fields_.minute = to_int(m[2]);
    if (m[3].matched) {
        fields_.second = to_int(m[3]);
    }
    return true;
}

// Searches the whole text, not just the time literal: "3 pm" and
// "meet the pm at 3" both shift the hour.
bool Parser::adjust_am_pm()
{
    auto adjusted = false;
    if (contains(" am") && fields_.hour == 12) {
        fields_.hour = 0;
        adjusted = true;
    }
    if (contains(" pm") && fields_.hour < 12) {
        fields_.hour += 12;
        adjusted = true;
    }
    return adjusted;
}

bool Parser::resolve_zone_abbreviation()
{
    auto matched = false;
    for (auto const &[name, offset] : zone_table()) {
        if (contains(fmt::format(" {}", name))) {
            fields_.utc_offset = offset;
            matched = true;
        }
    }
    return matched;
}

// utc+N wins over gmt+N, both win over abbreviations.
bool Parser::extract_explicit_offset()
{
    static auto const patterns = std::to_array<boost::regex>({
        boost::regex{R"(gmt([+-])(\d{1,2}))"},
        boost::regex{R"(utc([+-])(\d{1,2}))"},
    });

    auto matched = false;
    for (auto const &re : patterns) {
        boost::smatch m;
        if (!boost::regex_search(text_, m, re)) {
            continue;
        }
        auto const hours = std::chrono::hours{to_int(m[2])};
        fields_.utc_offset = m[1] == "-" ? -hours : hours;
        matched = true;
    }
    return matched;
}

Timestamp Parser::build() const
{
    auto const &f = fields_;
    auto const date = normalize(f.year, f.month, f.day);

    if (f.hour < 0 || f.hour > 23) {
        throw ParseError{fmt::format("hour {} is out of range", f.hour)};
    }
    if (f.minute < 0 || f.minute > 59) {
        throw ParseError{fmt::format("minute {} is out of range", f.minute)};
    }
    if (f.second < 0 || f.second > 59) {
        throw ParseError{fmt::format("second {} is out of range", f.second)};
    }
    if (abs(f.utc_offset) > max_offset) {
        throw ParseError{fmt::format("UTC offset {}h is out of range",
                                     f.utc_offset.count())};
    }

    return Timestamp{.year = date.year,
                     .month = date.month,
                     .day = date.day,
                     .hour = f.hour,
                     .minute = f.minute,
                     .second = f.second,
                     .offset = f.utc_offset};
}

Timestamp parse(std::string_view text, TimePoint now)
{
    Parser p(text, now);
    return p.run();
}

Timestamp parse(std::string_view text)
{
    return parse(text,
                 std::chrono::floor<std::chrono::seconds>(SystemClock::now()));
}

} // namespace when
