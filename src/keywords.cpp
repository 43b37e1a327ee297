#include <when/keywords.h>
#include <when/latin.h>

#include <boost/regex.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace when {

namespace {

using namespace std::string_view_literals;
using std::chrono::hours;

// Polish -> English. Inflected forms are listed separately.
constexpr auto keywords = std::to_array<Keyword>({
    {"styczen"sv, "january"sv},
    {"luty"sv, "february"sv},
    {"marzec"sv, "march"sv},
    {"kwiecien"sv, "april"sv},
    {"maj"sv, "may"sv},
    {"czerwiec"sv, "june"sv},
    {"lipiec"sv, "july"sv},
    {"sierpien"sv, "august"sv},
    {"wrzesien"sv, "september"sv},
    {"pazdziernik"sv, "october"sv},
    {"listopad"sv, "november"sv},
    {"grudzien"sv, "december"sv},
    {"poniedzialek"sv, "monday"sv},
    {"wtorek"sv, "tuesday"sv},
    {"sroda"sv, "wednesday"sv},
    {"srode"sv, "wednesday"sv},
    {"czwartek"sv, "thursday"sv},
    {"piatek"sv, "friday"sv},
    {"sobota"sv, "saturday"sv},
    {"sobote"sv, "saturday"sv},
    {"niedziela"sv, "sunday"sv},
    {"niedziele"sv, "sunday"sv},
    {"wczoraj"sv, "yesterday"sv},
    {"dzisiaj"sv, "today"sv},
    {"dzis"sv, "today"sv},
    {"jutro"sv, "tomorrow"sv},
    {"rano"sv, "morning"sv},
    {"poludnie"sv, "noon"sv},
    {"poludnia"sv, "noon"sv},
    {"poludniu"sv, "noon"sv},
    {"wieczor"sv, "evening"sv},
    {"noc"sv, "night"sv},
    {"polnoc"sv, "midnight"sv},
    {"kolo"sv, "at"sv},
    {"okolo"sv, "at"sv},
    {"w okolicy"sv, "at"sv},
    {"przed"sv, " at "sv},
    {"o"sv, " at "sv},
    {"po"sv, " at"sv},
    {"teraz"sv, "now"sv},
    {"ostatni"sv, "last"sv},
    {"ostatnia"sv, "last"sv},
    {"ostatna"sv, "last"sv},
    {"poprzedni"sv, "last"sv},
    {"poprzednia"sv, "last"sv},
    {"poprzedna"sv, "last"sv},
    {"nastepny"sv, "next"sv},
    {"nastepna"sv, "next"sv},
    {"przyszly"sv, "next"sv},
    {"przyszla"sv, "next"sv},
});

constexpr auto weekdays = std::to_array<WeekdayName>({
    {"monday"sv, 0},
    {"tuesday"sv, 1},
    {"wednesday"sv, 2},
    {"thursday"sv, 3},
    {"friday"sv, 4},
    {"saturday"sv, 5},
    {"sunday"sv, 6},
    {"weekend"sv, 5},
});

constexpr auto zones = std::to_array<ZoneAbbreviation>({
    {"utc"sv, hours{0}},    {"gmt"sv, hours{0}},   {"wet"sv, hours{0}},
    {"pst"sv, hours{-8}},   {"pdt"sv, hours{-7}},  {"mst"sv, hours{-7}},
    {"mdt"sv, hours{-6}},   {"cst"sv, hours{-6}},  {"cdt"sv, hours{-5}},
    {"est"sv, hours{-5}},   {"edt"sv, hours{-4}},  {"akst"sv, hours{-9}},
    {"hst"sv, hours{-10}},  {"bst"sv, hours{1}},   {"cet"sv, hours{1}},
    {"cest"sv, hours{2}},   {"eet"sv, hours{2}},   {"eest"sv, hours{3}},
    {"msk"sv, hours{3}},    {"jst"sv, hours{9}},   {"aest"sv, hours{10}},
    {"aedt"sv, hours{11}},
});

std::string regex_escape(std::string_view s)
{
    constexpr auto meta = R"(\^$.|?*+()[]{})"sv;
    std::string out;
    for (auto const c : s) {
        if (meta.contains(c)) {
            out += '\\';
        }
        out += c;
    }
    return out;
}

boost::regex const &keyword_regex()
{
    static auto const re = [] {
        auto pattern = std::string{R"(\b()"};
        for (auto i = 0UZ; i != keywords.size(); ++i) {
            if (i != 0) {
                pattern += '|';
            }
            pattern += regex_escape(keywords[i].first);
        }
        pattern += R"()\b)";
        return boost::regex{pattern, boost::regex::perl};
    }();
    return re;
}

std::string_view canonical(std::string_view key)
{
    auto const it = std::ranges::find(keywords, key, &Keyword::first);
    // The pattern is built from the same table.
    return it != keywords.end() ? it->second : key;
}

std::string_view trim(std::string_view s)
{
    auto const is_space = [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    };
    while (!s.empty() && is_space(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_space(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

} // namespace

std::span<Keyword const> keyword_table()
{
    return keywords;
}

std::span<WeekdayName const> weekday_table()
{
    return weekdays;
}

std::span<ZoneAbbreviation const> zone_table()
{
    return zones;
}

std::string translate(std::string_view raw)
{
    auto s = to_latin(trim(raw));
    std::ranges::transform(s, s.begin(), [](char c) {
        auto const u = static_cast<unsigned char>(c);
        return u < 0x80 ? static_cast<char>(std::tolower(u)) : c;
    });

    std::string out;
    out.reserve(s.size());
    auto last = s.cbegin();
    auto const &re = keyword_regex();
    for (auto it = boost::sregex_iterator(s.cbegin(), s.cend(), re);
         it != boost::sregex_iterator{}; ++it) {
        auto const &m = *it;
        out.append(last, m[0].first);
        out += canonical(std::string_view{&*m[0].first,
                                          static_cast<std::size_t>(
                                              m[0].length())});
        last = m[0].second;
    }
    out.append(last, s.cend());

    spdlog::debug("translate: '{}' -> '{}'", raw, out);
    return out;
}

} // namespace when
