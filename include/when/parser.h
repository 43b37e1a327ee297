#pragma once
#include <when/timestamp.h>

#include <chrono>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace when {

class ParseError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// Accumulator for the rule cascade. Fields may be out of range until the
// cascade is finished.
struct DateTimeFields {
    int year{};
    int month{};
    int day{};
    int hour{};
    int minute{};
    int second{};
    std::chrono::hours utc_offset{};
};

// One parse of one string. Every rule reads the same translated text and
// overwrites the fields it is responsible for when its pattern matches; the
// order of `rule_order()` is the only conflict resolution there is.
class Parser {
  public:
    Parser(Parser const &) = delete;
    Parser(Parser &&) = delete;
    Parser &operator=(Parser const &) = delete;
    Parser &operator=(Parser &&) = delete;

    /// @throws ParseError  If `text` is empty or whitespace only.
    Parser(std::string_view text, TimePoint now);

    ~Parser() = default;

    /// @brief  Runs the fast paths, then every rule in order, then normalizes
    /// the date. Call once.
    [[nodiscard]] Timestamp run();

    [[nodiscard]] std::string const &translated() const noexcept
    {
        return text_;
    }

    [[nodiscard]] DateTimeFields const &fields() const noexcept
    {
        return fields_;
    }

    /// @brief  Names of the rules in the order they are applied.
    static std::span<std::string_view const> rule_order();

  private:
    using Rule = bool (Parser::*)();
    struct NamedRule;
    static std::span<NamedRule const> rules();

    [[nodiscard]] bool contains(std::string_view s) const noexcept
    {
        return text_.contains(s);
    }

    bool extract_year();
    bool extract_at_clause();
    bool extract_day();
    bool resolve_weekday();
    bool extract_slash_date();
    bool extract_short_dot_date();
    bool extract_dot_date();
    bool extract_reverse_dot_date();
    bool extract_hyphenated_date();
    bool extract_reverse_hyphenated_date();
    bool extract_month_name();
    bool extract_ordinal_day();
    bool resolve_relative_day();
    bool resolve_time_of_day();
    bool extract_time();
    bool adjust_am_pm();
    bool resolve_zone_abbreviation();
    bool extract_explicit_offset();

    [[nodiscard]] Timestamp build() const;

    std::string text_;
    std::string before_at_;
    Timestamp now_;
    int now_weekday_;
    DateTimeFields fields_;
};

/// @brief  Parses a natural-language date/time expression relative to `now`.
///
/// e.g. "next monday at 14:30", "31.01.2025", "jutro wieczor utc+2"
///
/// @throws ParseError  On empty input or values that do not form a valid
/// timestamp.
[[nodiscard]] Timestamp parse(std::string_view text, TimePoint now);

/// @brief  Same as above, relative to the current UTC time.
[[nodiscard]] Timestamp parse(std::string_view text);

} // namespace when
