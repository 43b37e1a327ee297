#include <CLI/CLI.hpp>
#include <when/config.h>
#include <when/json.h>
#include <when/natural.h>
#include <when/parser.h>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <string>
#include <vector>

int main(int argc, char **argv)
{
    using config::verbose;
    auto version = false;
    auto as_json = false;
    auto natural = false;
    auto date_only = false;
    auto offset_hours = 0;
    auto now_str = std::string{};
    auto words = std::vector<std::string>{};

    CLI::App app("natural-language date/time parser", "when");
    app.add_flag("-V,--version", version, "Print when version and exit");
    app.add_flag("-v,--verbose", verbose(), "Use debug mode");
    app.add_option("--now", now_str,
                   "Reference time as ISO 8601 (default: $WHEN_NOW or the "
                   "current time)");
    app.add_flag("--json", as_json, "Print the result as json");
    app.add_flag("--natural", natural,
                 "Print the result relative to the reference time");
    app.add_option("--offset", offset_hours,
                   "Hours from UTC used by --natural")
        ->check(CLI::Range(-14, 14));
    app.add_flag("--date-only", date_only, "Omit the time for --natural");
    app.add_option("text", words, "Expression to parse, e.g. next monday at 9");
    CLI11_PARSE(app, argc, argv);

    spdlog::set_level(config::verbose() ? spdlog::level::debug
                                        : spdlog::level::info);
    spdlog::debug("verbose={}", verbose());
    spdlog::debug("version={}", version);
    spdlog::debug("json={}", as_json);
    spdlog::debug("natural={}", natural);
    spdlog::debug("offset={}", offset_hours);

    if (version) {
        fmt::print("when version {}\n", WHEN_VERSION);
        return 0;
    }

    try {
        auto now = when::TimePoint{};
        if (!now_str.empty()) {
            auto const ts = when::parse_iso(now_str);
            if (!ts.has_value()) {
                throw when::ParseError{"--now is not an ISO 8601 timestamp: " +
                                       now_str};
            }
            now = ts->to_sys();
        }
        else if (auto const fixed = config::fixed_now(); fixed) {
            now = *fixed;
        }
        else {
            now = std::chrono::floor<std::chrono::seconds>(
                when::SystemClock::now());
        }
        spdlog::debug("now={}", when::Timestamp::from_sys(now).to_iso());

        auto const input = fmt::format("{}", fmt::join(words, " "));
        when::Parser parser(input, now);
        auto const ts = parser.run();

        if (as_json) {
            auto const result = when::ParseResult{.input = input,
                                                  .translated =
                                                      parser.translated(),
                                                  .timestamp = ts};
            fmt::print("{}\n", when::to_json_string(result));
        }
        else if (natural) {
            fmt::print("{}\n", when::to_natural_string(ts, offset_hours,
                                                       !date_only, now));
        }
        else {
            fmt::print("{}\n", ts.to_iso());
        }
    }
    catch (when::ParseError const &e) {
        spdlog::error("Failed to parse: {}", e.what());
        return 1;
    }
    catch (nlohmann::json::exception const &e) {
        spdlog::error("Failed to write json: {}", e.what());
        return 1;
    }
}
