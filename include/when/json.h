#pragma once
#include <when/parser.h>
#include <when/timestamp.h>

#include <nlohmann/json.hpp>
#include <string>

// Timestamps in Json follow ISO 8601, e.g. "2025-01-31T14:30:00+02:00".
namespace nlohmann {
template <> struct adl_serializer<when::Timestamp> {
    static void to_json(json &j, when::Timestamp const &ts)
    {
        j = ts.to_iso();
    }

    static void from_json(json const &j, when::Timestamp &ts)
    {
        auto const str = j.get<std::string>();
        auto const parsed = when::parse_iso(str);
        if (!parsed.has_value()) {
            throw when::ParseError{"Not an ISO 8601 timestamp: " + str};
        }
        ts = *parsed;
    }
};
} // namespace nlohmann

namespace when {

// Result of parsing one input, as printed by `when --json`.
struct ParseResult {
    std::string input;
    std::string translated;
    Timestamp timestamp;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(ParseResult, input, translated, timestamp);
};

/// @brief  Serializes `r` on one line. Input bytes that are not valid UTF-8
/// are written as U+FFFD instead of failing the dump.
inline std::string to_json_string(ParseResult const &r)
{
    return nlohmann::json(r).dump(-1, ' ', false,
                                  nlohmann::json::error_handler_t::replace);
}

} // namespace when
