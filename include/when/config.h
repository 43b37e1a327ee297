#pragma once
#include <when/parser.h>
#include <when/timestamp.h>

#include <cstdlib>
#include <optional>
#include <string>

namespace config {

inline std::optional<std::string> env(char const *variable)
{
    char *p = std::getenv(variable);
    return p != nullptr ? std::optional{p} : std::nullopt;
}

inline bool &verbose()
{
    static auto verbose = false;
    return verbose;
}

/// @brief  Reference time taken from WHEN_NOW (ISO 8601), if set. Makes the
/// output reproducible, e.g. in scripts and tests.
///
/// @throws when::ParseError  If WHEN_NOW is set but is not a valid
/// timestamp.
inline std::optional<when::TimePoint> fixed_now()
{
    auto const value = env("WHEN_NOW");
    if (!value.has_value() || value->empty()) {
        return std::nullopt;
    }
    auto const ts = when::parse_iso(*value);
    if (!ts.has_value()) {
        throw when::ParseError{"WHEN_NOW is not an ISO 8601 timestamp: " +
                               *value};
    }
    return ts->to_sys();
}

} // namespace config
