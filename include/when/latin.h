#pragma once
#include <string>
#include <string_view>

namespace when {

/// @brief  Maps a Latin letter with diacritics to its ASCII base letter,
/// e.g. U'ł' -> U'l', U'ß' -> U's'. Other code points are returned as is.
///
/// Only a fixed set of letters is known, this is not a full transliteration.
[[nodiscard]] char32_t to_latin(char32_t c) noexcept;

/// @brief  Applies `to_latin(char32_t)` to every code point of a UTF-8
/// string. Invalid UTF-8 bytes are copied unchanged.
[[nodiscard]] std::string to_latin(std::string_view utf8);

} // namespace when
