#include <when/latin.h>

#include <algorithm>
#include <array>
#include <utility>

namespace when {

namespace {

// Sorted by code point, searched with lower_bound.
constexpr auto latin_table = std::to_array<std::pair<char32_t, char>>({
    {U'À', 'A'}, {U'Á', 'A'}, {U'Â', 'A'}, {U'Ä', 'A'}, {U'Å', 'A'},
    {U'Æ', 'A'}, {U'Ç', 'C'}, {U'È', 'E'}, {U'É', 'E'}, {U'Ê', 'E'},
    {U'Ë', 'E'}, {U'Ì', 'I'}, {U'Í', 'I'}, {U'Î', 'I'}, {U'Ï', 'I'},
    {U'Ñ', 'N'}, {U'Ò', 'O'}, {U'Ó', 'O'}, {U'Ô', 'O'}, {U'Ö', 'O'},
    {U'Ø', 'O'}, {U'Ù', 'U'}, {U'Ú', 'U'}, {U'Û', 'U'}, {U'Ü', 'U'},
    {U'ß', 's'}, {U'à', 'a'}, {U'á', 'a'}, {U'â', 'a'}, {U'ä', 'a'},
    {U'å', 'a'}, {U'æ', 'a'}, {U'ç', 'c'}, {U'è', 'e'}, {U'é', 'e'},
    {U'ê', 'e'}, {U'ë', 'e'}, {U'ì', 'i'}, {U'í', 'i'}, {U'î', 'i'},
    {U'ï', 'i'}, {U'ñ', 'n'}, {U'ò', 'o'}, {U'ó', 'o'}, {U'ô', 'o'},
    {U'ö', 'o'}, {U'ø', 'o'}, {U'ù', 'u'}, {U'ú', 'u'}, {U'û', 'u'},
    {U'ü', 'u'}, {U'Ā', 'A'}, {U'ā', 'a'}, {U'Ă', 'A'}, {U'ă', 'a'},
    {U'Ą', 'A'}, {U'ą', 'a'}, {U'Ć', 'C'}, {U'ć', 'c'}, {U'Č', 'C'},
    {U'č', 'c'}, {U'Ď', 'D'}, {U'ď', 'd'}, {U'Đ', 'D'}, {U'đ', 'd'},
    {U'Ē', 'E'}, {U'ē', 'e'}, {U'Ė', 'E'}, {U'ė', 'e'}, {U'Ę', 'E'},
    {U'ę', 'e'}, {U'Ě', 'E'}, {U'ě', 'e'}, {U'Ğ', 'G'}, {U'ğ', 'g'},
    {U'Ģ', 'G'}, {U'ģ', 'g'}, {U'Ī', 'I'}, {U'ī', 'i'}, {U'Į', 'I'},
    {U'į', 'i'}, {U'İ', 'I'}, {U'ı', 'i'}, {U'Ķ', 'K'}, {U'ķ', 'k'},
    {U'Ĺ', 'L'}, {U'ĺ', 'l'}, {U'Ļ', 'L'}, {U'ļ', 'l'}, {U'Ľ', 'L'},
    {U'ľ', 'l'}, {U'Ł', 'L'}, {U'ł', 'l'}, {U'Ń', 'N'}, {U'ń', 'n'},
    {U'Ņ', 'N'}, {U'ņ', 'n'}, {U'Ň', 'N'}, {U'ň', 'n'}, {U'Ő', 'O'},
    {U'ő', 'o'}, {U'Ŕ', 'R'}, {U'ŕ', 'r'}, {U'Ř', 'R'}, {U'ř', 'r'},
    {U'Ś', 'S'}, {U'ś', 's'}, {U'Ş', 'S'}, {U'ş', 's'}, {U'Š', 'S'},
    {U'š', 's'}, {U'Ť', 'T'}, {U'ť', 't'}, {U'Ū', 'U'}, {U'ū', 'u'},
    {U'Ů', 'U'}, {U'ů', 'u'}, {U'Ű', 'U'}, {U'ű', 'u'}, {U'Ų', 'U'},
    {U'ų', 'u'}, {U'Ź', 'Z'}, {U'ź', 'z'}, {U'Ż', 'Z'}, {U'ż', 'z'},
    {U'Ž', 'Z'}, {U'ž', 'z'}, {U'Ș', 'S'}, {U'ș', 's'}, {U'Ț', 'T'},
    {U'ț', 't'},
});

static_assert(std::ranges::is_sorted(latin_table, {},
                                     &std::pair<char32_t, char>::first));

// Decodes one code point starting at `pos`. Returns the number of bytes
// consumed, or 0 if the sequence is malformed.
std::size_t decode(std::string_view s, std::size_t pos, char32_t &out)
{
    auto const b0 = static_cast<unsigned char>(s[pos]);
    auto len = 0UZ;
    if (b0 < 0x80) {
        out = b0;
        return 1;
    }
    if ((b0 & 0xE0) == 0xC0) {
        len = 2;
        out = b0 & 0x1F;
    }
    else if ((b0 & 0xF0) == 0xE0) {
        len = 3;
        out = b0 & 0x0F;
    }
    else if ((b0 & 0xF8) == 0xF0) {
        len = 4;
        out = b0 & 0x07;
    }
    else {
        return 0;
    }
    if (pos + len > s.size()) {
        return 0;
    }
    for (auto i = 1UZ; i != len; ++i) {
        auto const b = static_cast<unsigned char>(s[pos + i]);
        if ((b & 0xC0) != 0x80) {
            return 0;
        }
        out = (out << 6) | (b & 0x3F);
    }

    // Overlong forms, surrogates and values past U+10FFFF are not UTF-8.
    constexpr auto shortest =
        std::to_array<char32_t>({0, 0, 0x80, 0x800, 0x10000});
    if (out < shortest[len] || (out >= 0xD800 && out <= 0xDFFF) ||
        out > 0x10FFFF) {
        return 0;
    }
    return len;
}

void encode(char32_t c, std::string &out)
{
    if (c < 0x80) {
        out += static_cast<char>(c);
    }
    else if (c < 0x800) {
        out += static_cast<char>(0xC0 | (c >> 6));
        out += static_cast<char>(0x80 | (c & 0x3F));
    }
    else if (c < 0x10000) {
        out += static_cast<char>(0xE0 | (c >> 12));
        out += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (c & 0x3F));
    }
    else {
        out += static_cast<char>(0xF0 | (c >> 18));
        out += static_cast<char>(0x80 | ((c >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (c & 0x3F));
    }
}

} // namespace

char32_t to_latin(char32_t c) noexcept
{
    auto const it = std::ranges::lower_bound(
        latin_table, c, {}, &std::pair<char32_t, char>::first);
    if (it != latin_table.end() && it->first == c) {
        return static_cast<char32_t>(it->second);
    }
    return c;
}

std::string to_latin(std::string_view utf8)
{
    std::string out;
    out.reserve(utf8.size());
    for (auto pos = 0UZ; pos < utf8.size();) {
        char32_t c{};
        auto const n = decode(utf8, pos, c);
        if (n == 0) {
            out += utf8[pos++];
            continue;
        }
        encode(to_latin(c), out);
        pos += n;
    }
    return out;
}

} // namespace when
