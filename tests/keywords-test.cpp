#include <gtest/gtest.h>
#include <when/keywords.h>
#include <when/latin.h>

#include <algorithm>

using namespace std::chrono;
using namespace std::chrono_literals;

TEST(LatinTest, Characters)
{
    EXPECT_EQ(when::to_latin(U'ł'), U'l');
    EXPECT_EQ(when::to_latin(U'Ż'), U'Z');
    EXPECT_EQ(when::to_latin(U'ß'), U's');
    EXPECT_EQ(when::to_latin(U'İ'), U'I');
    EXPECT_EQ(when::to_latin(U'ț'), U't');
    EXPECT_EQ(when::to_latin(U'x'), U'x');
    EXPECT_EQ(when::to_latin(U'中'), U'中');
}

TEST(LatinTest, Strings)
{
    EXPECT_EQ(when::to_latin("Zażółć gęślą jaźń"), "Zazolc gesla jazn");
    EXPECT_EQ(when::to_latin("Ærøskøbing"), "Aroskobing");
    EXPECT_EQ(when::to_latin("中文 ok"), "中文 ok");
    EXPECT_EQ(when::to_latin(""), "");
}

TEST(LatinTest, InvalidUtf8IsCopied)
{
    EXPECT_EQ(when::to_latin("\xff"
                             "a\xc5"),
              "\xff"
              "a\xc5");

    // Overlong encodings of 'a', '.' and NUL.
    EXPECT_EQ(when::to_latin("\xc1\xa1\xc0\xae"), "\xc1\xa1\xc0\xae");
    EXPECT_EQ(when::to_latin("x\xc0\x80y"), "x\xc0\x80y");
    EXPECT_EQ(when::to_latin("\xe0\x80\xaf"), "\xe0\x80\xaf");
    EXPECT_EQ(when::to_latin("\xf0\x80\x80\xaf"), "\xf0\x80\x80\xaf");
    // Surrogate half and a value past U+10FFFF.
    EXPECT_EQ(when::to_latin("\xed\xa0\x80"), "\xed\xa0\x80");
    EXPECT_EQ(when::to_latin("\xf4\x90\x80\x80"), "\xf4\x90\x80\x80");
    // Boundary values still decode.
    EXPECT_EQ(when::to_latin("\xc2\x80\xed\x9f\xbf\xf4\x8f\xbf\xbf"),
              "\xc2\x80\xed\x9f\xbf\xf4\x8f\xbf\xbf");
}

TEST(TranslateTest, MalformedBytesDoNotBecomeKeywords)
{
    EXPECT_EQ(when::translate("n\xc1\xafw"), "n\xc1\xafw");
    EXPECT_NE(when::translate("n\xc1\xafw"), "now");
}

TEST(TranslateTest, LowerCasesAndTrims)
{
    EXPECT_EQ(when::translate("  Next MONDAY\t"), "next monday");
    EXPECT_EQ(when::translate(""), "");
}

TEST(TranslateTest, ReplacesKeywords)
{
    EXPECT_EQ(when::translate("Jutro O 15"), "tomorrow  at  15");
    EXPECT_EQ(when::translate("wczoraj rano"), "yesterday morning");
    EXPECT_EQ(when::translate("w okolicy 12"), "at 12");
    EXPECT_EQ(when::translate("Poniedziałek"), "monday");
    EXPECT_EQ(when::translate("przyszła środa"), "next wednesday");
}

TEST(TranslateTest, BothSpellingsOfLast)
{
    EXPECT_EQ(when::translate("ostatnia środa"), "last wednesday");
    EXPECT_EQ(when::translate("ostatna sroda"), "last wednesday");
    EXPECT_EQ(when::translate("poprzednia niedziela"), "last sunday");
    EXPECT_EQ(when::translate("poprzedna niedziela"), "last sunday");
}

TEST(TranslateTest, LongerKeywordsAreWholeWords)
{
    // Not "po" + "night".
    EXPECT_EQ(when::translate("Północ"), "midnight");
    EXPECT_EQ(when::translate("po poludniu"), " at noon");
    EXPECT_EQ(when::translate("dzisiaj"), "today");
}

TEST(TranslateTest, KeywordsInsideWordsAreKept)
{
    EXPECT_EQ(when::translate("piano"), "piano");
    EXPECT_EQ(when::translate("pora obiadu"), "pora obiadu");
    EXPECT_EQ(when::translate("nocturne"), "nocturne");
}

TEST(TablesTest, Weekdays)
{
    auto const table = when::weekday_table();
    ASSERT_EQ(table.size(), 8U);
    EXPECT_EQ(table.front().name, "monday");
    EXPECT_EQ(table.front().ordinal, 0);
    EXPECT_EQ(table[6].name, "sunday");
    EXPECT_EQ(table[6].ordinal, 6);
    EXPECT_EQ(table.back().name, "weekend");
    EXPECT_EQ(table.back().ordinal, 5);

    EXPECT_EQ(when::weekday_ordinal(Monday), 0);
    EXPECT_EQ(when::weekday_ordinal(Wednesday), 2);
    EXPECT_EQ(when::weekday_ordinal(Sunday), 6);
}

TEST(TablesTest, Zones)
{
    auto const table = when::zone_table();
    auto const offset_of = [&](std::string_view name) {
        auto const it =
            std::ranges::find(table, name, &when::ZoneAbbreviation::name);
        EXPECT_NE(it, table.end()) << name;
        return it->offset;
    };
    EXPECT_EQ(offset_of("pst"), -8h);
    EXPECT_EQ(offset_of("est"), -5h);
    EXPECT_EQ(offset_of("cest"), 2h);
    EXPECT_EQ(offset_of("aedt"), 11h);
    EXPECT_EQ(offset_of("utc"), 0h);
}

TEST(TablesTest, KeywordsAreLowerCaseAscii)
{
    for (auto const &[key, value] : when::keyword_table()) {
        EXPECT_TRUE(std::ranges::all_of(key, [](char c) {
            return (c >= 'a' && c <= 'z') || c == ' ';
        })) << key;
        EXPECT_FALSE(value.empty()) << key;
    }
}

int main(int argc, char **argv)
{
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
