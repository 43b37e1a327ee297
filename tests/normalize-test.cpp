#include <gtest/gtest.h>
#include <when/normalize.h>
#include <when/parser.h>

using when::CalendarDate;
using when::normalize;

TEST(NormalizeTest, InRangeIsUnchanged)
{
    EXPECT_EQ(normalize(2025, 1, 1), (CalendarDate{2025, 1, 1}));
    EXPECT_EQ(normalize(2025, 1, 31), (CalendarDate{2025, 1, 31}));
    EXPECT_EQ(normalize(2024, 2, 29), (CalendarDate{2024, 2, 29}));
}

TEST(NormalizeTest, RollsForward)
{
    EXPECT_EQ(normalize(2025, 1, 45), (CalendarDate{2025, 2, 14}));
    EXPECT_EQ(normalize(2025, 1, 32), (CalendarDate{2025, 2, 1}));
    EXPECT_EQ(normalize(2025, 2, 29), (CalendarDate{2025, 3, 1}));
    EXPECT_EQ(normalize(2024, 2, 30), (CalendarDate{2024, 3, 1}));
    EXPECT_EQ(normalize(2025, 12, 32), (CalendarDate{2026, 1, 1}));
    // 31 + 28 + 31 = 90
    EXPECT_EQ(normalize(2025, 1, 100), (CalendarDate{2025, 4, 10}));
}

TEST(NormalizeTest, RollsBackward)
{
    EXPECT_EQ(normalize(2025, 3, 0), (CalendarDate{2025, 2, 28}));
    EXPECT_EQ(normalize(2024, 3, 0), (CalendarDate{2024, 2, 29}));
    EXPECT_EQ(normalize(2025, 1, 0), (CalendarDate{2024, 12, 31}));
    EXPECT_EQ(normalize(2025, 1, -8), (CalendarDate{2024, 12, 23}));
    EXPECT_EQ(normalize(2025, 3, -30), (CalendarDate{2025, 1, 29}));
}

TEST(NormalizeTest, MonthOutOfRange)
{
    EXPECT_THROW(static_cast<void>(normalize(2025, 13, 1)), when::ParseError);
    EXPECT_THROW(static_cast<void>(normalize(2025, 0, 1)), when::ParseError);
    EXPECT_THROW(static_cast<void>(when::days_in_month(2025, 31)),
                 when::ParseError);
}

TEST(NormalizeTest, DaysInMonth)
{
    EXPECT_EQ(when::days_in_month(2025, 1), 31);
    EXPECT_EQ(when::days_in_month(2025, 4), 30);
    EXPECT_EQ(when::days_in_month(2025, 2), 28);
    EXPECT_EQ(when::days_in_month(2024, 2), 29);
    EXPECT_EQ(when::days_in_month(1900, 2), 28);
    EXPECT_EQ(when::days_in_month(2000, 2), 29);
}

int main(int argc, char **argv)
{
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
