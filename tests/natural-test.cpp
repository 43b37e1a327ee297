#include <gtest/gtest.h>
#include <when/natural.h>

using namespace std::chrono;
using namespace std::chrono_literals;
using when::Timestamp;

namespace {

constexpr auto now = sys_days{2025y / January / 15d} + 10h + 20min + 30s;

Timestamp utc(int y, int mo, int d, int h, int mi)
{
    return Timestamp{.year = y, .month = mo, .day = d, .hour = h, .minute = mi};
}

std::string natural(Timestamp const &ts, bool include_time = true,
                    int offset = 0)
{
    return when::to_natural_string(ts, offset, include_time, now);
}

} // namespace

TEST(NaturalTest, SameDay)
{
    EXPECT_EQ(natural(utc(2025, 1, 15, 8, 5)), "08:05");
    EXPECT_EQ(natural(utc(2025, 1, 15, 18, 0)), "Today, 18:00");
    EXPECT_EQ(natural(utc(2025, 1, 15, 18, 0), false), "Today");
}

TEST(NaturalTest, AdjacentDays)
{
    EXPECT_EQ(natural(utc(2025, 1, 14, 9, 0)), "Yesterday, 09:00");
    EXPECT_EQ(natural(utc(2025, 1, 16, 9, 0)), "Tomorrow, 09:00");
    EXPECT_EQ(natural(utc(2025, 1, 14, 9, 0), false), "Yesterday");
    EXPECT_EQ(natural(utc(2025, 1, 16, 9, 0), false), "Tomorrow");
}

TEST(NaturalTest, SameWeek)
{
    EXPECT_EQ(natural(utc(2025, 1, 20, 9, 0)), "Mon, 09:00");
    EXPECT_EQ(natural(utc(2025, 1, 8, 9, 0), false), "Wed");
}

TEST(NaturalTest, SameYearAndOlder)
{
    EXPECT_EQ(natural(utc(2025, 3, 5, 9, 0)), "Mar 05, 09:00");
    EXPECT_EQ(natural(utc(2025, 3, 5, 9, 0), false), "Mar 05");
    EXPECT_EQ(natural(utc(2024, 6, 1, 9, 0)), "2024-06-01, 09:00");
    EXPECT_EQ(natural(utc(2024, 6, 1, 9, 0), false), "2024-06-01");
}

TEST(NaturalTest, OffsetShiftsBothSides)
{
    // 23:30 UTC is already the 16th at +2.
    EXPECT_EQ(natural(utc(2025, 1, 15, 23, 30), true, 2), "Tomorrow, 01:30");

    // A timestamp carrying its own offset is compared as an instant.
    auto const cest = Timestamp{.year = 2025,
                                .month = 1,
                                .day = 16,
                                .hour = 1,
                                .minute = 30,
                                .offset = 2h};
    EXPECT_EQ(natural(cest), "Today, 23:30");
}

int main(int argc, char **argv)
{
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
