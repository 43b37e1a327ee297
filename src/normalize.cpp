#include <when/normalize.h>
#include <when/parser.h>

#include <fmt/format.h>

namespace when {

bool is_leap_year(int year) noexcept
{
    return year % 100 == 0 ? (year % 400 == 0) : (year % 4 == 0);
}

int days_in_month(int year, int month)
{
    switch (month) {
    case 1:
    case 3:
    case 5:
    case 7:
    case 8:
    case 10:
    case 12:
        return 31;
    case 4:
    case 6:
    case 9:
    case 11:
        return 30;
    case 2:
        return is_leap_year(year) ? 29 : 28;
    default:
        throw ParseError{fmt::format("month {} is out of range", month)};
    }
}

CalendarDate normalize(int year, int month, int day)
{
    if (month < 1 || month > 12) {
        throw ParseError{fmt::format("month {} is out of range", month)};
    }

    while (day > days_in_month(year, month)) {
        day -= days_in_month(year, month);
        if (++month > 12) {
            month = 1;
            ++year;
        }
    }

    while (day < 1) {
        if (--month < 1) {
            month = 12;
            --year;
        }
        day += days_in_month(year, month);
    }

    return {.year = year, .month = month, .day = day};
}

} // namespace when
