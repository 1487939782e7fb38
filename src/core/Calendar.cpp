#include "cadence/core/Calendar.hpp"

#include <array>

namespace cadence {
namespace core {

namespace {
// Days before the first of each month in a common year.
constexpr std::array<quint64, 12> MonthOffsets = {0, 31, 59, 90, 120, 151, 181, 212, 243, 273, 304, 334};

constexpr quint64 AnchorYear = 1700;
constexpr quint64 AnchorWeekday = 4; // 1700-01-01 was a Friday
} // namespace

bool isLeapYear(quint64 year)
{
    if (year % 400 == 0) {
        return true;
    }
    if (year % 100 == 0) {
        return false;
    }
    return year % 4 == 0;
}

quint64 daysInMonth(quint64 year, quint64 month)
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
        return isLeapYear(year) ? 29 : 28;
    default:
        qFatal("daysInMonth: month %llu out of range", static_cast<unsigned long long>(month));
    }
    return 0;
}

SimpleDate firstWeekdayDate()
{
    return SimpleDate::fromYmd(AnchorYear, 3, 1);
}

Weekday weekdayOfDate(const SimpleDate &date)
{
    Q_ASSERT_X(date.month >= 1 && date.month <= 12, "weekdayOfDate", "month out of range");

    // January and February count towards the previous year's leap day.
    const quint64 beforeMarch = date.month > 2 ? 0 : 1;
    Q_ASSERT_X(date.year >= AnchorYear + beforeMarch, "weekdayOfDate", "dates before 1700-03-01 are not supported");
    const quint64 aux = date.year - AnchorYear - beforeMarch;
    const quint64 days = AnchorWeekday
        + (aux + beforeMarch) * 365
        + (aux / 4 - aux / 100 + (aux + 100) / 400)
        + MonthOffsets[static_cast<std::size_t>(date.month - 1)] + (date.day - 1);

    return static_cast<Weekday>(days % WeekdayCount);
}

} // namespace core
} // namespace cadence
