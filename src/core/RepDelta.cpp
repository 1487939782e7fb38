#include "cadence/core/RepDelta.hpp"

#include "cadence/core/Calendar.hpp"

#include <algorithm>

namespace cadence {
namespace core {

namespace {
SimpleDate alignToWeekday(SimpleDate date, Weekday weekday)
{
    while (weekdayOfDate(date) != weekday) {
        date = date + Duration::days(1);
    }
    return date;
}

// Occurrence `weekid` (zero based) of `weekday` in the given month. The fifth
// occurrence may fall into the following month.
SimpleDate weekdayInMonth(quint64 year, quint64 month, Weekday weekday, quint64 weekid)
{
    const SimpleDate first = alignToWeekday(SimpleDate::fromYmd(year, month, 1), weekday);
    return first + Duration::weeks(weekid);
}

// Months to move: a date already past this month's occurrence moves `nth`
// months, an earlier one still has an occurrence left in the current month.
quint64 monthsToAdvance(quint64 nth, bool pastAnchor)
{
    if (pastAnchor || nth == 0) {
        return nth;
    }
    return nth - 1;
}
} // namespace

bool operator==(const DayDelta &lhs, const DayDelta &rhs)
{
    return lhs.nth == rhs.nth;
}

bool operator==(const WeekDelta &lhs, const WeekDelta &rhs)
{
    return lhs.nth == rhs.nth && lhs.on == rhs.on;
}

bool operator==(const MonthDeltaDate &lhs, const MonthDeltaDate &rhs)
{
    return lhs.nth == rhs.nth && lhs.days == rhs.days;
}

bool operator==(const MonthDeltaWeek &lhs, const MonthDeltaWeek &rhs)
{
    return lhs.nth == rhs.nth && lhs.weekid == rhs.weekid && lhs.day == rhs.day;
}

bool operator==(const YearDelta &lhs, const YearDelta &rhs)
{
    return lhs.nth == rhs.nth;
}

SimpleDate nextOccurrence(const SimpleDate &date, const DayDelta &delta)
{
    return date + Duration::days(delta.nth);
}

SimpleDate nextOccurrence(const SimpleDate &date, const WeekDelta &delta)
{
    SimpleDate end = date;
    if (!delta.on.empty()) {
        end = alignToWeekday(end, delta.on.back());
    }
    return end + Duration::weeks(delta.nth);
}

SimpleDate nextOccurrence(const SimpleDate &date, const MonthDeltaDate &delta)
{
    quint64 minDay = date.day;
    quint64 maxDay = date.day;
    if (!delta.days.empty()) {
        const auto range = std::minmax_element(delta.days.begin(), delta.days.end());
        minDay = *range.first;
        maxDay = *range.second;
    }

    SimpleDate end = date + Duration::months(monthsToAdvance(delta.nth, date.day >= minDay));
    end.day = std::min(maxDay, daysInMonth(end.year, end.month));
    return end;
}

SimpleDate nextOccurrence(const SimpleDate &date, const MonthDeltaWeek &delta)
{
    const SimpleDate anchor = weekdayInMonth(date.year, date.month, delta.day, delta.weekid);

    const SimpleDate target = date + Duration::months(monthsToAdvance(delta.nth, date.day >= anchor.day));
    return weekdayInMonth(target.year, target.month, delta.day, delta.weekid);
}

SimpleDate nextOccurrence(const SimpleDate &date, const MonthDelta &delta)
{
    return std::visit([&date](const auto &monthly) { return nextOccurrence(date, monthly); }, delta);
}

SimpleDate nextOccurrence(const SimpleDate &date, const YearDelta &delta)
{
    return date + Duration::years(delta.nth);
}

SimpleDate nextOccurrence(const SimpleDate &date, const RepDelta &delta)
{
    return std::visit([&date](const auto &step) { return nextOccurrence(date, step); }, delta);
}

SimpleDate operator+(const SimpleDate &date, const RepDelta &delta)
{
    return nextOccurrence(date, delta);
}

} // namespace core
} // namespace cadence
