#pragma once

#include <QtGlobal>
#include <variant>
#include <vector>

#include "cadence/core/SimpleDate.hpp"
#include "cadence/core/Weekday.hpp"

namespace cadence {
namespace core {

struct DayDelta
{
    quint64 nth = 1;
};

// Steps land on the last weekday of `on`.
struct WeekDelta
{
    quint64 nth = 1;
    std::vector<Weekday> on;
};

struct MonthDeltaDate
{
    quint64 nth = 1;
    std::vector<quint64> days;
};

// weekid is zero based: 0 is the first occurrence of `day` in the month.
struct MonthDeltaWeek
{
    quint64 nth = 1;
    quint64 weekid = 0;
    Weekday day = Weekday::Monday;
};

constexpr quint64 MaxWeekId = 4;

using MonthDelta = std::variant<MonthDeltaDate, MonthDeltaWeek>;

struct YearDelta
{
    quint64 nth = 1;
};

using RepDelta = std::variant<DayDelta, WeekDelta, MonthDelta, YearDelta>;

bool operator==(const DayDelta &lhs, const DayDelta &rhs);
bool operator==(const WeekDelta &lhs, const WeekDelta &rhs);
bool operator==(const MonthDeltaDate &lhs, const MonthDeltaDate &rhs);
bool operator==(const MonthDeltaWeek &lhs, const MonthDeltaWeek &rhs);
bool operator==(const YearDelta &lhs, const YearDelta &rhs);

// Advances the date by one recurrence step.
SimpleDate nextOccurrence(const SimpleDate &date, const DayDelta &delta);
SimpleDate nextOccurrence(const SimpleDate &date, const WeekDelta &delta);
SimpleDate nextOccurrence(const SimpleDate &date, const MonthDeltaDate &delta);
SimpleDate nextOccurrence(const SimpleDate &date, const MonthDeltaWeek &delta);
SimpleDate nextOccurrence(const SimpleDate &date, const MonthDelta &delta);
SimpleDate nextOccurrence(const SimpleDate &date, const YearDelta &delta);
SimpleDate nextOccurrence(const SimpleDate &date, const RepDelta &delta);

SimpleDate operator+(const SimpleDate &date, const RepDelta &delta);

} // namespace core
} // namespace cadence
