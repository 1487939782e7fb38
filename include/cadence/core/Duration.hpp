#pragma once

#include <QtGlobal>

namespace cadence {
namespace core {

// Calendar-relative offset in a single unit. The magnitude is never negative;
// direction comes from whether it is added to or subtracted from a date.
struct Duration
{
    enum class Unit
    {
        Day,
        Week,
        Month,
        Year,
    };

    Unit unit = Unit::Day;
    quint64 count = 0;

    static Duration days(quint64 n) { return {Unit::Day, n}; }
    static Duration weeks(quint64 n) { return {Unit::Week, n}; }
    static Duration months(quint64 n) { return {Unit::Month, n}; }
    static Duration years(quint64 n) { return {Unit::Year, n}; }
};

inline bool operator==(const Duration &lhs, const Duration &rhs)
{
    return lhs.unit == rhs.unit && lhs.count == rhs.count;
}

inline bool operator!=(const Duration &lhs, const Duration &rhs)
{
    return !(lhs == rhs);
}

} // namespace core
} // namespace cadence
