#pragma once

namespace cadence {
namespace core {

enum class Weekday
{
    Monday,
    Tuesday,
    Wednesday,
    Thursday,
    Friday,
    Saturday,
    Sunday,
};

constexpr int WeekdayCount = 7;

} // namespace core
} // namespace cadence
