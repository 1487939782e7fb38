#pragma once

#include <QtGlobal>

#include "cadence/core/SimpleDate.hpp"
#include "cadence/core/Weekday.hpp"

namespace cadence {
namespace core {

// Length of the month in days. month must be within 1..12, anything else is
// fatal.
quint64 daysInMonth(quint64 year, quint64 month);

bool isLeapYear(quint64 year);

// Earliest date weekdayOfDate() is defined for.
SimpleDate firstWeekdayDate();

// Day of the week counted from the 1700-01-01 (Friday) anchor. The unsigned
// year arithmetic is only defined from firstWeekdayDate() onwards.
Weekday weekdayOfDate(const SimpleDate &date);

} // namespace core
} // namespace cadence
