#pragma once

#include <QString>

#include "cadence/core/Duration.hpp"
#include "cadence/core/RepDelta.hpp"
#include "cadence/core/Repetition.hpp"
#include "cadence/core/Weekday.hpp"

namespace cadence {
namespace text {

// Human readable English, not meant to be parsed back.
QString toString(const core::Duration &duration);
QString toString(core::Weekday weekday);
QString toString(const core::DayDelta &delta);
QString toString(const core::WeekDelta &delta);
QString toString(const core::MonthDeltaDate &delta);
QString toString(const core::MonthDeltaWeek &delta);
QString toString(const core::MonthDelta &delta);
QString toString(const core::YearDelta &delta);
QString toString(const core::RepDelta &delta);
QString toString(const core::RepEnd &end);
QString toString(const core::Repetition &repetition);

QString ordinalSuffix(quint64 day);
QString weekIdName(quint64 weekid);

} // namespace text
} // namespace cadence
