#pragma once

#include <QString>
#include <optional>

#include "cadence/core/DateError.hpp"
#include "cadence/core/RepDelta.hpp"
#include "cadence/core/Repetition.hpp"
#include "cadence/core/SimpleDate.hpp"

namespace cadence {
namespace text {

// Each parser accepts a small fixed set of English phrases, case-insensitive:
//   day:   "daily", "every day", "every N days", "N days"
//   week:  "weekly", "fortnightly", "every N weeks", "N weeks",
//          optionally followed by "on <weekday list>"
//   month: "monthly", "quarterly", "every N months", "N months",
//          optionally followed by "on <day list>" or "on the <ordinal> <weekday>"
//   year:  "annually", "yearly", "every year", "every N years", "N years"
// On failure std::nullopt is returned and *error describes the problem.
std::optional<core::DayDelta> parseDayDelta(const QString &text, core::DateError *error = nullptr);
std::optional<core::WeekDelta> parseWeekDelta(const QString &text,
                                              const core::SimpleDate &reference,
                                              core::DateError *error = nullptr);
std::optional<core::MonthDelta> parseMonthDelta(const QString &text,
                                                const core::SimpleDate &reference,
                                                core::DateError *error = nullptr);
std::optional<core::YearDelta> parseYearDelta(const QString &text, core::DateError *error = nullptr);

// "never" or blank, "after N times" style counts, or a YYYY-MM-DD date.
std::optional<core::RepEnd> parseRepEnd(const QString &text, core::DateError *error = nullptr);

// Picks the delta kind from keywords in the text. A blank schedule yields
// std::nullopt without touching *error.
std::optional<core::RepDelta> parseSchedule(const QString &text,
                                            const core::SimpleDate &reference,
                                            core::DateError *error = nullptr);
std::optional<core::Repetition> parseRepetition(const QString &schedule,
                                                const QString &end,
                                                const core::SimpleDate &reference,
                                                core::DateError *error = nullptr);

} // namespace text
} // namespace cadence
