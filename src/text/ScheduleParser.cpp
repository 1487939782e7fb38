#include "cadence/text/ScheduleParser.hpp"

#include "cadence/core/Calendar.hpp"
#include "cadence/core/Logging.hpp"

#include <QRegularExpression>
#include <utility>
#include <vector>

namespace cadence {
namespace text {

namespace {
const QString ScheduleError = QStringLiteral("couldn't parse schedule");
const QString EndingError = QStringLiteral("couldn't parse ending schedule");
const QString IntervalError = QStringLiteral("repeat interval must be positive");
const QString IntervalRangeError = QStringLiteral("repeat interval out of range");

// Multipliers are capped at roughly 9999 years per step in every unit.
constexpr quint64 MaxSpanYears = 9999;
constexpr quint64 MaxDays = MaxSpanYears * 366;
constexpr quint64 MaxWeeks = MaxSpanYears * 53;
constexpr quint64 MaxMonths = MaxSpanYears * 12;
constexpr quint64 MaxYears = MaxSpanYears;

// A phrase either captures the multiplier in its first group or stands for a
// fixed one.
struct PhraseMatcher
{
    QRegularExpression pattern;
    quint64 fixedNth = 0;
};

using PhraseList = std::vector<PhraseMatcher>;

PhraseMatcher capturing(const QString &pattern)
{
    return {QRegularExpression(pattern), 0};
}

PhraseMatcher literal(const QString &phrase, quint64 nth)
{
    return {QRegularExpression(QStringLiteral("^%1$").arg(QRegularExpression::escape(phrase))), nth};
}

QString normalize(const QString &text)
{
    return text.simplified().toLower();
}

// Tries the phrases in order and returns the multiplier of the first match.
std::optional<quint64> matchInterval(const QString &text,
                                     const PhraseList &phrases,
                                     quint64 maxNth,
                                     core::DateError *error)
{
    for (const auto &phrase : phrases) {
        const auto match = phrase.pattern.match(text);
        if (!match.hasMatch()) {
            continue;
        }

        quint64 nth = phrase.fixedNth;
        if (phrase.pattern.captureCount() > 0) {
            bool ok = false;
            nth = match.captured(1).toULongLong(&ok);
            if (!ok) {
                qCInfo(lcCadenceCore) << "multiplier out of range in" << text;
                core::setDateError(error, ScheduleError);
                return std::nullopt;
            }
        }
        if (nth == 0) {
            core::setDateError(error, IntervalError);
            return std::nullopt;
        }
        if (nth > maxNth) {
            qCInfo(lcCadenceCore) << "multiplier" << nth << "exceeds" << maxNth << "in" << text;
            core::setDateError(error, IntervalRangeError);
            return std::nullopt;
        }
        qCDebug(lcCadenceCore) << "schedule" << text << "matched" << phrase.pattern.pattern();
        return nth;
    }

    qCInfo(lcCadenceCore) << "no schedule phrase matches" << text;
    core::setDateError(error, ScheduleError);
    return std::nullopt;
}

const PhraseList &dayPhrases()
{
    static const PhraseList phrases = {
        capturing(QStringLiteral("^every (\\d+) days?$")),
        capturing(QStringLiteral("^(\\d+) days?$")),
        literal(QStringLiteral("daily"), 1),
        literal(QStringLiteral("every day"), 1),
    };
    return phrases;
}

const PhraseList &weekPhrases()
{
    static const PhraseList phrases = {
        capturing(QStringLiteral("^every (\\d+) weeks?$")),
        capturing(QStringLiteral("^(\\d+) weeks?$")),
        literal(QStringLiteral("weekly"), 1),
        literal(QStringLiteral("every week"), 1),
        literal(QStringLiteral("fortnightly"), 2),
    };
    return phrases;
}

const PhraseList &monthPhrases()
{
    static const PhraseList phrases = {
        capturing(QStringLiteral("^every (\\d+) months?$")),
        capturing(QStringLiteral("^(\\d+) months?$")),
        literal(QStringLiteral("monthly"), 1),
        literal(QStringLiteral("every month"), 1),
        literal(QStringLiteral("quarterly"), 3),
    };
    return phrases;
}

const PhraseList &yearPhrases()
{
    static const PhraseList phrases = {
        capturing(QStringLiteral("^every (\\d+) years?$")),
        capturing(QStringLiteral("^(\\d+) years?$")),
        literal(QStringLiteral("annually"), 1),
        literal(QStringLiteral("yearly"), 1),
        literal(QStringLiteral("every year"), 1),
    };
    return phrases;
}

struct WeekdayKey
{
    const char *abbreviation;
    core::Weekday weekday;
};

constexpr WeekdayKey WeekdayKeys[] = {
    {"mon", core::Weekday::Monday},
    {"tue", core::Weekday::Tuesday},
    {"wed", core::Weekday::Wednesday},
    {"thu", core::Weekday::Thursday},
    {"fri", core::Weekday::Friday},
    {"sat", core::Weekday::Saturday},
    {"sun", core::Weekday::Sunday},
};

struct OrdinalKey
{
    const char *word;
    const char *numeral;
    quint64 weekid;
};

constexpr OrdinalKey OrdinalKeys[] = {
    {"first", "1st", 0},
    {"second", "2nd", 1},
    {"third", "3rd", 2},
    {"fourth", "4th", 3},
    {"fifth", "5th", 4},
};

// Splits "<interval> on <qualifier>" into its two halves; the qualifier keeps
// its leading " on ".
std::pair<QString, QString> splitQualifier(const QString &text)
{
    const int index = text.indexOf(QLatin1String(" on "));
    if (index < 0) {
        return {text, QString()};
    }
    return {text.left(index), text.mid(index)};
}

// Every weekday named in the text, Monday first.
std::vector<core::Weekday> weekdaysIn(const QString &text)
{
    std::vector<core::Weekday> days;
    for (const auto &key : WeekdayKeys) {
        if (text.contains(QLatin1String(key.abbreviation))) {
            days.push_back(key.weekday);
        }
    }
    return days;
}

std::optional<quint64> weekIdIn(const QString &text)
{
    for (const auto &key : OrdinalKeys) {
        if (text.contains(QLatin1String(key.word)) || text.contains(QLatin1String(key.numeral))) {
            return key.weekid;
        }
    }
    return std::nullopt;
}

std::optional<std::vector<quint64>> monthDaysIn(const QString &text, core::DateError *error)
{
    static const QRegularExpression number(QStringLiteral("\\d+"));

    std::vector<quint64> days;
    auto it = number.globalMatch(text);
    while (it.hasNext()) {
        const auto match = it.next();
        bool ok = false;
        const quint64 day = match.captured(0).toULongLong(&ok);
        if (!ok || day < 1 || day > 31) {
            core::setDateError(error, ScheduleError);
            return std::nullopt;
        }
        days.push_back(day);
    }
    if (days.empty()) {
        core::setDateError(error, ScheduleError);
        return std::nullopt;
    }
    return days;
}
} // namespace

std::optional<core::DayDelta> parseDayDelta(const QString &text, core::DateError *error)
{
    const auto nth = matchInterval(normalize(text), dayPhrases(), MaxDays, error);
    if (!nth) {
        return std::nullopt;
    }
    return core::DayDelta{*nth};
}

std::optional<core::WeekDelta> parseWeekDelta(const QString &text,
                                              const core::SimpleDate &reference,
                                              core::DateError *error)
{
    const auto parts = splitQualifier(normalize(text));

    std::vector<core::Weekday> days;
    if (parts.second.isEmpty()) {
        days.push_back(core::weekdayOfDate(reference));
    } else {
        days = weekdaysIn(parts.second);
        if (days.empty()) {
            qCInfo(lcCadenceCore) << "no weekday in" << parts.second;
            core::setDateError(error, ScheduleError);
            return std::nullopt;
        }
    }

    const auto nth = matchInterval(parts.first, weekPhrases(), MaxWeeks, error);
    if (!nth) {
        return std::nullopt;
    }

    core::WeekDelta delta;
    delta.nth = *nth;
    delta.on = std::move(days);
    return delta;
}

std::optional<core::MonthDelta> parseMonthDelta(const QString &text,
                                                const core::SimpleDate &reference,
                                                core::DateError *error)
{
    const auto parts = splitQualifier(normalize(text));

    const auto nth = matchInterval(parts.first, monthPhrases(), MaxMonths, error);
    if (!nth) {
        return std::nullopt;
    }

    if (parts.second.isEmpty()) {
        return core::MonthDelta(core::MonthDeltaDate{*nth, {reference.day}});
    }

    const auto weekdays = weekdaysIn(parts.second);
    if (!weekdays.empty()) {
        const auto weekid = weekIdIn(parts.second);
        if (!weekid) {
            qCInfo(lcCadenceCore) << "no ordinal in" << parts.second;
            core::setDateError(error, ScheduleError);
            return std::nullopt;
        }
        core::MonthDeltaWeek delta;
        delta.nth = *nth;
        delta.weekid = *weekid;
        delta.day = weekdays.front();
        return core::MonthDelta(delta);
    }

    auto days = monthDaysIn(parts.second, error);
    if (!days) {
        return std::nullopt;
    }
    return core::MonthDelta(core::MonthDeltaDate{*nth, std::move(*days)});
}

std::optional<core::YearDelta> parseYearDelta(const QString &text, core::DateError *error)
{
    const auto nth = matchInterval(normalize(text), yearPhrases(), MaxYears, error);
    if (!nth) {
        return std::nullopt;
    }
    return core::YearDelta{*nth};
}

std::optional<core::RepEnd> parseRepEnd(const QString &text, core::DateError *error)
{
    const QString normalized = normalize(text);
    if (normalized.isEmpty() || normalized.contains(QLatin1String("never"))) {
        return core::RepEnd::never();
    }

    if (normalized.contains(QLatin1String("after")) || normalized.contains(QLatin1String("times"))
        || normalized.contains(QLatin1String("occurrences")) || normalized.contains(QLatin1String("reps"))) {
        static const QRegularExpression number(QStringLiteral("(\\d+)"));
        const auto match = number.match(normalized);
        if (!match.hasMatch()) {
            core::setDateError(error, EndingError);
            return std::nullopt;
        }
        bool ok = false;
        const quint64 count = match.captured(1).toULongLong(&ok);
        if (!ok) {
            core::setDateError(error, EndingError);
            return std::nullopt;
        }
        return core::RepEnd::afterCount(count);
    }

    static const QRegularExpression datePattern(QStringLiteral("(\\d+)-(\\d+)-(\\d+)"));
    const auto match = datePattern.match(normalized);
    if (!match.hasMatch()) {
        core::setDateError(error, QStringLiteral("invalid end date"));
        return std::nullopt;
    }
    const auto date = core::SimpleDate::fromString(match.captured(0), error);
    if (!date) {
        return std::nullopt;
    }
    return core::RepEnd::until(*date);
}

std::optional<core::RepDelta> parseSchedule(const QString &text,
                                            const core::SimpleDate &reference,
                                            core::DateError *error)
{
    const QString normalized = normalize(text);
    if (normalized.isEmpty()) {
        return std::nullopt;
    }

    if (normalized.contains(QLatin1String("year")) || normalized.contains(QLatin1String("annual"))) {
        const auto delta = parseYearDelta(normalized, error);
        return delta ? std::optional<core::RepDelta>(*delta) : std::nullopt;
    }
    if (normalized.contains(QLatin1String("month")) || normalized.contains(QLatin1String("quarter"))) {
        const auto delta = parseMonthDelta(normalized, reference, error);
        return delta ? std::optional<core::RepDelta>(*delta) : std::nullopt;
    }
    if (normalized.contains(QLatin1String("week")) || normalized.contains(QLatin1String("fortnight"))) {
        const auto delta = parseWeekDelta(normalized, reference, error);
        return delta ? std::optional<core::RepDelta>(*delta) : std::nullopt;
    }
    const auto delta = parseDayDelta(normalized, error);
    return delta ? std::optional<core::RepDelta>(*delta) : std::nullopt;
}

std::optional<core::Repetition> parseRepetition(const QString &schedule,
                                                const QString &end,
                                                const core::SimpleDate &reference,
                                                core::DateError *error)
{
    const auto delta = parseSchedule(schedule, reference, error);
    if (!delta) {
        return std::nullopt;
    }
    const auto repEnd = parseRepEnd(end, error);
    if (!repEnd) {
        return std::nullopt;
    }
    return core::Repetition{*delta, *repEnd};
}

} // namespace text
} // namespace cadence
