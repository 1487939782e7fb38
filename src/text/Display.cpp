#include "cadence/text/Display.hpp"

#include <QStringList>

namespace cadence {
namespace text {

namespace {
QString plural(quint64 count, const char *singular, const char *pluralForm)
{
    return QStringLiteral("%1 %2").arg(count).arg(QLatin1String(count == 1 ? singular : pluralForm));
}

QString withOrdinal(quint64 day)
{
    return QString::number(day) + ordinalSuffix(day);
}
} // namespace

QString ordinalSuffix(quint64 day)
{
    switch (day) {
    case 1:
    case 21:
    case 31:
        return QStringLiteral("st");
    case 2:
    case 22:
        return QStringLiteral("nd");
    case 3:
    case 23:
        return QStringLiteral("rd");
    default:
        return QStringLiteral("th");
    }
}

QString weekIdName(quint64 weekid)
{
    switch (weekid) {
    case 0:
        return QStringLiteral("first");
    case 1:
        return QStringLiteral("second");
    case 2:
        return QStringLiteral("third");
    case 3:
        return QStringLiteral("fourth");
    case 4:
        return QStringLiteral("fifth");
    default:
        return withOrdinal(weekid + 1);
    }
}

QString toString(const core::Duration &duration)
{
    switch (duration.unit) {
    case core::Duration::Unit::Day:
        return plural(duration.count, "day", "days");
    case core::Duration::Unit::Week:
        return plural(duration.count, "week", "weeks");
    case core::Duration::Unit::Month:
        return plural(duration.count, "month", "months");
    case core::Duration::Unit::Year:
        return plural(duration.count, "year", "years");
    }
    return {};
}

QString toString(core::Weekday weekday)
{
    switch (weekday) {
    case core::Weekday::Monday:
        return QStringLiteral("Monday");
    case core::Weekday::Tuesday:
        return QStringLiteral("Tuesday");
    case core::Weekday::Wednesday:
        return QStringLiteral("Wednesday");
    case core::Weekday::Thursday:
        return QStringLiteral("Thursday");
    case core::Weekday::Friday:
        return QStringLiteral("Friday");
    case core::Weekday::Saturday:
        return QStringLiteral("Saturday");
    case core::Weekday::Sunday:
        return QStringLiteral("Sunday");
    }
    return {};
}

QString toString(const core::DayDelta &delta)
{
    if (delta.nth == 1) {
        return QStringLiteral("day");
    }
    return QStringLiteral("%1 days").arg(delta.nth);
}

QString toString(const core::WeekDelta &delta)
{
    QString result = delta.nth == 1 ? QStringLiteral("week") : QStringLiteral("%1 weeks").arg(delta.nth);
    if (delta.on.empty()) {
        return result;
    }
    QStringList names;
    for (const auto day : delta.on) {
        names << toString(day);
    }
    return result + QStringLiteral(" on ") + names.join(QStringLiteral(", "));
}

QString toString(const core::MonthDeltaDate &delta)
{
    QString result = delta.nth == 1 ? QStringLiteral("month") : QStringLiteral("%1 months").arg(delta.nth);
    if (delta.days.empty()) {
        return result;
    }
    QStringList days;
    for (const auto day : delta.days) {
        days << withOrdinal(day);
    }
    return result + QStringLiteral(" on the ") + days.join(QStringLiteral(", "));
}

QString toString(const core::MonthDeltaWeek &delta)
{
    return QStringLiteral("%1 %2 on the %3 %4")
        .arg(delta.nth)
        .arg(delta.nth == 1 ? QStringLiteral("month") : QStringLiteral("months"))
        .arg(weekIdName(delta.weekid))
        .arg(toString(delta.day));
}

QString toString(const core::MonthDelta &delta)
{
    return std::visit([](const auto &monthly) { return toString(monthly); }, delta);
}

QString toString(const core::YearDelta &delta)
{
    if (delta.nth == 1) {
        return QStringLiteral("year");
    }
    return QStringLiteral("%1 years").arg(delta.nth);
}

QString toString(const core::RepDelta &delta)
{
    return std::visit([](const auto &step) { return toString(step); }, delta);
}

QString toString(const core::RepEnd &end)
{
    switch (end.kind()) {
    case core::RepEnd::Kind::Date:
        return QStringLiteral("ending on %1").arg(end.date().toString());
    case core::RepEnd::Kind::Count:
        return QStringLiteral("ending after %1").arg(plural(end.count(), "occurrence", "occurrences"));
    case core::RepEnd::Kind::Never:
    default:
        return QStringLiteral("never ending");
    }
}

QString toString(const core::Repetition &repetition)
{
    const QString delta = toString(repetition.delta);
    if (repetition.end.isNever()) {
        return delta;
    }
    return delta + QLatin1Char(' ') + toString(repetition.end);
}

} // namespace text
} // namespace cadence
