#include "cadence/core/SimpleDate.hpp"

#include "cadence/core/Calendar.hpp"

#include <QRegularExpression>
#include <algorithm>

namespace cadence {
namespace core {

namespace {
// Folds a month count above 12 into whole years, keeping 12 as December.
void normalizeMonth(quint64 &year, quint64 &month)
{
    quint64 extraYears = month / 12;
    quint64 relativeMonth = month % 12;
    if (relativeMonth == 0) {
        extraYears -= 1;
        relativeMonth = 12;
    }
    year += extraYears;
    month = relativeMonth;
}
} // namespace

SimpleDate SimpleDate::fromYmd(quint64 year, quint64 month, quint64 day)
{
    SimpleDate date;
    date.year = year;
    date.month = month;
    date.day = day;
    return date;
}

std::optional<SimpleDate> SimpleDate::fromString(const QString &text, DateError *error)
{
    static const QRegularExpression pattern(QStringLiteral("^(\\d+)-(\\d+)-(\\d+)$"));
    const auto match = pattern.match(text.trimmed());
    if (!match.hasMatch()) {
        setDateError(error, QStringLiteral("invalid date"));
        return std::nullopt;
    }

    bool yearOk = false;
    bool monthOk = false;
    bool dayOk = false;
    const quint64 year = match.captured(1).toULongLong(&yearOk);
    const quint64 month = match.captured(2).toULongLong(&monthOk);
    const quint64 day = match.captured(3).toULongLong(&dayOk);
    if (!yearOk || !monthOk || !dayOk) {
        setDateError(error, QStringLiteral("invalid date"));
        return std::nullopt;
    }
    if (month < 1 || month > 12) {
        setDateError(error, QStringLiteral("invalid month"));
        return std::nullopt;
    }
    if (day < 1 || day > daysInMonth(year, month)) {
        setDateError(error, QStringLiteral("invalid date"));
        return std::nullopt;
    }
    return fromYmd(year, month, day);
}

SimpleDate SimpleDate::fromQDate(const QDate &date)
{
    return fromYmd(static_cast<quint64>(date.year()),
                   static_cast<quint64>(date.month()),
                   static_cast<quint64>(date.day()));
}

SimpleDate SimpleDate::today()
{
    return fromQDate(QDate::currentDate());
}

QDate SimpleDate::toQDate() const
{
    return QDate(static_cast<int>(year), static_cast<int>(month), static_cast<int>(day));
}

QString SimpleDate::toString() const
{
    return QStringLiteral("%1-%2-%3")
        .arg(year, 4, 10, QLatin1Char('0'))
        .arg(month, 2, 10, QLatin1Char('0'))
        .arg(day, 2, 10, QLatin1Char('0'));
}

bool operator==(const SimpleDate &lhs, const SimpleDate &rhs)
{
    return lhs.year == rhs.year && lhs.month == rhs.month && lhs.day == rhs.day;
}

bool operator!=(const SimpleDate &lhs, const SimpleDate &rhs)
{
    return !(lhs == rhs);
}

bool operator<(const SimpleDate &lhs, const SimpleDate &rhs)
{
    if (lhs.year != rhs.year) {
        return lhs.year < rhs.year;
    }
    if (lhs.month != rhs.month) {
        return lhs.month < rhs.month;
    }
    return lhs.day < rhs.day;
}

bool operator>(const SimpleDate &lhs, const SimpleDate &rhs)
{
    return rhs < lhs;
}

bool operator<=(const SimpleDate &lhs, const SimpleDate &rhs)
{
    return !(rhs < lhs);
}

bool operator>=(const SimpleDate &lhs, const SimpleDate &rhs)
{
    return !(lhs < rhs);
}

SimpleDate operator+(const SimpleDate &date, const Duration &duration)
{
    quint64 year = date.year;
    quint64 month = date.month;
    quint64 day = date.day;

    switch (duration.unit) {
    case Duration::Unit::Day:
        day += duration.count;
        break;
    case Duration::Unit::Week:
        day += duration.count * 7;
        break;
    case Duration::Unit::Month:
        month += duration.count;
        break;
    case Duration::Unit::Year:
        year += duration.count;
        break;
    }

    // A day back at its starting value stops rolling over and is clamped
    // below, so 03-31 + 31 days ends on 04-30.
    for (;;) {
        normalizeMonth(year, month);
        if (day == date.day || day <= daysInMonth(year, month)) {
            break;
        }
        day -= daysInMonth(year, month);
        ++month;
    }

    return SimpleDate::fromYmd(year, month, std::min(day, daysInMonth(year, month)));
}

SimpleDate operator-(const SimpleDate &date, const Duration &duration)
{
    quint64 year = date.year;
    quint64 month = date.month;
    quint64 day = date.day;

    quint64 daysToSub = 0;
    quint64 monthsToSub = 0;
    switch (duration.unit) {
    case Duration::Unit::Day:
        daysToSub = duration.count;
        break;
    case Duration::Unit::Week:
        daysToSub = duration.count * 7;
        break;
    case Duration::Unit::Month:
        monthsToSub = duration.count;
        break;
    case Duration::Unit::Year:
        year -= duration.count;
        break;
    }

    for (quint64 i = 0; i < daysToSub; ++i) {
        --day;
        if (day == 0) {
            --month;
            if (month == 0) {
                --year;
                month = 12;
            }
            day = daysInMonth(year, month);
        }
    }

    for (quint64 i = 0; i < monthsToSub; ++i) {
        --month;
        if (month == 0) {
            --year;
            month = 12;
        }
    }

    return SimpleDate::fromYmd(year, month, std::min(day, daysInMonth(year, month)));
}

} // namespace core
} // namespace cadence
