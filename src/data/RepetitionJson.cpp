#include "cadence/data/RepetitionJson.hpp"

#include "cadence/core/Calendar.hpp"
#include "cadence/text/Display.hpp"

#include <QJsonArray>

namespace cadence {
namespace data {

namespace {
// Largest integer a JSON number (double) holds exactly.
constexpr quint64 MaxJsonInteger = (quint64(1) << 53);

QJsonValue unsignedValue(quint64 value)
{
    return QJsonValue(static_cast<qint64>(value));
}

std::optional<quint64> readUnsigned(const QJsonValue &value)
{
    if (!value.isDouble()) {
        return std::nullopt;
    }
    const double number = value.toDouble();
    if (number < 0 || number > static_cast<double>(MaxJsonInteger)) {
        return std::nullopt;
    }
    const auto integer = static_cast<quint64>(number);
    if (static_cast<double>(integer) != number) {
        return std::nullopt;
    }
    return integer;
}

std::optional<quint64> readField(const QJsonObject &object, const char *name)
{
    return readUnsigned(object.value(QLatin1String(name)));
}

// Single-key object {"Tag": payload} as used for enum variants.
bool splitVariant(const QJsonValue &value, QString *tag, QJsonValue *payload)
{
    if (!value.isObject()) {
        return false;
    }
    const QJsonObject object = value.toObject();
    if (object.size() != 1) {
        return false;
    }
    *tag = object.constBegin().key();
    *payload = object.constBegin().value();
    return true;
}

QJsonObject variant(const char *tag, const QJsonValue &payload)
{
    QJsonObject object;
    object.insert(QLatin1String(tag), payload);
    return object;
}

struct DeltaEncoder
{
    QJsonObject operator()(const core::DayDelta &delta) const
    {
        QJsonObject payload;
        payload.insert(QStringLiteral("nth"), unsignedValue(delta.nth));
        return variant("Day", payload);
    }

    QJsonObject operator()(const core::WeekDelta &delta) const
    {
        QJsonArray on;
        for (const auto day : delta.on) {
            on.append(toJson(day));
        }
        QJsonObject payload;
        payload.insert(QStringLiteral("nth"), unsignedValue(delta.nth));
        payload.insert(QStringLiteral("on"), on);
        return variant("Week", payload);
    }

    QJsonObject operator()(const core::MonthDelta &delta) const
    {
        if (const auto *onDate = std::get_if<core::MonthDeltaDate>(&delta)) {
            QJsonArray days;
            for (const auto day : onDate->days) {
                days.append(unsignedValue(day));
            }
            QJsonObject payload;
            payload.insert(QStringLiteral("nth"), unsignedValue(onDate->nth));
            payload.insert(QStringLiteral("days"), days);
            return variant("Month", variant("OnDate", payload));
        }

        const auto &onWeek = std::get<core::MonthDeltaWeek>(delta);
        QJsonObject payload;
        payload.insert(QStringLiteral("nth"), unsignedValue(onWeek.nth));
        payload.insert(QStringLiteral("weekid"), unsignedValue(onWeek.weekid));
        payload.insert(QStringLiteral("day"), toJson(onWeek.day));
        return variant("Month", variant("OnWeek", payload));
    }

    QJsonObject operator()(const core::YearDelta &delta) const
    {
        QJsonObject payload;
        payload.insert(QStringLiteral("nth"), unsignedValue(delta.nth));
        return variant("Year", payload);
    }
};

template<typename T>
std::optional<T> malformed(core::DateError *error, const char *what)
{
    core::setDateError(error, QStringLiteral("malformed %1").arg(QLatin1String(what)));
    return std::nullopt;
}

std::optional<core::RepDelta> monthDeltaFromJson(const QJsonValue &value, core::DateError *error)
{
    QString tag;
    QJsonValue payload;
    if (!splitVariant(value, &tag, &payload) || !payload.isObject()) {
        return malformed<core::RepDelta>(error, "month delta");
    }
    const QJsonObject object = payload.toObject();
    const auto nth = readField(object, "nth");
    if (!nth) {
        return malformed<core::RepDelta>(error, "month delta");
    }

    if (tag == QLatin1String("OnDate")) {
        const QJsonValue daysValue = object.value(QStringLiteral("days"));
        if (!daysValue.isArray()) {
            return malformed<core::RepDelta>(error, "month delta");
        }
        core::MonthDeltaDate delta;
        delta.nth = *nth;
        for (const auto &entry : daysValue.toArray()) {
            const auto day = readUnsigned(entry);
            if (!day || *day < 1 || *day > 31) {
                return malformed<core::RepDelta>(error, "month delta");
            }
            delta.days.push_back(*day);
        }
        return core::RepDelta(core::MonthDelta(delta));
    }

    if (tag == QLatin1String("OnWeek")) {
        const auto weekid = readField(object, "weekid");
        const auto day = weekdayFromJson(object.value(QStringLiteral("day")), error);
        if (!weekid || *weekid > core::MaxWeekId || !day) {
            return malformed<core::RepDelta>(error, "month delta");
        }
        core::MonthDeltaWeek delta;
        delta.nth = *nth;
        delta.weekid = *weekid;
        delta.day = *day;
        return core::RepDelta(core::MonthDelta(delta));
    }

    return malformed<core::RepDelta>(error, "month delta");
}
} // namespace

QJsonObject toJson(const core::SimpleDate &date)
{
    QJsonObject object;
    object.insert(QStringLiteral("year"), unsignedValue(date.year));
    object.insert(QStringLiteral("month"), unsignedValue(date.month));
    object.insert(QStringLiteral("day"), unsignedValue(date.day));
    return object;
}

QJsonValue toJson(core::Weekday weekday)
{
    return text::toString(weekday);
}

QJsonObject toJson(const core::RepDelta &delta)
{
    return std::visit(DeltaEncoder{}, delta);
}

QJsonValue toJson(const core::RepEnd &end)
{
    switch (end.kind()) {
    case core::RepEnd::Kind::Date:
        return variant("Date", toJson(end.date()));
    case core::RepEnd::Kind::Count:
        return variant("Count", unsignedValue(end.count()));
    case core::RepEnd::Kind::Never:
    default:
        return QStringLiteral("Never");
    }
}

QJsonObject toJson(const core::Repetition &repetition)
{
    QJsonObject object;
    object.insert(QStringLiteral("delta"), toJson(repetition.delta));
    object.insert(QStringLiteral("end"), toJson(repetition.end));
    return object;
}

std::optional<core::SimpleDate> simpleDateFromJson(const QJsonValue &value, core::DateError *error)
{
    if (!value.isObject()) {
        return malformed<core::SimpleDate>(error, "date");
    }
    const QJsonObject object = value.toObject();
    const auto year = readField(object, "year");
    const auto month = readField(object, "month");
    const auto day = readField(object, "day");
    if (!year || !month || !day) {
        return malformed<core::SimpleDate>(error, "date");
    }
    if (*month < 1 || *month > 12) {
        core::setDateError(error, QStringLiteral("invalid month"));
        return std::nullopt;
    }
    if (*day < 1 || *day > core::daysInMonth(*year, *month)) {
        core::setDateError(error, QStringLiteral("invalid date"));
        return std::nullopt;
    }
    return core::SimpleDate::fromYmd(*year, *month, *day);
}

std::optional<core::Weekday> weekdayFromJson(const QJsonValue &value, core::DateError *error)
{
    if (value.isString()) {
        const QString name = value.toString();
        for (int i = 0; i < core::WeekdayCount; ++i) {
            const auto weekday = static_cast<core::Weekday>(i);
            if (name == text::toString(weekday)) {
                return weekday;
            }
        }
    }
    return malformed<core::Weekday>(error, "weekday");
}

std::optional<core::RepDelta> repDeltaFromJson(const QJsonValue &value, core::DateError *error)
{
    QString tag;
    QJsonValue payload;
    if (!splitVariant(value, &tag, &payload)) {
        return malformed<core::RepDelta>(error, "delta");
    }

    if (tag == QLatin1String("Month")) {
        return monthDeltaFromJson(payload, error);
    }

    const QJsonObject object = payload.toObject();
    const auto nth = readField(object, "nth");
    if (!payload.isObject() || !nth) {
        return malformed<core::RepDelta>(error, "delta");
    }

    if (tag == QLatin1String("Day")) {
        return core::RepDelta(core::DayDelta{*nth});
    }
    if (tag == QLatin1String("Year")) {
        return core::RepDelta(core::YearDelta{*nth});
    }
    if (tag == QLatin1String("Week")) {
        const QJsonValue onValue = object.value(QStringLiteral("on"));
        if (!onValue.isArray()) {
            return malformed<core::RepDelta>(error, "delta");
        }
        core::WeekDelta delta;
        delta.nth = *nth;
        for (const auto &entry : onValue.toArray()) {
            const auto day = weekdayFromJson(entry, error);
            if (!day) {
                return std::nullopt;
            }
            delta.on.push_back(*day);
        }
        return core::RepDelta(delta);
    }

    return malformed<core::RepDelta>(error, "delta");
}

std::optional<core::RepEnd> repEndFromJson(const QJsonValue &value, core::DateError *error)
{
    if (value.isString()) {
        if (value.toString() == QLatin1String("Never")) {
            return core::RepEnd::never();
        }
        return malformed<core::RepEnd>(error, "end");
    }

    QString tag;
    QJsonValue payload;
    if (!splitVariant(value, &tag, &payload)) {
        return malformed<core::RepEnd>(error, "end");
    }
    if (tag == QLatin1String("Date")) {
        const auto date = simpleDateFromJson(payload, error);
        if (!date) {
            return std::nullopt;
        }
        return core::RepEnd::until(*date);
    }
    if (tag == QLatin1String("Count")) {
        const auto count = readUnsigned(payload);
        if (!count) {
            return malformed<core::RepEnd>(error, "end");
        }
        return core::RepEnd::afterCount(*count);
    }
    return malformed<core::RepEnd>(error, "end");
}

std::optional<core::Repetition> repetitionFromJson(const QJsonValue &value, core::DateError *error)
{
    if (!value.isObject()) {
        return malformed<core::Repetition>(error, "repetition");
    }
    const QJsonObject object = value.toObject();
    const auto delta = repDeltaFromJson(object.value(QStringLiteral("delta")), error);
    if (!delta) {
        return std::nullopt;
    }
    const auto end = repEndFromJson(object.value(QStringLiteral("end")), error);
    if (!end) {
        return std::nullopt;
    }
    return core::Repetition{*delta, *end};
}

} // namespace data
} // namespace cadence
