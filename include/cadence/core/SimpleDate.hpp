#pragma once

#include <QDate>
#include <QString>
#include <QtGlobal>
#include <optional>

#include "cadence/core/DateError.hpp"
#include "cadence/core/Duration.hpp"

namespace cadence {
namespace core {

// A single proleptic Gregorian calendar day. Arithmetic keeps the day valid
// for the resulting month.
struct SimpleDate
{
    quint64 year = 1970;
    quint64 month = 1;
    quint64 day = 1;

    static SimpleDate fromYmd(quint64 year, quint64 month, quint64 day);
    static std::optional<SimpleDate> fromString(const QString &text, DateError *error = nullptr);
    static SimpleDate fromQDate(const QDate &date);
    static SimpleDate today();

    QDate toQDate() const;
    QString toString() const;
};

bool operator==(const SimpleDate &lhs, const SimpleDate &rhs);
bool operator!=(const SimpleDate &lhs, const SimpleDate &rhs);
bool operator<(const SimpleDate &lhs, const SimpleDate &rhs);
bool operator>(const SimpleDate &lhs, const SimpleDate &rhs);
bool operator<=(const SimpleDate &lhs, const SimpleDate &rhs);
bool operator>=(const SimpleDate &lhs, const SimpleDate &rhs);

// Day and week offsets roll over month ends one month at a time; month and
// year offsets clamp the day to the length of the resulting month. Subtraction
// is not the inverse of addition when clamping occurred.
SimpleDate operator+(const SimpleDate &date, const Duration &duration);
SimpleDate operator-(const SimpleDate &date, const Duration &duration);

} // namespace core
} // namespace cadence
