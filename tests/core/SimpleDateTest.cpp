#include <QtTest/QtTest>

#include "cadence/core/Calendar.hpp"
#include "cadence/core/SimpleDate.hpp"

using namespace cadence::core;

namespace {
SimpleDate ymd(quint64 year, quint64 month, quint64 day)
{
    return SimpleDate::fromYmd(year, month, day);
}
} // namespace

class SimpleDateTest : public QObject
{
    Q_OBJECT

private slots:
    void ordering();
    void formatting();
    void parsesIsoDates();
    void rejectsInvalidDates_data();
    void rejectsInvalidDates();
    void addDaysMatchesQDate();
    void addDaysClampsOnStartingDay();
    void addWeeksCrossesYear();
    void addMonthsClampsDay();
    void addYearsFromLeapDay();
    void subtractDaysMatchesQDate();
    void subtractMonthsClampsDay();
    void subtractYears();
    void monthRoundTripIsLossy();
    void qdateConversion();
};

void SimpleDateTest::ordering()
{
    QVERIFY(ymd(2020, 1, 1) < ymd(2020, 1, 2));
    QVERIFY(ymd(2020, 1, 31) < ymd(2020, 2, 1));
    QVERIFY(ymd(2019, 12, 31) < ymd(2020, 1, 1));
    QVERIFY(ymd(2021, 1, 1) > ymd(2020, 12, 31));
    QVERIFY(ymd(2020, 5, 5) <= ymd(2020, 5, 5));
    QVERIFY(ymd(2020, 5, 5) >= ymd(2020, 5, 5));
    QVERIFY(ymd(2020, 5, 5) == ymd(2020, 5, 5));
    QVERIFY(ymd(2020, 5, 5) != ymd(2020, 5, 6));
}

void SimpleDateTest::formatting()
{
    QCOMPARE(ymd(2020, 2, 9).toString(), QStringLiteral("2020-02-09"));
    QCOMPARE(ymd(987, 11, 30).toString(), QStringLiteral("0987-11-30"));
    QCOMPARE(ymd(9999, 12, 31).toString(), QStringLiteral("9999-12-31"));
}

void SimpleDateTest::parsesIsoDates()
{
    DateError error;
    const auto date = SimpleDate::fromString(QStringLiteral(" 2024-02-29\n"), &error);
    QVERIFY(date.has_value());
    QCOMPARE(*date, ymd(2024, 2, 29));
    QVERIFY(error.message.isEmpty());

    QCOMPARE(*SimpleDate::fromString(QStringLiteral("2021-7-4")), ymd(2021, 7, 4));
}

void SimpleDateTest::rejectsInvalidDates_data()
{
    QTest::addColumn<QString>("text");
    QTest::addColumn<QString>("message");

    QTest::newRow("month 13") << QStringLiteral("2021-13-01") << QStringLiteral("invalid month");
    QTest::newRow("month 0") << QStringLiteral("2021-00-10") << QStringLiteral("invalid month");
    QTest::newRow("february 29") << QStringLiteral("2021-02-29") << QStringLiteral("invalid date");
    QTest::newRow("april 31") << QStringLiteral("2021-04-31") << QStringLiteral("invalid date");
    QTest::newRow("day 0") << QStringLiteral("2021-04-00") << QStringLiteral("invalid date");
    QTest::newRow("garbage") << QStringLiteral("tomorrow") << QStringLiteral("invalid date");
    QTest::newRow("slashes") << QStringLiteral("2021/04/01") << QStringLiteral("invalid date");
}

void SimpleDateTest::rejectsInvalidDates()
{
    QFETCH(QString, text);
    QFETCH(QString, message);

    DateError error;
    QVERIFY(!SimpleDate::fromString(text, &error).has_value());
    QCOMPARE(error.message, message);
    QVERIFY(!SimpleDate::fromString(text).has_value());
}

void SimpleDateTest::addDaysMatchesQDate()
{
    // Days 1..28 exist in every month, so the rollover never has to clamp.
    const QList<SimpleDate> starts = {ymd(2019, 1, 15), ymd(2020, 2, 28), ymd(2020, 12, 25), ymd(2021, 3, 1),
                                      ymd(1999, 12, 28)};
    for (const auto &start : starts) {
        for (quint64 offset = 0; offset <= 800; ++offset) {
            const SimpleDate result = start + Duration::days(offset);
            QCOMPARE(result.toQDate(), start.toQDate().addDays(static_cast<qint64>(offset)));
        }
    }
}

void SimpleDateTest::addDaysClampsOnStartingDay()
{
    // Rolling over stops once the day is back at its starting value.
    QCOMPARE(ymd(2021, 3, 31) + Duration::days(31), ymd(2021, 4, 30));
    QCOMPARE(ymd(2021, 1, 31) + Duration::days(31), ymd(2021, 2, 28));
    QCOMPARE(ymd(2020, 1, 30) + Duration::days(31), ymd(2020, 2, 29));
    QCOMPARE(ymd(2021, 1, 31) + Duration::days(59), ymd(2021, 3, 31));

    // Without a match on the starting day the rollover continues.
    QCOMPARE(ymd(2021, 1, 31) + Duration::days(30), ymd(2021, 3, 2));
    QCOMPARE(ymd(2021, 3, 31) + Duration::days(1), ymd(2021, 4, 1));
}

void SimpleDateTest::addWeeksCrossesYear()
{
    QCOMPARE(ymd(2020, 12, 1) + Duration::weeks(5), ymd(2021, 1, 5));
    QCOMPARE(ymd(2020, 2, 22) + Duration::weeks(1), ymd(2020, 2, 29));
    QCOMPARE(ymd(2021, 2, 22) + Duration::weeks(1), ymd(2021, 3, 1));
}

void SimpleDateTest::addMonthsClampsDay()
{
    QCOMPARE(ymd(2020, 1, 31) + Duration::months(1), ymd(2020, 2, 29));
    QCOMPARE(ymd(2021, 1, 31) + Duration::months(1), ymd(2021, 2, 28));
    QCOMPARE(ymd(2019, 1, 31) + Duration::months(13), ymd(2020, 2, 29));
    QCOMPARE(ymd(2020, 11, 15) + Duration::months(2), ymd(2021, 1, 15));
    QCOMPARE(ymd(2020, 12, 15) + Duration::months(12), ymd(2021, 12, 15));
    QCOMPARE(ymd(2020, 3, 31) + Duration::months(1), ymd(2020, 4, 30));
}

void SimpleDateTest::addYearsFromLeapDay()
{
    QCOMPARE(ymd(2020, 2, 29) + Duration::years(1), ymd(2021, 2, 28));
    QCOMPARE(ymd(2020, 2, 29) + Duration::years(4), ymd(2024, 2, 29));
    QCOMPARE(ymd(2096, 2, 29) + Duration::years(4), ymd(2100, 2, 28));
}

void SimpleDateTest::subtractDaysMatchesQDate()
{
    const QList<SimpleDate> starts = {ymd(2020, 3, 1), ymd(2021, 1, 1), ymd(2000, 3, 31)};
    for (const auto &start : starts) {
        for (quint64 offset = 0; offset <= 800; ++offset) {
            const SimpleDate result = start - Duration::days(offset);
            QCOMPARE(result.toQDate(), start.toQDate().addDays(-static_cast<qint64>(offset)));
        }
    }
    QCOMPARE(ymd(2021, 1, 5) - Duration::weeks(5), ymd(2020, 12, 1));
}

void SimpleDateTest::subtractMonthsClampsDay()
{
    QCOMPARE(ymd(2020, 3, 31) - Duration::months(1), ymd(2020, 2, 29));
    QCOMPARE(ymd(2021, 1, 15) - Duration::months(2), ymd(2020, 11, 15));
    QCOMPARE(ymd(2021, 5, 31) - Duration::months(17), ymd(2019, 12, 31));
}

void SimpleDateTest::subtractYears()
{
    QCOMPARE(ymd(2024, 2, 29) - Duration::years(1), ymd(2023, 2, 28));
    QCOMPARE(ymd(2024, 6, 1) - Duration::years(24), ymd(2000, 6, 1));
}

void SimpleDateTest::monthRoundTripIsLossy()
{
    const SimpleDate start = ymd(2021, 1, 31);
    const SimpleDate there = start + Duration::months(1);
    QCOMPARE(there, ymd(2021, 2, 28));
    QCOMPARE(there - Duration::months(1), ymd(2021, 1, 28));

    const SimpleDate mid = ymd(2021, 1, 15);
    QCOMPARE((mid + Duration::months(1)) - Duration::months(1), mid);
}

void SimpleDateTest::qdateConversion()
{
    const QDate qdate(2023, 10, 7);
    const SimpleDate date = SimpleDate::fromQDate(qdate);
    QCOMPARE(date, ymd(2023, 10, 7));
    QCOMPARE(date.toQDate(), qdate);
    QCOMPARE(SimpleDate::today().toQDate(), QDate::currentDate());
}

QTEST_GUILESS_MAIN(SimpleDateTest)
#include "SimpleDateTest.moc"
