#include <QtTest/QtTest>

#include "cadence/core/Calendar.hpp"

using namespace cadence::core;

Q_DECLARE_METATYPE(cadence::core::Weekday)

class CalendarTest : public QObject
{
    Q_OBJECT

private slots:
    void daysInMonthTable_data();
    void daysInMonthTable();
    void februaryFollowsLeapRule();
    void weekdayOfKnownDates_data();
    void weekdayOfKnownDates();
    void weekdayAdvancesDaily();
};

void CalendarTest::daysInMonthTable_data()
{
    QTest::addColumn<quint64>("month");
    QTest::addColumn<quint64>("days");

    QTest::newRow("january") << quint64(1) << quint64(31);
    QTest::newRow("march") << quint64(3) << quint64(31);
    QTest::newRow("april") << quint64(4) << quint64(30);
    QTest::newRow("may") << quint64(5) << quint64(31);
    QTest::newRow("june") << quint64(6) << quint64(30);
    QTest::newRow("july") << quint64(7) << quint64(31);
    QTest::newRow("august") << quint64(8) << quint64(31);
    QTest::newRow("september") << quint64(9) << quint64(30);
    QTest::newRow("october") << quint64(10) << quint64(31);
    QTest::newRow("november") << quint64(11) << quint64(30);
    QTest::newRow("december") << quint64(12) << quint64(31);
}

void CalendarTest::daysInMonthTable()
{
    QFETCH(quint64, month);
    QFETCH(quint64, days);

    QCOMPARE(daysInMonth(2019, month), days);
    QCOMPARE(daysInMonth(2020, month), days);
}

void CalendarTest::februaryFollowsLeapRule()
{
    for (quint64 year = 1600; year <= 2400; ++year) {
        const bool leap = year % 4 == 0 && (year % 100 != 0 || year % 400 == 0);
        QCOMPARE(daysInMonth(year, 2), leap ? quint64(29) : quint64(28));
        QCOMPARE(isLeapYear(year), leap);
    }
    QCOMPARE(daysInMonth(1900, 2), quint64(28));
    QCOMPARE(daysInMonth(2000, 2), quint64(29));
}

void CalendarTest::weekdayOfKnownDates_data()
{
    QTest::addColumn<quint64>("year");
    QTest::addColumn<quint64>("month");
    QTest::addColumn<quint64>("day");
    QTest::addColumn<Weekday>("weekday");

    QTest::newRow("moon landing") << quint64(1969) << quint64(7) << quint64(20) << Weekday::Sunday;
    QTest::newRow("y2k") << quint64(2000) << quint64(1) << quint64(1) << Weekday::Saturday;
    QTest::newRow("leap day 2000") << quint64(2000) << quint64(2) << quint64(29) << Weekday::Tuesday;
    QTest::newRow("march 1700") << quint64(1700) << quint64(3) << quint64(1) << Weekday::Monday;
    QTest::newRow("new year 1701") << quint64(1701) << quint64(1) << quint64(1) << Weekday::Saturday;
    QTest::newRow("end of 9999") << quint64(9999) << quint64(12) << quint64(31) << Weekday::Friday;
}

void CalendarTest::weekdayOfKnownDates()
{
    QFETCH(quint64, year);
    QFETCH(quint64, month);
    QFETCH(quint64, day);
    QFETCH(Weekday, weekday);

    QCOMPARE(weekdayOfDate(SimpleDate::fromYmd(year, month, day)), weekday);
}

void CalendarTest::weekdayAdvancesDaily()
{
    SimpleDate date = SimpleDate::fromYmd(1899, 12, 25);
    const SimpleDate last = SimpleDate::fromYmd(2101, 1, 10);
    Weekday previous = weekdayOfDate(date);
    while (date < last) {
        date = date + Duration::days(1);
        const Weekday current = weekdayOfDate(date);
        QCOMPARE(static_cast<int>(current), (static_cast<int>(previous) + 1) % WeekdayCount);
        QCOMPARE(static_cast<int>(current) + 1, date.toQDate().dayOfWeek());
        QCOMPARE(weekdayOfDate(date + Duration::weeks(1)), current);
        previous = current;
    }
}

QTEST_GUILESS_MAIN(CalendarTest)
#include "CalendarTest.moc"
