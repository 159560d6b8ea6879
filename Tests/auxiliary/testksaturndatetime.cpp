/*
    SPDX-FileCopyrightText: 2026 The KSaturn Team

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "testksaturndatetime.h"

#include "time/ksaturndatetime.h"

#include <QtTest>

#include <cmath>

TestKSaturnDateTime::TestKSaturnDateTime() : QObject()
{
}

void TestKSaturnDateTime::calendarToJd_data()
{
    QTest::addColumn<int>("year");
    QTest::addColumn<int>("month");
    QTest::addColumn<double>("day");
    QTest::addColumn<bool>("julian");
    QTest::addColumn<double>("jd");

    QTest::newRow("B1950 equinox") << 1950 << 1 << 1.5 << false << 2433283.0;
    QTest::newRow("J2000") << 2000 << 1 << 1.5 << false << 2451545.0;
    QTest::newRow("1992 Dec 16") << 1992 << 12 << 16.0 << false << 2448972.5;
    QTest::newRow("last Julian day") << 1582 << 10 << 4.0 << true << 2299159.5;
    QTest::newRow("first Gregorian day") << 1582 << 10 << 15.0 << false << 2299160.5;
    QTest::newRow("333 Jan 27.5") << 333 << 1 << 27.5 << true << 1842713.0;
    QTest::newRow("-1000 Jul 12.5") << -1000 << 7 << 12.5 << true << 1356001.0;
    QTest::newRow("1600 Jan 1") << 1600 << 1 << 1.0 << false << 2305447.5;
    QTest::newRow("2400 Jan 1") << 2400 << 1 << 1.0 << false << 2597641.5;
    QTest::newRow("2000 Jan 1 Julian") << 2000 << 1 << 1.0 << true << 2451557.5;
}

void TestKSaturnDateTime::calendarToJd()
{
    QFETCH(int, year);
    QFETCH(int, month);
    QFETCH(double, day);
    QFETCH(bool, julian);
    QFETCH(double, jd);

    long double result = KSaturnDateTime::calendarToJd(
        year, month, day, julian ? KSaturnDateTime::JULIAN_CALENDAR : KSaturnDateTime::GREGORIAN);
    QVERIFY(fabs(static_cast<double>(result) - jd) < 1e-9);
}

void TestKSaturnDateTime::invalidCalendarDate()
{
    QVERIFY(std::isnan(static_cast<double>(KSaturnDateTime::calendarToJd(1999, 2, 29.0))));
    QVERIFY(std::isnan(static_cast<double>(KSaturnDateTime::calendarToJd(1999, 13, 1.0))));
    QVERIFY(std::isnan(static_cast<double>(KSaturnDateTime::calendarToJd(1999, 1, 0.5))));

    // 1900 is a leap year only in the Julian calendar
    QVERIFY(std::isnan(static_cast<double>(KSaturnDateTime::calendarToJd(1900, 2, 29.0))));
    QVERIFY(!std::isnan(
        static_cast<double>(KSaturnDateTime::calendarToJd(1900, 2, 29.0, KSaturnDateTime::JULIAN_CALENDAR))));
}

void TestKSaturnDateTime::jd1950()
{
    QCOMPARE(static_cast<double>(KSaturnDateTime::jd1950()), 2433283.0);
}

void TestKSaturnDateTime::epochs()
{
    QVERIFY(fabs(static_cast<double>(KSaturnDateTime::epochToJd(2000.0)) - J2000) < 1e-9);
    QVERIFY(fabs(static_cast<double>(KSaturnDateTime::epochToJd(2050.0)) - 2469807.5) < 1e-9);
    QVERIFY(fabs(static_cast<double>(KSaturnDateTime::epochToJd(1950.0, KSaturnDateTime::BESSELIAN)) - 2433282.42346) <
            1e-4);

    QVERIFY(fabs(KSaturnDateTime::jdToEpoch(2469807.5) - 2050.0) < 1e-9);
    QVERIFY(fabs(KSaturnDateTime::jdToEpoch(KSaturnDateTime::epochToJd(1975.5, KSaturnDateTime::BESSELIAN),
                                            KSaturnDateTime::BESSELIAN) -
                 1975.5) < 1e-9);
}

void TestKSaturnDateTime::fromString()
{
    KSaturnDateTime date = KSaturnDateTime::fromString("1992-12-16");
    QVERIFY(date.isValid());
    QVERIFY(fabs(static_cast<double>(date.djd()) - 2448972.5) < 1e-9);

    KSaturnDateTime noon = KSaturnDateTime::fromString("1992-12-16T12:00:00");
    QVERIFY(noon.isValid());
    QVERIFY(fabs(static_cast<double>(noon.djd()) - 2448973.0) < 1e-9);

    KSaturnDateTime garbage = KSaturnDateTime::fromString("the rings of Saturn");
    QVERIFY(!garbage.isValid());
    QVERIFY(std::isnan(static_cast<double>(garbage.djd())));
}

void TestKSaturnDateTime::setDJD()
{
    KSaturnDateTime dt;
    QVERIFY(fabs(static_cast<double>(dt.djd()) - J2000) < 1e-9);
    QCOMPARE(dt.date(), QDate(2000, 1, 1));
    QCOMPARE(dt.time().hour(), 12);

    dt.setDJD(2448972.75L);
    QCOMPARE(dt.date(), QDate(1992, 12, 16));
    QCOMPARE(dt.time().hour(), 6);

    // Round trip through the QDateTime constructor
    KSaturnDateTime copy(QDateTime(QDate(1992, 12, 16), QTime(6, 0), Qt::UTC));
    QVERIFY(fabs(static_cast<double>(copy.djd()) - 2448972.75) < 1e-9);
}
