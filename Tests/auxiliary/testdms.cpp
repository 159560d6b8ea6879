/*
    SPDX-FileCopyrightText: 2016 Jasem Mutlaq <mutlaqja@ikarustech.com>

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "testdms.h"

#include "auxiliary/dms.h"

#include <QtTest>

TestDMS::TestDMS() : QObject()
{
}

void TestDMS::defaultCtor()
{
    // Check default empty constructor
    dms d;
    QVERIFY(std::isnan(d.Degrees()));
    QVERIFY(d.degree() == 0);
    QVERIFY(d.arcmin() == 0);
}

void TestDMS::angleCtor()
{
    double angle = -112.56;

    dms d(angle);

    QVERIFY(d.degree() == (int)angle);
    QVERIFY(d.arcmin() == 33);
    QVERIFY(fabs(d.sin() + 0.92347828085768229015) < 1e-9);
    QVERIFY(fabs(d.cos() + 0.38365070674265630377) < 1e-9);
}

void TestDMS::stringCtor()
{
    QString dms_str("14:55:20");

    // From Degree
    dms d(dms_str);

    QVERIFY(d.degree() == 14);
    QVERIFY(d.arcmin() == 55);
    QVERIFY(d.arcsec() == 20);
    QVERIFY(qFuzzyCompare(d.Degrees(), (14.0 + 55.0 / 60.0 + 20.0 / 3600.0)));

    // From Hours
    dms h(dms_str, false);
    QVERIFY(qFuzzyCompare(h.Degrees(), d.Degrees() * 15.0));

    // Unit markers and two fields
    dms u("12d 30m");
    QVERIFY(qFuzzyCompare(u.Degrees(), 12.5));

    // Negative sign on a zero degree field
    dms n("-0:30:00");
    QVERIFY(qFuzzyCompare(n.Degrees(), -0.5));

    // Plain number
    dms f = dms::fromString("316.1663", true);
    QVERIFY(qFuzzyCompare(f.Degrees(), 316.1663));
}

void TestDMS::stringCtorInvalid()
{
    dms d;
    QVERIFY(!d.setFromString(""));
    QVERIFY(std::isnan(d.Degrees()));

    QVERIFY(!d.setFromString("Saturn"));
    QVERIFY(std::isnan(d.Degrees()));

    QVERIFY(!d.setFromString("12:xx:00"));
    QVERIFY(std::isnan(d.Degrees()));
}

void TestDMS::testRadians()
{
    dms d(180.0);
    QVERIFY(fabs(d.radians() - dms::PI) < 1e-15);

    d.setRadians(dms::PI / 2);
    QVERIFY(fabs(d.Degrees() - 90.0) < 1e-12);

    double s, c;
    dms(28.0817).SinCos(s, c);
    QVERIFY(fabs(s - dms(28.0817).sin()) < 1e-15);
    QVERIFY(fabs(c - dms(28.0817).cos()) < 1e-15);
}

void TestDMS::testReduce()
{
    // reduce() leaves the angle itself untouched
    dms d(-30.0);
    QVERIFY(fabs(d.reduce().Degrees() - 330.0) < 1e-9);
    QVERIFY(d.Degrees() == -30.0);

    QVERIFY(fabs(dms(725.0).reduce().Degrees() - 5.0) < 1e-9);
}

void TestDMS::testReduceToRange()
{
    double base = 67.8;
    double a    = 360.0 * 11. + base;
    double b    = -360.0 * 12. + base;

    dms d;
    d.setD(a);
    d.reduceToRange(dms::ZERO_TO_2PI);
    QVERIFY(fabs(d.Degrees() - base) < 1e-9);

    d.setD(b);
    d.reduceToRange(dms::ZERO_TO_2PI);
    QVERIFY(fabs(d.Degrees() - base) < 1e-9);

    d.setD(360.0);
    d.reduceToRange(dms::ZERO_TO_2PI);
    QVERIFY(fabs(d.Degrees() - 0.) < 1e-9);

    double c = 180.0 * 13. + base;
    double e = 180.0 * 14. + base;
    double f = -180.0 * 15. + base;
    double g = -180.0 * 16. + base;

    d.setD(c);
    d.reduceToRange(dms::MINUSPI_TO_PI);
    QVERIFY(fabs(d.Degrees() - (base - 180.0)) < 1e-9);

    d.setD(e);
    d.reduceToRange(dms::MINUSPI_TO_PI);
    QVERIFY(fabs(d.Degrees() - base) < 1e-9);

    d.setD(f);
    d.reduceToRange(dms::MINUSPI_TO_PI);
    QVERIFY(fabs(d.Degrees() - (base - 180.0)) < 1e-9);

    d.setD(g);
    d.reduceToRange(dms::MINUSPI_TO_PI);
    QVERIFY(fabs(d.Degrees() - base) < 1e-9);
}

void TestDMS::testSubstraction()
{
    // Diff 359 and 1
    dms sub = dms(359.0) - dms(1.0);
    QVERIFY(sub.Degrees() == 358.);

    // The reverse is -358
    sub = dms(1.0) - dms(359.0);
    QVERIFY(sub.Degrees() == -358.);

    sub = dms(100.0) + dms(300.0);
    QVERIFY(sub.Degrees() == 400.0);
}

void TestDMS::testUnitTransition()
{
    // check for rounding/truncating errors around unit transition
    dms sp;
    sp.setD(10.0 - 1.0E-14);
    QVERIFY(sp.degree() == 9);
    QVERIFY(sp.arcmin() == 59);
    QVERIFY(sp.arcsec() == 59);

    sp.setD(10.0);
    QVERIFY(sp.degree() == 10);
    QVERIFY(sp.arcmin() == 0);
    QVERIFY(sp.arcsec() == 0);

    sp.setD(10.0 + 1.0E-14);
    QVERIFY(sp.degree() == 10);
    QVERIFY(sp.arcmin() == 0);
    QVERIFY(sp.arcsec() == 0);
}

void TestDMS::testPrecisionTransition()
{
    // check for transitions in the DMS string around the half precision range
    dms sp;
    double half_precision_DMS = 1.0 / 7200.0;
    double epsilon            = 0.000000001;

    QLocale::setDefault(QLocale::c());

    sp.setD(10.0 + half_precision_DMS + epsilon);
    QCOMPARE(sp.toDMSString(), QString(" 10° 00' 01\""));
    sp.setD(10.0 + half_precision_DMS - epsilon);
    QCOMPARE(sp.toDMSString(), QString(" 10° 00' 00\""));
    sp.setD(10.0 - half_precision_DMS + epsilon);
    QCOMPARE(sp.toDMSString(), QString(" 10° 00' 00\""));
    sp.setD(10.0 - half_precision_DMS - epsilon);
    QCOMPARE(sp.toDMSString(), QString(" 09° 59' 59\""));

    sp.setD(-10.0 + half_precision_DMS + epsilon);
    QCOMPARE(sp.toDMSString(), QString("-09° 59' 59\""));
    sp.setD(-10.0 - half_precision_DMS - epsilon);
    QCOMPARE(sp.toDMSString(), QString("-10° 00' 01\""));

    sp.setD(10.0);
    QCOMPARE(sp.toDMSString(true), QString("+10° 00' 00\""));
}
