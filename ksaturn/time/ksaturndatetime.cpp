/*
    SPDX-FileCopyrightText: 2004 Jason Harris <jharris@30doradus.org>

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ksaturndatetime.h"

#include "nan.h"
#include "ksaturn_debug.h"

#include <QCalendar>

#include <cmath>

KSaturnDateTime::KSaturnDateTime() : QDateTime()
{
    setDJD(J2000);
}

KSaturnDateTime::KSaturnDateTime(long double _jd) : QDateTime()
{
    setDJD(_jd);
}

KSaturnDateTime::KSaturnDateTime(const QDateTime &qdt) : QDateTime(qdt.date(), qdt.time(), Qt::UTC)
{
    if (!qdt.isValid())
    {
        DJD = NaN::ld;
        return;
    }

    QTime _t = qdt.time();
    QDate _d = qdt.date();
    long double jdFrac = (_t.hour() - 12 + (_t.minute() + (_t.second() + _t.msec() / 1000.) / 60.) / 60.) / 24.;
    DJD = (long double)(_d.toJulianDay()) + jdFrac;
}

void KSaturnDateTime::setDJD(long double _jd)
{
    QDateTime::setTimeSpec(Qt::UTC);

    DJD = _jd;
    if (!std::isfinite(static_cast<double>(_jd)))
    {
        QDateTime::setDate(QDate());
        return;
    }

    qint64 ijd     = static_cast<qint64>(std::floor(static_cast<double>(_jd)));
    double dayfrac = static_cast<double>(_jd - ijd) + 0.5;
    if (dayfrac >= 1.0)
    {
        ijd++;
        dayfrac -= 1.0;
    }

    QDateTime::setDate(QDate::fromJulianDay(ijd));

    double hour = 24. * dayfrac;
    int h       = int(hour);
    int m       = int(60. * (hour - h));
    int s       = int(60. * (60. * (hour - h) - m));
    int ms      = int(1000. * (60. * (60. * (hour - h) - m) - s));

    QDateTime::setTime(QTime(h, m, s, ms));
}

long double KSaturnDateTime::calendarToJd(int year, int month, double day, CalendarSystem calendar)
{
    if (!std::isfinite(day) || day < 1.0)
    {
        qCWarning(KSATURN) << "Invalid day of month" << day;
        return NaN::ld;
    }

    const int iday = int(std::floor(day));
    const QCalendar cal(calendar == JULIAN_CALENDAR ? QCalendar::System::Julian : QCalendar::System::Gregorian);
    // QCalendar counts years without a year zero
    const int calendarYear = year > 0 ? year : year - 1;
    const QDate date(calendarYear, month, iday, cal);

    if (!date.isValid())
    {
        qCWarning(KSATURN) << "Date" << year << month << iday << "does not exist in the"
                           << (calendar == JULIAN_CALENDAR ? "Julian" : "Gregorian") << "calendar";
        return NaN::ld;
    }

    // QDate::toJulianDay() is the day number of noon on that date
    return (long double)date.toJulianDay() - 0.5L + (long double)(day - iday);
}

long double KSaturnDateTime::epochToJd(double epoch, EpochType type)
{
    switch (type)
    {
        case BESSELIAN:
            return B1900 + (epoch - 1900.0) * JD_PER_BYEAR;
        case JULIAN:
            return J2000 + (epoch - 2000.0) * 365.25;
    }
    return NaN::ld;
}

double KSaturnDateTime::jdToEpoch(long double jd, EpochType type)
{
    switch (type)
    {
        case BESSELIAN:
            return 1900.0 + (jd - B1900) / JD_PER_BYEAR;
        case JULIAN:
            return 2000.0 + (jd - J2000) / 365.25;
    }
    return NaN::d;
}

long double KSaturnDateTime::jd1950()
{
    static const long double jd = calendarToJd(1950, 1, 1.5, GREGORIAN);
    return jd;
}

KSaturnDateTime KSaturnDateTime::fromString(const QString &s)
{
    qCDebug(KSATURN) << "Date string: " << s;

    for (Qt::DateFormat format : { Qt::ISODate, Qt::TextDate, Qt::RFC2822Date })
    {
        QDateTime dtResult = QDateTime::fromString(s, format);
        if (dtResult.isValid())
            return KSaturnDateTime(dtResult);

        // a bare date parses as QDate only
        QDate dResult = QDate::fromString(s, format);
        if (dResult.isValid())
            return KSaturnDateTime(QDateTime(dResult, QTime(0, 0), Qt::UTC));
    }

    qCWarning(KSATURN) << "Could not parse Date/Time string: " << s;
    qCWarning(KSATURN) << "Valid date formats: ";
    qCWarning(KSATURN) << "  1992-12-16   ;  1992-12-16T05:30:00";
    qCWarning(KSATURN) << "  16 Dec 1992  ;  Wed, 16 Dec 1992 05:30:00";
    return KSaturnDateTime(QDateTime());
}
