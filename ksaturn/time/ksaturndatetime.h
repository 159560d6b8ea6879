/*
    SPDX-FileCopyrightText: 2001 Jason Harris <jharris@30doradus.org>

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#pragma once

#include <QDateTime>

#define J2000 2451545.0    //Julian Date for noon on Jan 1, 2000 (epoch J2000)

/** @class KSaturnDateTime
 * @short Extension of QDateTime carrying a Julian Day.
 *
 * KSaturnDateTime represents the date/time as a Julian Day held in a long
 * double, in which the fractional portion encodes the time of day.
 * The ephemeris works in Dynamical Time; dates entered by the user are
 * taken to be TD and no UT-TD correction is applied.
 *
 * The static helpers convert calendar dates of either the Gregorian or the
 * Julian calendar, and epoch years, to the Julian Day scale.
 */
class KSaturnDateTime : public QDateTime
{
  public:
    /** @short Creates a date/time at J2000 (noon on Jan 1, 2000) */
    KSaturnDateTime();

    /** @short Creates a date/time at the specified Julian Day. */
    explicit KSaturnDateTime(long double djd);

    /** @short Wraps a QDateTime. The timespec is ignored; the value is taken as TD. */
    explicit KSaturnDateTime(const QDateTime &qdt);

    /** @return the Julian Day value, including the time of day. */
    inline long double djd() const { return DJD; }

    /** Assign the Julian Day value, which includes the time of day. */
    void setDJD(long double jd);

    /**
     * @enum CalendarSystem
     * @note Dates before 1582 October 15 are commonly quoted in the Julian calendar.
     */
    enum CalendarSystem
    {
        GREGORIAN, /**< proleptic Gregorian calendar */
        JULIAN_CALENDAR /**< proleptic Julian calendar */
    };

    /**
     * @enum EpochType description options
     * @note After 1976, the IAU standard for epochs is Julian Years.
     */
    enum EpochType
    {
        JULIAN,   /**< Julian epoch */
        BESSELIAN /**< Besselian epoch */
    };

    /**
     * @short Converts a calendar date to a Julian Day.
     *
     * The day may carry a fraction: 1950 January 1.5 is noon of January 1st.
     * @param year astronomical year number (year 0 is 1 BC)
     * @param month month, 1 to 12
     * @param day day of the month, from 1.0 up to (but excluding) the day after the last
     * @param calendar calendar system the date is expressed in
     * @return the Julian Day, or NaN if the date does not exist in that calendar
     */
    static long double calendarToJd(int year, int month, double day, CalendarSystem calendar = GREGORIAN);

    /**
     * @short Takes in an epoch and returns a Julian Date
     * @return the Julian Date (in TT)
     * @param epoch A floating-point year value specifying the Epoch
     * @param type JULIAN or BESSELIAN depending on what convention the epoch is specified in
     */
    static long double epochToJd(double epoch, EpochType type = JULIAN);

    /**
     * @short Takes in a Julian Date and returns the corresponding epoch year in the given system
     */
    static double jdToEpoch(long double jd, EpochType type = JULIAN);

    /**
     * @return the Julian Day of 1950 January 1.5 (Gregorian), the equinox the
     * satellite theories are referred to.
     */
    static long double jd1950();

    /**
     * @short Parses a date/time string.
     *
     * Accepted formats are those of QDateTime (text, ISO 8601 and RFC 2822),
     * e.g. "1992-12-16", "1992-12-16T00:00:00" or "16 Dec 1992".
     * @return the parsed date, which is invalid (see isValid()) when parsing fails.
     */
    static KSaturnDateTime fromString(const QString &s);

    constexpr static const double B1900        = 2415020.31352; // Julian date of B1900 epoch
    constexpr static const double JD_PER_BYEAR = 365.242198781; // Julian days in a Besselian year

  private:
    long double DJD;
};
