/*
    SPDX-FileCopyrightText: 2001 Jason Harris <jharris@30doradus.org>

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#pragma once

#include "../nan.h"

#include <QString>

#include <cmath>

/** @class dms
 * @short An angle, stored as degrees, but expressible in many ways.
 *
 * dms encapsulates an angle. The angle is stored as a double equal to the
 * value of the angle in degrees. The satellite theories are tabulated in
 * degrees, so every series argument is built as a dms and handed to the
 * trigonometric functions through radians() or SinCos().
 */
class dms
{
  public:
    /** Default constructor. The angle is NaN until set. */
    dms() : D(NaN::d) {}

    virtual ~dms() = default;

    /** @short Construct an angle from a double value, in degrees. */
    explicit dms(const double &x) : D(x) {}

    /** @short Construct an angle from a string representation.
     * @see setFromString()
     */
    explicit dms(const QString &s, bool isDeg = true) { setFromString(s, isDeg); }

    /** @return integer degrees portion of the angle */
    inline int degree() const
    {
        if (std::isnan(D))
            return 0;

        return int(D);
    }

    /** @return integer arcminutes portion of the angle */
    int arcmin() const;

    /** @return integer arcseconds portion of the angle */
    int arcsec() const;

    /** @return angle in degrees expressed as a double. */
    inline const double &Degrees() const { return D; }

    /** Sets floating-point value of angle, in degrees. */
    inline virtual void setD(const double &x) { D = x; }

    /** @short Attempt to parse the string argument as an angle.
     *
     * The string can be an int or floating-point value, or a triplet of
     * values (d, m, s) separated by spaces or colons. Unit markers are ignored.
     * @param s the string to be parsed
     * @param isDeg if true, the value is in degrees. Otherwise, it is in hours.
     * @return true if the string was parsed. Otherwise the angle is set to NaN.
     */
    virtual bool setFromString(const QString &s, bool isDeg = true);

    /** @short Compute Sine and Cosine of the angle simultaneously. */
    inline void SinCos(double &s, double &c) const
    {
#ifdef __GLIBC__
        sincos(radians(), &s, &c);
#else
        s = ::sin(radians());
        c = ::cos(radians());
#endif
    }

    /** @return the Sine of the angle. */
    double sin() const { return ::sin(D * DegToRad); }

    /** @return the Cosine of the angle. */
    double cos() const { return ::cos(D * DegToRad); }

    /** @return the angle in radians (double) */
    inline double radians() const { return D * DegToRad; }

    /** @short Set angle according to the argument, in radians. */
    inline virtual void setRadians(const double &Rad) { dms::setD(Rad / DegToRad); }

    /** return the equivalent angle between 0 and 360 degrees.
     * @warning does not change the value of the parent angle itself.
     */
    const dms reduce() const;

    enum AngleRanges
    {
        ZERO_TO_2PI,
        MINUSPI_TO_PI
    };

    /** @short Reduce _this_ angle to the given range */
    void reduceToRange(enum dms::AngleRanges range);

    /** @return the angle as degrees, arcminutes and arcseconds.
     * @param forceSign if @c true then adds '+' or '-' to the string
     */
    const QString toDMSString(const bool forceSign = false) const;

    static constexpr double PI = { M_PI };

    /** DegToRad is the number of radians in one degree (dms::PI/180.0). */
    static constexpr double DegToRad = { M_PI / 180.0 };

    /** @short Static function to create a dms object from a QString. */
    static dms fromString(const QString &s, bool deg);

  protected:
    double D;

  private:
    friend dms operator+(dms, dms);
    friend dms operator-(dms, dms);
};

/// Add two angles
inline dms operator+(dms a, dms b)
{
    return dms(a.D + b.D);
}

/// Subtract angles
inline dms operator-(dms a, dms b)
{
    return dms(a.D - b.D);
}

/** Overloaded equality operator */
inline bool operator==(const dms &a1, const dms &a2)
{
    return a1.Degrees() == a2.Degrees();
}
