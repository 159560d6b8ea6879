/*
    SPDX-FileCopyrightText: 2016 Akarsh Simha <akarsh.simha@kdemail.net>

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#pragma once

#include "dms.h"

/**
 * @class CachingDms
 * @short a dms subclass that caches its sine and cosine values every time the angle is changed.
 * @note The ring-plane tilt angles are evaluated by every frame rotation and
 * every finalized orbit, so their sine and cosine are computed once per context.
 */
class CachingDms : public dms
{
  public:
    CachingDms() : dms(), m_sin(NaN::d), m_cos(NaN::d) {}

    /**
     * @short Degree angle constructor
     * @param x is the angle in degrees
     */
    explicit CachingDms(const double &x);

    /**
     * @short Casting constructor
     */
    CachingDms(const dms &angle);

    /**
     * @short Sets the angle in degrees supplied as a double
     * @note Re-implements dms::setD() with sine/cosine caching
     */
    inline void setD(const double &x) override
    {
        dms::setD(x);
        dms::SinCos(m_sin, m_cos);
    }

    inline void setRadians(const double &a) override
    {
        dms::setRadians(a);
        dms::SinCos(m_sin, m_cos);
    }

    inline bool setFromString(const QString &s, bool isDeg = true) override
    {
        bool retval = dms::setFromString(s, isDeg);
        dms::SinCos(m_sin, m_cos);
        return retval;
    }

    /**
     * @short Sets the angle using atan2()
     * @note The sine and cosine follow from the arguments without a trigonometric call
     */
    void setUsing_atan2(const double &y, const double &x);

    /**
     * @short Sets the angle using asin()
     * @param sine Sine of the angle
     * @note The result lies in [-90, 90] degrees
     */
    void setUsing_asin(const double &sine);

    /** @short Get the cached sine and cosine together */
    inline void SinCos(double &s, double &c) const
    {
        s = m_sin;
        c = m_cos;
    }

    /** @short Get the cached sine of this angle */
    inline double sin() const { return m_sin; }

    /** @short Get the cached cosine of this angle */
    inline double cos() const { return m_cos; }

  private:
    double m_sin, m_cos; // Cached values
};
