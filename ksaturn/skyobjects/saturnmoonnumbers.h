/*
    SPDX-FileCopyrightText: 2009 Vipul Kumar Singh <vipulkrsingh@gmail.com>
    SPDX-FileCopyrightText: 2002-2005 Jason Harris <kstars@30doradus.org>

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#pragma once

#include "cachingdms.h"
#include "planetgeometry.h"

/** @class SaturnMoonNumbers
 *
 * Time-dependent quantities shared by the theories of all eight satellites,
 * together with the position of Saturn they are to be projected against.
 *
 * The time offsets t1..t11 are counted from the epochs of the various
 * satellite theories (Meeus, "Astronomical Algorithms", ch. 46); W0..W8 are
 * the slowly varying perturbation arguments built from them.
 *
 * An instance is complete when constructed and never changes afterwards.
 * @short Store the arguments of one Saturn satellite evaluation.
 */
class SaturnMoonNumbers
{
  public:
    /** Inclination of the ring plane on the ecliptic of 1950.0, in degrees */
    static constexpr double RING_INCLINATION = 28.0817;

    /** Longitude of the ascending node of the ring plane, in degrees */
    static constexpr double RING_NODE = 168.8112;

    /** Light time from Saturn, in days, subtracted from the time of observation */
    static constexpr double LIGHT_TIME_OFFSET = 0.04942;

    /**
     * Constructor.
     * @param jd Julian Day of the theory arguments, already reduced by the light time
     * (see timeArgument())
     * @param saturn1950 apparent geocentric position of Saturn referred to the
     * ecliptic and equinox of 1950 January 1.5, distance in AU
     */
    SaturnMoonNumbers(long double jd, const EclipticPosition &saturn1950);
    ~SaturnMoonNumbers() = default;

    /** @return the theory time argument for a time of observation @p jde */
    static long double timeArgument(long double jde) { return jde - LIGHT_TIME_OFFSET; }

    /** @return the Julian Day of the theory arguments */
    inline long double julianDay() const { return days; }

    /**
     * @return time offset t1..t11 (days, Julian years or Julian centuries depending on @p i)
     * @param i index from 1 to 11
     */
    inline double t(int i) const { return T[i]; }

    /**
     * @return perturbation argument W0..W8, in radians
     * @param i index from 0 to 8
     */
    inline double W(int i) const { return Wr[i]; }

    /** @return eccentricity of Saturn's orbit as used in Titan's theory */
    inline double e1() const { return E1; }

    /** @return the ring plane inclination with cached sine and cosine */
    inline const CachingDms *ringInclination() const { return &RingInclination; }

    /** @return the longitude of the ring plane node with cached sine and cosine */
    inline const CachingDms *ringNode() const { return &RingNode; }

    /** @return the ecliptic longitude of Saturn, equinox 1950.0 */
    inline const CachingDms *saturnLongitude() const { return &Lambda0; }

    /** @return the ecliptic latitude of Saturn, equinox 1950.0 */
    inline const CachingDms *saturnLatitude() const { return &Beta0; }

    /** @return the Earth-Saturn distance in AU */
    inline double saturnDistance() const { return Delta; }

  private:
    long double days;
    double T[12];
    double Wr[9];
    double E1;
    CachingDms RingInclination, RingNode;
    CachingDms Lambda0, Beta0;
    double Delta;
};
