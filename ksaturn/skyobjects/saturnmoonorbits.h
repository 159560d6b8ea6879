/*
    SPDX-FileCopyrightText: 2009 Vipul Kumar Singh <vipulkrsingh@gmail.com>

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#pragma once

#include "saturnmoons.h"

class SaturnMoonNumbers;

/**
 * @struct OrbitalElements
 * @short Orbit of a satellite referred to Saturn's ring plane.
 *
 * Angles are in radians, the radius in Saturn equatorial radii.
 */
struct OrbitalElements
{
    double lambda; ///< longitude in the orbit
    double gamma;  ///< inclination on the ring plane
    double omega;  ///< longitude of the ascending node on the ring plane
    double r;      ///< distance from Saturn
};

/**
 * @struct FinalizedOrbit
 * @short Output of SaturnMoonOrbits::finalize()
 */
struct FinalizedOrbit
{
    double lambda; ///< longitude in the orbit, radians
    double gamma;  ///< inclination on the ring plane, radians
    double w;      ///< node on the ring plane, radians
    double r;      ///< distance from Saturn, Saturn radii
    double C;      ///< equation of the center, radians
};

/**
 * @class SaturnMoonOrbits
 * @short The satellite theories of Meeus, "Astronomical Algorithms" ch. 46.
 *
 * Mimas, Enceladus and Dione are given by a mean longitude with a short
 * equation of the center and a fixed inclination. Tethys moves on a circle.
 * The elements of Rhea, Titan, Hyperion and Iapetus are referred to the
 * ecliptic and are reduced to the ring plane by finalize().
 */
class SaturnMoonOrbits
{
  public:
    /** Passes of the fixed point iteration for Titan's longitude of pericenter */
    static constexpr int TITAN_PASSES = 6;

    /** @return the elements of moon @p id for the arguments @p num */
    static OrbitalElements elements(SaturnMoons::MoonID id, const SaturnMoonNumbers &num);

    /**
     * @short Reduce ecliptic elements to the ring plane.
     *
     * The true anomaly is obtained from a series in the mean anomaly up to the
     * fifth power of the eccentricity.
     * @param e eccentricity
     * @param a semi-major axis, Saturn radii
     * @param omega longitude of the node on the ecliptic, radians
     * @param i inclination on the ecliptic, radians
     * @param lambda1 mean longitude, radians
     * @param p longitude of pericenter, radians
     * @param num theory arguments
     */
    static FinalizedOrbit finalize(double e, double a, double omega, double i, double lambda1, double p,
                                   const SaturnMoonNumbers &num);

    /**
     * @return Titan's longitude of pericenter (radians) after @p passes of its
     * self-referencing correction
     */
    static double titanPericenter(const SaturnMoonNumbers &num, int passes = TITAN_PASSES);

  private:
    static OrbitalElements mimas(const SaturnMoonNumbers &num);
    static OrbitalElements enceladus(const SaturnMoonNumbers &num);
    static OrbitalElements tethys(const SaturnMoonNumbers &num);
    static OrbitalElements dione(const SaturnMoonNumbers &num);
    static OrbitalElements rhea(const SaturnMoonNumbers &num);
    static OrbitalElements titan(const SaturnMoonNumbers &num);
    static OrbitalElements hyperion(const SaturnMoonNumbers &num);
    static OrbitalElements iapetus(const SaturnMoonNumbers &num);

    static OrbitalElements fromFinalized(const FinalizedOrbit &orbit);
};
