/*
    SPDX-FileCopyrightText: 2001 Jason Harris <jharris@30doradus.org>
    SPDX-FileCopyrightText: 2001 Mark Hollomon <mhh@mindspring.com>

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#pragma once

#include "dms.h"

#include <QHash>

namespace KSaturn
{
enum Planet
{
    JUPITER = 3,
    SATURN  = 4
};
}

/**
 * @class EclipticPosition
 * @short The ecliptic position of a planet (Longitude, Latitude, and distance).
 *
 * For the geocentric positions handled here the radius is the Earth-planet
 * distance in AU.
 */
class EclipticPosition
{
  public:
    dms longitude;
    dms latitude;
    double radius;

    /**Constructor. */
    explicit EclipticPosition(dms plong = dms(), dms plat = dms(), double prad = 0.0)
        : longitude(plong), latitude(plat), radius(prad)
    {
    }
};

/**
 * @class PlanetGeometryProvider
 * @short Source of geocentric apparent planetary positions.
 *
 * The satellite ephemeris does not compute planetary positions itself; it
 * asks a provider for the apparent geocentric ecliptic coordinates of the
 * primary at the instant of observation.
 */
class PlanetGeometryProvider
{
  public:
    virtual ~PlanetGeometryProvider() = default;

    /**
     * @short Find the geocentric apparent position of a planet.
     * @param jd Julian Ephemeris Day of the observation
     * @param planet which planet
     * @param pos receives the apparent ecliptic longitude and latitude of date and the Earth-planet distance in AU
     * @return false if the provider has no position for that planet and time
     */
    virtual bool findGeocentricPosition(long double jd, KSaturn::Planet planet, EclipticPosition &pos) const = 0;
};

/**
 * @class FixedPlanetGeometry
 * @short A provider returning one stored position per planet, whatever the time.
 *
 * Used when the position of the primary is known from elsewhere, e.g. from a
 * printed almanac entered on the command line.
 */
class FixedPlanetGeometry : public PlanetGeometryProvider
{
  public:
    FixedPlanetGeometry() = default;

    /** Store the position returned for @p planet. */
    void setPosition(KSaturn::Planet planet, const EclipticPosition &pos);

    /** Forget the stored position of @p planet. */
    void clear(KSaturn::Planet planet);

    bool findGeocentricPosition(long double jd, KSaturn::Planet planet, EclipticPosition &pos) const override;

  private:
    QHash<int, EclipticPosition> m_Positions;
};
