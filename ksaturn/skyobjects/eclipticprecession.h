/*
    SPDX-FileCopyrightText: 2026 The KSaturn Team

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#pragma once

#include "planetgeometry.h"

/**
 * @class PrecessionProvider
 * @short Converts ecliptic coordinates between the equinoxes of two epochs.
 */
class PrecessionProvider
{
  public:
    virtual ~PrecessionProvider() = default;

    /**
     * @param pos ecliptic position referred to the equinox of @p jd0
     * @param jd0 Julian Day of the starting equinox
     * @param jdf Julian Day of the target equinox
     * @return the position referred to the equinox of @p jdf. The radius is unchanged.
     */
    virtual EclipticPosition precessEcliptic(const EclipticPosition &pos, long double jd0, long double jdf) const = 0;
};

/**
 * @class EclipticPrecession
 * @short Rigorous precession of ecliptic coordinates.
 *
 * Implements the method of Meeus, "Astronomical Algorithms" (2nd ed.), chapter 21:
 * the ecliptic of the starting epoch is rotated onto the ecliptic of the
 * final epoch using the angles eta, Pi and p, each a polynomial in the
 * starting epoch T and the interval t (Julian centuries).
 */
class EclipticPrecession : public PrecessionProvider
{
  public:
    EclipticPrecession() = default;

    EclipticPosition precessEcliptic(const EclipticPosition &pos, long double jd0, long double jdf) const override;
};
