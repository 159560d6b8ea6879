/*
    SPDX-FileCopyrightText: 2001 Jason Harris <jharris@30doradus.org>

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "planetgeometry.h"

#include "ksaturn_debug.h"

void FixedPlanetGeometry::setPosition(KSaturn::Planet planet, const EclipticPosition &pos)
{
    m_Positions.insert(planet, pos);
}

void FixedPlanetGeometry::clear(KSaturn::Planet planet)
{
    m_Positions.remove(planet);
}

bool FixedPlanetGeometry::findGeocentricPosition(long double jd, KSaturn::Planet planet, EclipticPosition &pos) const
{
    Q_UNUSED(jd)

    auto it = m_Positions.constFind(planet);
    if (it == m_Positions.constEnd())
    {
        qCWarning(KSATURN) << "No position available for planet" << planet;
        return false;
    }

    pos = it.value();
    return true;
}
