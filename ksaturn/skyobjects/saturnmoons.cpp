/*
    SPDX-FileCopyrightText: 2009 Vipul Kumar Singh <vipulkrsingh@gmail.com>

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "saturnmoons.h"

#include "Options.h"
#include "ksaturndatetime.h"
#include "saturnmoonnumbers.h"
#include "saturnmoonorbits.h"
#include "saturnringframe.h"
#include "ksaturn_debug.h"

#include <KLocalizedString>

#include <QtMath>

#include <cmath>

namespace
{
struct MoonData
{
    const char *name;
    double magnitude;
    double lightTimeDivisor; // Saturn radii
};

//The magnitude data are from the wikipedia articles for each moon, as of Mar 2009.
const MoonData moonData[SaturnMoons::NUM_MOONS] = { { "Mimas", 12.9, 20947 },    { "Enceladus", 11.7, 23715 },
                                                    { "Tethys", 10.2, 26382 },   { "Dione", 10.4, 29876 },
                                                    { "Rhea", 10, 35313 },       { "Titan", 7.9, 53800 },
                                                    { "Hyperion", 14.9, 59222 }, { "Iapetus", 11, 91820 } };

// Saturn radii per AU, used for the depth of a moon along the line of sight
const double SaturnRadiiPerAU = 2475.0;

MoonPosition invalidPosition()
{
    return MoonPosition{ NaN::d, NaN::d, NaN::d };
}
}

SaturnMoons::SaturnMoons(const PlanetGeometryProvider *geometry, const PrecessionProvider *precession)
    : m_Geometry(geometry), m_Precession(precession ? precession : &m_DefaultPrecession)
{
    for (int i = 0; i < NUM_MOONS; ++i)
        Names.append(translatedName(static_cast<MoonID>(i)));

    for (const MoonData &data : moonData)
        Magnitudes.append(data.magnitude);

    XP      = QVector<double>(NUM_MOONS, NaN::d);
    YP      = QVector<double>(NUM_MOONS, NaN::d);
    ZP      = QVector<double>(NUM_MOONS, NaN::d);
    InFront = QVector<bool>(NUM_MOONS, false);
}

QString SaturnMoons::translatedName(MoonID id)
{
    switch (id)
    {
        case MIMAS:
            return i18nc("Saturn's moon Mimas", "Mimas");
        case ENCELADUS:
            return i18nc("Saturn's moon Enceladus", "Enceladus");
        case TETHYS:
            return i18nc("Saturn's moon Tethys", "Tethys");
        case DIONE:
            return i18nc("Saturn's moon Dione", "Dione");
        case RHEA:
            return i18nc("Saturn's moon Rhea", "Rhea");
        case TITAN:
            return i18nc("Saturn's moon Titan", "Titan");
        case HYPERION:
            return i18nc("Saturn's moon Hyperion", "Hyperion");
        case IAPETUS:
            return i18nc("Saturn's moon Iapetus", "Iapetus");
        case NUM_MOONS:
            break;
    }
    return QString();
}

QString SaturnMoons::untranslatedName(MoonID id)
{
    return QString::fromLatin1(moonData[id].name);
}

double SaturnMoons::lightTimeDivisor(MoonID id)
{
    return moonData[id].lightTimeDivisor;
}

SaturnMoons::MoonID SaturnMoons::moonFromName(const QString &name, bool &ok)
{
    const QString key = name.trimmed();
    for (int i = 0; i < NUM_MOONS; ++i)
    {
        const MoonID id = static_cast<MoonID>(i);
        if (key.compare(untranslatedName(id), Qt::CaseInsensitive) == 0 ||
            key.compare(translatedName(id), Qt::CaseInsensitive) == 0)
        {
            ok = true;
            return id;
        }
    }

    ok = false;
    return MIMAS;
}

bool SaturnMoons::acceptsTime(long double jde)
{
    if (!std::isfinite(static_cast<double>(jde)))
    {
        qCWarning(KSATURN) << "Rejecting non-finite time argument";
        return false;
    }

    if (Options::validateEphemerisRange() &&
        (jde < Options::ephemerisMinimumJD() || jde > Options::ephemerisMaximumJD()))
    {
        qCWarning(KSATURN) << "JD" << static_cast<double>(jde) << "is outside the valid range of the satellite theories ["
                           << Options::ephemerisMinimumJD() << "," << Options::ephemerisMaximumJD() << "]";
        return false;
    }

    return true;
}

SaturnMoons::Corrections SaturnMoons::configuredCorrections()
{
    Corrections corrections = NoCorrection;
    if (Options::applyLightTimeCorrection())
        corrections |= LightTimeCorrection;
    if (Options::applyPerspectiveCorrection())
        corrections |= PerspectiveCorrection;
    return corrections;
}

MoonPosition SaturnMoons::apparentPosition(const SaturnMoonNumbers &num, const RingFrameReference &ref, MoonID id,
                                           Corrections corrections)
{
    const OrbitalElements el = SaturnMoonOrbits::elements(id, num);

    //Position in the ring plane, X towards the node of the ring plane
    const double u = el.lambda - el.omega;
    const double w = el.omega - num.ringNode()->radians();
    const Eigen::Vector3d ringPlane(el.r * (cos(u) * cos(w) - sin(u) * cos(el.gamma) * sin(w)),
                                    el.r * (sin(u) * cos(w) * cos(el.gamma) + cos(u) * sin(w)),
                                    el.r * sin(u) * sin(el.gamma));

    const Eigen::Vector3d sky = SaturnRingFrame::rotate(ringPlane, ref, num);

    MoonPosition pos{ sky.x(), sky.y(), sky.z() };

    if (corrections.testFlag(LightTimeCorrection))
    {
        const double q = pos.x / el.r;
        pos.x += fabs(pos.z) * sqrt(qMax(0.0, 1 - q * q)) / lightTimeDivisor(id);
    }

    if (corrections.testFlag(PerspectiveCorrection))
    {
        const double delta = num.saturnDistance();
        const double W     = delta / (delta + pos.z / SaturnRadiiPerAU);
        pos.x *= W;
        pos.y *= W;
    }

    return pos;
}

bool SaturnMoons::findSaturn1950(long double jde, EclipticPosition &saturn1950) const
{
    if (!acceptsTime(jde))
        return false;

    if (!m_Geometry)
    {
        qCWarning(KSATURN) << "No planetary geometry provider set";
        return false;
    }

    EclipticPosition saturn;
    if (!m_Geometry->findGeocentricPosition(jde, KSaturn::SATURN, saturn))
    {
        qCWarning(KSATURN) << "Saturn's position is unavailable at JD" << static_cast<double>(jde);
        return false;
    }

    saturn1950 = m_Precession->precessEcliptic(saturn, jde, KSaturnDateTime::jd1950());
    return true;
}

bool SaturnMoons::findMoonPosition(long double jde, MoonID id, MoonPosition &pos) const
{
    EclipticPosition saturn1950;
    if (!findSaturn1950(jde, saturn1950))
    {
        pos = invalidPosition();
        return false;
    }

    const SaturnMoonNumbers num(SaturnMoonNumbers::timeArgument(jde), saturn1950);
    pos = apparentPosition(num, SaturnRingFrame::reference(num), id, configuredCorrections());
    return true;
}

bool SaturnMoons::findPosition(long double jde)
{
    EclipticPosition saturn1950;
    if (!findSaturn1950(jde, saturn1950))
    {
        invalidatePositions();
        return false;
    }

    const SaturnMoonNumbers num(SaturnMoonNumbers::timeArgument(jde), saturn1950);
    const RingFrameReference ref    = SaturnRingFrame::reference(num);
    const Corrections corrections = configuredCorrections();

    for (int i = 0; i < NUM_MOONS; ++i)
    {
        const MoonPosition pos = apparentPosition(num, ref, static_cast<MoonID>(i), corrections);
        XP[i]                  = pos.x;
        YP[i]                  = pos.y;
        ZP[i]                  = pos.z;
        //Moons with negative Z are nearer to us than Saturn
        InFront[i] = pos.z < 0.0;
    }

    return true;
}
