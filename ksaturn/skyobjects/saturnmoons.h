/*
    SPDX-FileCopyrightText: 2009 Vipul Kumar Singh <vipulkrsingh@gmail.com>

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#pragma once

#include "planetmoons.h"
#include "eclipticprecession.h"

#include <QFlags>

class SaturnMoonNumbers;
struct RingFrameReference;

/**
 * @struct MoonPosition
 * @short Apparent rectangular position of a satellite relative to Saturn, in Saturn equatorial radii.
 *
 * X is positive west of Saturn and lies along its equator, Y is positive
 * north along its rotation axis. Z is positive when the satellite is farther
 * from Earth than Saturn.
 */
struct MoonPosition
{
    double x;
    double y;
    double z;
};

/**
 * @class SaturnMoons
 * Implements the eight largest moons of Saturn,
 * using the algorithms of chapter 46 of "Astronomical Algorithms" by Jean Meeus.
 *
 * Saturn's apparent position is obtained from a PlanetGeometryProvider and
 * referred to the ecliptic of 1950 January 1.5 with a PrecessionProvider.
 *
 * @author Vipul Kumar Singh
 * @version 1.0
 */
class SaturnMoons : public PlanetMoons
{
  public:
    enum MoonID
    {
        MIMAS = 0,
        ENCELADUS,
        TETHYS,
        DIONE,
        RHEA,
        TITAN,
        HYPERION,
        IAPETUS,
        NUM_MOONS
    };

    enum Correction
    {
        NoCorrection          = 0x0,
        LightTimeCorrection   = 0x1, /**< differential light time along the line of sight */
        PerspectiveCorrection = 0x2, /**< foreshortening by the depth relative to Saturn */
        AllCorrections        = LightTimeCorrection | PerspectiveCorrection
    };
    Q_DECLARE_FLAGS(Corrections, Correction)

    /**
     * Constructor. Assign the name of each moon, and initialize their XYZ positions to NaN.
     * @param geometry source of Saturn's apparent position. Not owned; must outlive this object.
     * @param precession precession to 1950.0. Not owned; if null, EclipticPrecession is used.
     */
    explicit SaturnMoons(const PlanetGeometryProvider *geometry, const PrecessionProvider *precession = nullptr);

    ~SaturnMoons() override = default;

    /**
     * @short Find the positions of each Moon, relative to Saturn.
     *
     * The theory arguments and the orientation of Saturn's pole are computed
     * once and shared by the eight moons.
     * @param jde Julian Ephemeris Day of the observation
     * @return false if Saturn's position is unavailable or the time is rejected
     */
    bool findPosition(long double jde) override;

    /**
     * @short Find the position of one moon.
     * @param jde Julian Ephemeris Day of the observation
     * @param id which moon
     * @param pos receives the position; all NaN on failure
     * @return false if Saturn's position is unavailable or the time is rejected
     */
    bool findMoonPosition(long double jde, MoonID id, MoonPosition &pos) const;

    /**
     * @short Assemble the apparent position of one moon.
     *
     * Computes the orbital elements, rotates the satellite into the sky frame
     * with the pole reference @p ref, then applies the light time and the
     * perspective corrections, in that order.
     */
    static MoonPosition apparentPosition(const SaturnMoonNumbers &num, const RingFrameReference &ref, MoonID id,
                                         Corrections corrections = AllCorrections);

    /**
     * @return true if @p jde may be evaluated. Non-finite values are always
     * rejected; the range check applies only when enabled in the options.
     */
    static bool acceptsTime(long double jde);

    /** @return the corrections enabled in the options */
    static Corrections configuredCorrections();

    /** @return the translated name of @p id */
    static QString translatedName(MoonID id);

    /** @return the untranslated name of @p id */
    static QString untranslatedName(MoonID id);

    /** @return the light time divisor K of @p id, in Saturn radii */
    static double lightTimeDivisor(MoonID id);

    /**
     * @return the moon called @p name, translated or not, ignoring case.
     * @param ok set to false if there is no such moon
     */
    static MoonID moonFromName(const QString &name, bool &ok);

  private:
    /** Find Saturn's position referred to 1950.0 */
    bool findSaturn1950(long double jde, EclipticPosition &saturn1950) const;

    const PlanetGeometryProvider *m_Geometry { nullptr };
    const PrecessionProvider *m_Precession { nullptr };
    EclipticPrecession m_DefaultPrecession;
};

Q_DECLARE_OPERATORS_FOR_FLAGS(SaturnMoons::Corrections)
