/*
    SPDX-FileCopyrightText: Vipul Kumar Singh <vipulkrsingh@gmail.com>
    SPDX-FileCopyrightText: Médéric Boquien <mboquien@free.fr>

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#pragma once

#include <QString>
#include <QVector>

/**
 * @class PlanetMoons
 *
 * Implements the moons of a planet.
 *
 * Positions are kept in an XYZ coordinate system centered on the planet,
 * where the X-axis corresponds to the planet's Equator, the Y-Axis is
 * parallel to the planet's Poles, and the Z-axis points along the line
 * joining the Earth and the planet. Units are equatorial radii of the planet.
 *
 * @author Vipul Kumar Singh
 * @version 1.0
 */
class PlanetMoons
{
  public:
    PlanetMoons() = default;

    virtual ~PlanetMoons() = default;

    /**
     * @return the translated name of a moon.
     * @param id which moon?
     */
    QString name(int id) const;

    /**
     * @return the visual magnitude of a moon.
     * @param id which moon?
     */
    double magnitude(int id) const { return Magnitudes[id]; }

    /**
     * @short Find the positions of each Moon, relative to the planet.
     *
     * Sets the inFront bool variable to indicate whether the Moon is nearer
     * to us than the planet or not.
     *
     * @param jde Julian Ephemeris Day at which to find the positions.
     * @return false if the positions could not be computed. The coordinates are NaN then.
     */
    virtual bool findPosition(long double jde) = 0;

    /**
     * @return true if the Moon is nearer to Earth than the planet.
     * @param id which moon?
     */
    inline bool inFront(int id) const { return InFront[id]; }

    /**
     * @return the X-coordinate in the planet-centered coord. system.
     * @param i which moon?
     */
    double x(int i) const { return XP[i]; }

    /**
     * @return the Y-coordinate in the planet-centered coord. system.
     * @param i which moon?
     */
    double y(int i) const { return YP[i]; }

    /**
     * @return the Z-coordinate in the Planet-centered coord. system.
     * @param i which moon?
     */
    double z(int i) const { return ZP[i]; }

    /** @return the number of moons around the planet */
    int nMoons() const { return Names.size(); }

  protected:
    /** Reset all coordinates to NaN */
    void invalidatePositions();

    QVector<QString> Names;
    QVector<double> Magnitudes;
    QVector<bool> InFront;
    //the rectangular position, relative to the planet. X-axis is equator of the planet; units are planet Radius
    QVector<double> XP, YP, ZP;

  private:
    PlanetMoons(const PlanetMoons &);
    PlanetMoons &operator=(const PlanetMoons &);
};
