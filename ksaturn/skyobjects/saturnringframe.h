/*
    SPDX-FileCopyrightText: 2026 The KSaturn Team

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#pragma once

#if __GNUC__ > 5
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wignored-attributes"
#endif
#if __GNUC__ > 6
#pragma GCC diagnostic ignored "-Wint-in-bool-context"
#endif
#include <Eigen/Core>
#if __GNUC__ > 5
#pragma GCC diagnostic pop
#endif

class SaturnMoonNumbers;

/**
 * @struct RingFrameReference
 * @short Orientation of Saturn's pole as seen from Earth, shared by all moons of one evaluation.
 */
struct RingFrameReference
{
    /** Auxiliary angle D of the pole vector, in radians */
    double D;
};

/**
 * @class SaturnRingFrame
 * @short Rotates vectors from Saturn's ring plane into the apparent sky frame.
 *
 * The rotation is done in four steps: about the X axis by the inclination of
 * the ring plane, about the Z axis by the longitude of its node, into the
 * ecliptic using Saturn's longitude and about the new X axis by Saturn's
 * latitude. A last rotation by the auxiliary angle D of the pole brings the
 * result to X along Saturn's equator, Y along its axis and Z along the line
 * of sight.
 *
 * D is obtained by rotating the unit vector of the ring plane pole, for which
 * D is taken as zero. Satellite vectors are then rotated with that D:
 * @code
 * const RingFrameReference ref = SaturnRingFrame::reference(num);
 * const Eigen::Vector3d sky = SaturnRingFrame::rotate(ringPlaneVector, ref, num);
 * @endcode
 */
class SaturnRingFrame
{
  public:
    /** @return the reference orientation for the arguments @p num */
    static RingFrameReference reference(const SaturnMoonNumbers &num);

    /**
     * @short Rotate a ring plane vector into the sky frame.
     * @param v vector in the ring plane frame, in Saturn radii
     * @param ref pole orientation from reference()
     * @param num arguments holding the ring plane and Saturn's position
     * @param D if not null, receives the auxiliary angle of @p v itself
     * @return X, Y, Z in the sky frame
     */
    static Eigen::Vector3d rotate(const Eigen::Vector3d &v, const RingFrameReference &ref, const SaturnMoonNumbers &num,
                                  double *D = nullptr);

  private:
    /** @return @p v after the four plane rotations, as (A4, B4, C4) */
    static Eigen::Vector3d toSaturnCentric(const Eigen::Vector3d &v, const SaturnMoonNumbers &num);
};
