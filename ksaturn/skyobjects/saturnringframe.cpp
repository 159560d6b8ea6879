/*
    SPDX-FileCopyrightText: 2026 The KSaturn Team

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "saturnringframe.h"

#include "saturnmoonnumbers.h"

#include <cmath>

Eigen::Vector3d SaturnRingFrame::toSaturnCentric(const Eigen::Vector3d &v, const SaturnMoonNumbers &num)
{
    double s1, c1, s2, c2, sinL, cosL, sinB, cosB;
    num.ringInclination()->SinCos(s1, c1);
    num.ringNode()->SinCos(s2, c2);
    num.saturnLongitude()->SinCos(sinL, cosL);
    num.saturnLatitude()->SinCos(sinB, cosB);

    Eigen::Matrix3d inclination;
    inclination << 1, 0, 0, 0, c1, -s1, 0, s1, c1;

    Eigen::Matrix3d node;
    node << c2, -s2, 0, s2, c2, 0, 0, 0, 1;

    Eigen::Matrix3d longitude;
    longitude << sinL, -cosL, 0, cosL, sinL, 0, 0, 0, 1;

    Eigen::Matrix3d latitude;
    latitude << 1, 0, 0, 0, cosB, sinB, 0, -sinB, cosB;

    return latitude * (longitude * (node * (inclination * v)));
}

RingFrameReference SaturnRingFrame::reference(const SaturnMoonNumbers &num)
{
    RingFrameReference pole{ 0.0 };
    RingFrameReference ref;
    rotate(Eigen::Vector3d::UnitZ(), pole, num, &ref.D);
    return ref;
}

Eigen::Vector3d SaturnRingFrame::rotate(const Eigen::Vector3d &v, const RingFrameReference &ref,
                                        const SaturnMoonNumbers &num, double *D)
{
    const Eigen::Vector3d abc = toSaturnCentric(v, num);

    if (D)
        *D = atan2(abc.x(), abc.z());

    const double sinD = sin(ref.D);
    const double cosD = cos(ref.D);

    return Eigen::Vector3d(abc.x() * cosD - abc.z() * sinD, abc.x() * sinD + abc.z() * cosD, abc.y());
}
