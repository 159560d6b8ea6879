/*
    SPDX-FileCopyrightText: 2009 Vipul Kumar Singh <vipulkrsingh@gmail.com>
    SPDX-FileCopyrightText: 2002-2005 Jason Harris <kstars@30doradus.org>

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "saturnmoonnumbers.h"

#include "ksaturn_debug.h"

SaturnMoonNumbers::SaturnMoonNumbers(long double jd, const EclipticPosition &saturn1950)
    : days(jd), RingInclination(RING_INCLINATION), RingNode(RING_NODE), Lambda0(saturn1950.longitude),
      Beta0(saturn1950.latitude), Delta(saturn1950.radius)
{
    const double t = static_cast<double>(jd);

    T[0]  = 0.0;
    T[1]  = t - 2411093.0;
    T[2]  = T[1] / 365.25;
    T[3]  = (t - 2433282.423) / 365.25 + 1950.0;
    T[4]  = t - 2411368.0;
    T[5]  = T[4] / 365.25;
    T[6]  = t - 2415020.0;
    T[7]  = T[6] / 36525.0;
    T[8]  = T[6] / 365.25;
    T[9]  = (t - 2442000.5) / 365.25;
    T[10] = t - 2409786.0;
    T[11] = T[10] / 36525.0;

    Wr[0] = dms(5.095 * (T[3] - 1866.39)).radians();
    Wr[1] = dms(74.4 + 32.39 * T[2]).radians();
    Wr[2] = dms(134.3 + 92.62 * T[2]).radians();
    Wr[3] = dms(42.0 - 0.5118 * T[5]).radians();
    Wr[4] = dms(276.59 + 0.5118 * T[5]).radians();
    Wr[5] = dms(267.2635 + 1222.1136 * T[7]).radians();
    Wr[6] = dms(175.4762 + 1221.5515 * T[7]).radians();
    Wr[7] = dms(2.4891 + 0.002435 * T[7]).radians();
    Wr[8] = dms(113.35 - 0.2597 * T[7]).radians();

    E1 = 0.05589 - 0.000346 * T[7];

    qCDebug(KSATURN) << "Saturn moon arguments for JD" << static_cast<double>(jd) << "Saturn at"
                     << Lambda0.toDMSString() << Beta0.toDMSString(true) << Delta << "AU";
}
