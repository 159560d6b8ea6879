/*
    SPDX-FileCopyrightText: 2026 The KSaturn Team

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "eclipticprecession.h"

#include "cachingdms.h"
#include "ksaturndatetime.h"

#include <cmath>

EclipticPosition EclipticPrecession::precessEcliptic(const EclipticPosition &pos, long double jd0, long double jdf) const
{
    //Julian centuries of the starting epoch from J2000, and of the interval
    const double T  = static_cast<double>((jd0 - J2000) / 36525.0L);
    const double t  = static_cast<double>((jdf - jd0) / 36525.0L);
    const double T2 = T * T;
    const double t2 = t * t;
    const double t3 = t2 * t;

    //the three angles are polynomials in arcseconds
    const dms eta(((47.0029 - 0.06603 * T + 0.000598 * T2) * t + (-0.03302 + 0.000598 * T) * t2 + 0.00006 * t3) /
                  3600.0);
    const dms Pi(174.876384 + (3289.4789 * T + 0.60622 * T2 - (869.8089 + 0.50491 * T) * t + 0.03536 * t2) / 3600.0);
    const dms p(((5029.0966 + 2.22226 * T - 0.000042 * T2) * t + (1.11113 - 0.000042 * T) * t2 - 0.000006 * t3) /
                3600.0);

    double sinEta, cosEta, sinB, cosB, sinPL, cosPL;
    eta.SinCos(sinEta, cosEta);
    pos.latitude.SinCos(sinB, cosB);
    (Pi - pos.longitude).SinCos(sinPL, cosPL);

    const double A = cosEta * cosB * sinPL - sinEta * sinB;
    const double B = cosB * cosPL;
    const double C = cosEta * sinB + sinEta * cosB * sinPL;

    //A / B is the tangent of (p + Pi - lambda)
    CachingDms pPiLambda;
    pPiLambda.setUsing_atan2(A, B);
    CachingDms lat;
    lat.setUsing_asin(C);

    dms longitude = p + Pi - pPiLambda;
    longitude.reduceToRange(dms::ZERO_TO_2PI);

    return EclipticPosition(longitude, lat, pos.radius);
}
