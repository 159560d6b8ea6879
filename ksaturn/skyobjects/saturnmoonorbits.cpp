/*
    SPDX-FileCopyrightText: 2009 Vipul Kumar Singh <vipulkrsingh@gmail.com>

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "saturnmoonorbits.h"

#include "saturnmoonnumbers.h"
#include "ksaturn_debug.h"

#include <cmath>

namespace
{
// Short form of dms(x).radians() for the long series below
inline double rad(double degrees)
{
    return dms(degrees).radians();
}

/** Orbit plane of Titan before its periodic terms */
struct TitanPlane
{
    double i1;  // inclination
    double O1;  // node
    double phi; // node of the ring plane on Titan's orbit
    double s;   // sine of the mutual inclination
};

TitanPlane titanPlane(const SaturnMoonNumbers &num)
{
    TitanPlane plane;
    plane.i1 = rad(27.45141 + 0.295999 * cos(num.W(3)));
    plane.O1 = rad(168.66925 + 0.628808 * sin(num.W(3)));

    const double a1 = sin(num.W(7)) * sin(plane.O1 - num.W(8));
    const double a2 = cos(num.W(7)) * sin(plane.i1) - sin(num.W(7)) * cos(plane.i1) * cos(plane.O1 - num.W(8));
    plane.phi       = atan2(a1, a2);
    plane.s         = sqrt(a1 * a1 + a2 * a2);
    return plane;
}

const double titanG0 = 102.8623; // degrees
}

OrbitalElements SaturnMoonOrbits::elements(SaturnMoons::MoonID id, const SaturnMoonNumbers &num)
{
    using Calculator = OrbitalElements (*)(const SaturnMoonNumbers &);
    static const Calculator calculators[SaturnMoons::NUM_MOONS] = { &mimas, &enceladus, &tethys,   &dione,
                                                                    &rhea,  &titan,     &hyperion, &iapetus };

    const OrbitalElements el = calculators[id](num);
    qCDebug(KSATURN) << SaturnMoons::untranslatedName(id) << "lambda" << el.lambda << "gamma" << el.gamma << "omega"
                     << el.omega << "r" << el.r;
    return el;
}

FinalizedOrbit SaturnMoonOrbits::finalize(double e, double a, double omega, double i, double lambda1, double p,
                                          const SaturnMoonNumbers &num)
{
    double s1, c1;
    num.ringInclination()->SinCos(s1, c1);

    const double e2 = e * e;
    const double M  = lambda1 - p;

    FinalizedOrbit orbit;
    orbit.C = e * ((2 - e2 * (0.25 - 0.0520833333 * e2)) * sin(M) +
                   e * ((1.25 - 0.458333333 * e2) * sin(2 * M) +
                        e * ((1.083333333 - 0.671875 * e2) * sin(3 * M) +
                             e * (1.072917 * sin(4 * M) + e * 1.142708 * sin(5 * M)))));
    orbit.r = a * (1 - e2) / (1 + e * cos(M + orbit.C));

    const double g  = omega - num.ringNode()->radians();
    const double a1 = sin(i) * sin(g);
    const double a2 = c1 * sin(i) * cos(g) - s1 * cos(i);
    orbit.gamma     = asin(sqrt(a1 * a1 + a2 * a2));

    const double u = atan2(a1, a2);
    orbit.w        = num.ringNode()->radians() + u;

    const double h   = c1 * sin(i) - s1 * cos(i) * cos(g);
    const double psi = atan2(s1 * sin(g), h);
    orbit.lambda     = lambda1 + orbit.C + u - g - psi;

    return orbit;
}

OrbitalElements SaturnMoonOrbits::fromFinalized(const FinalizedOrbit &orbit)
{
    return OrbitalElements{ orbit.lambda, orbit.gamma, orbit.w, orbit.r };
}

OrbitalElements SaturnMoonOrbits::mimas(const SaturnMoonNumbers &num)
{
    const double W0 = num.W(0);
    const double L  = rad(127.64 + 381.994497 * num.t(1) - 43.57 * sin(W0) - 0.720 * sin(3 * W0) - 0.02144 * sin(5 * W0));
    const double p  = rad(106.1 + 365.549 * num.t(2));
    const double M  = L - p;
    const double C  = rad(2.18287 * sin(M) + 0.025988 * sin(2 * M) + 0.00043 * sin(3 * M));

    return OrbitalElements{ L + C, rad(1.563), rad(54.5 - 365.072 * num.t(2)), 3.06879 / (1 + 0.01905 * cos(M + C)) };
}

OrbitalElements SaturnMoonOrbits::enceladus(const SaturnMoonNumbers &num)
{
    const double L = rad(200.317 + 262.7319002 * num.t(1) + 0.25667 * sin(num.W(1)) + 0.20883 * sin(num.W(2)));
    const double p = rad(309.107 + 123.44121 * num.t(2));
    const double M = L - p;
    const double C = rad(0.55577 * sin(M) + 0.00168 * sin(2 * M));

    return OrbitalElements{ L + C, rad(0.0262), rad(348 - 151.95 * num.t(2)), 3.94118 / (1 + 0.00485 * cos(M + C)) };
}

OrbitalElements SaturnMoonOrbits::tethys(const SaturnMoonNumbers &num)
{
    const double W0     = num.W(0);
    const double lambda = rad(285.306 + 190.69791226 * num.t(1) + 2.063 * sin(W0) + 0.03409 * sin(3 * W0) +
                              0.001015 * sin(5 * W0));

    // circular orbit
    return OrbitalElements{ lambda, rad(1.0976), rad(111.33 - 72.2441 * num.t(2)), 4.880998 };
}

OrbitalElements SaturnMoonOrbits::dione(const SaturnMoonNumbers &num)
{
    const double L = rad(254.712 + 131.53493193 * num.t(1) - 0.0215 * sin(num.W(1)) - 0.01733 * sin(num.W(2)));
    const double p = rad(174.8 + 30.82 * num.t(2));
    const double M = L - p;
    const double C = rad(0.24717 * sin(M) + 0.00033 * sin(2 * M));

    return OrbitalElements{ L + C, rad(0.0139), rad(232 - 30.27 * num.t(2)), 6.24871 / (1 + 0.002157 * cos(M + C)) };
}

OrbitalElements SaturnMoonOrbits::rhea(const SaturnMoonNumbers &num)
{
    const double W3   = num.W(3);
    const double W4   = num.W(4);
    const double pdsh = rad(342.7 + 10.057 * num.t(2));
    const double a1   = 0.000265 * sin(pdsh) + 0.01 * sin(W4);
    const double a2   = 0.000265 * cos(pdsh) + 0.01 * cos(W4);
    const double e    = sqrt(a1 * a1 + a2 * a2);
    const double p    = atan2(a1, a2);
    const double N    = rad(345 - 10.057 * num.t(2));

    const double lambda1 = rad(359.244 + 79.69004720 * num.t(1) + 0.086754 * sin(N));
    const double i       = rad(28.0362 + 0.346898 * cos(N) + 0.01930 * cos(W3));
    const double omega   = rad(168.8034 + 0.736936 * sin(N) + 0.041 * sin(W3));

    return fromFinalized(finalize(e, 8.725924, omega, i, lambda1, p, num));
}

double SaturnMoonOrbits::titanPericenter(const SaturnMoonNumbers &num, int passes)
{
    const TitanPlane plane = titanPlane(num);
    const double W4        = num.W(4);
    const double g0        = rad(titanG0);

    // the correction depends on g, which depends on the corrected pericenter
    double g     = W4 - plane.O1 - plane.phi;
    double wdash = W4;
    for (int pass = 0; pass < passes; ++pass)
    {
        wdash = W4 + rad(0.37515) * (sin(2 * g) - sin(2 * g0));
        g     = wdash - plane.O1 - plane.phi;
    }
    return wdash;
}

OrbitalElements SaturnMoonOrbits::titan(const SaturnMoonNumbers &num)
{
    const TitanPlane plane = titanPlane(num);
    const double W5        = num.W(5);
    const double W6        = num.W(6);
    const double W7        = num.W(7);
    const double W8        = num.W(8);
    const double e1        = num.e1();
    const double g0        = rad(titanG0);

    const double L     = rad(261.1582 + 22.57697855 * num.t(4) + 0.074025 * sin(num.W(3)));
    const double wdash = titanPericenter(num);
    const double g     = wdash - plane.O1 - plane.phi;

    const double edash = 0.029092 + 0.00019048 * (cos(2 * g) - cos(2 * g0));
    const double q     = 2 * (W5 - wdash);
    const double b1    = sin(plane.i1) * sin(plane.O1 - W8);
    const double b2    = cos(W7) * sin(plane.i1) * cos(plane.O1 - W8) - sin(W7) * cos(plane.i1);
    const double theta = atan2(b1, b2) + W8;
    const double e     = edash * (1 + 0.002778797 * cos(q));
    const double p     = wdash + rad(0.159215) * sin(q);
    const double u     = 2 * (W5 - theta) + plane.phi;
    const double h     = 0.9375 * edash * edash * sin(q) + 0.1875 * plane.s * plane.s * sin(2 * (W5 - theta));

    const double lambda1 = L - rad(0.254744) * (e1 * (sin(W6) + 0.75 * e1 * sin(2 * W6)) + h);
    const double i       = plane.i1 + rad(0.031843) * plane.s * cos(u);
    const double omega   = plane.O1 + rad(0.031843) * plane.s * sin(u) / sin(plane.i1);

    return fromFinalized(finalize(e, 20.216193, omega, i, lambda1, p, num));
}

OrbitalElements SaturnMoonOrbits::hyperion(const SaturnMoonNumbers &num)
{
    const double t6 = num.t(6);
    const double t8 = num.t(8);

    const double eta    = rad(92.39 + 0.5621071 * t6);
    const double zeta   = rad(148.19 - 19.18 * t8);
    const double theta  = rad(184.8 - 35.41 * num.t(9));
    const double theta1 = theta - rad(7.5);
    const double as     = rad(176 + 12.22 * t8);
    const double bs     = rad(8 + 24.44 * t8);
    const double cs     = bs + rad(5);
    const double wdash  = rad(69.898 - 18.67088 * t8);
    const double phi    = 2 * (wdash - num.W(5));
    const double chi    = rad(94.9 - 2.292 * t8);

    const double a = 24.50601 - 0.08686 * cos(eta) - 0.00166 * cos(zeta + eta) + 0.00175 * cos(zeta - eta);
    const double e = 0.103458 - 0.004099 * cos(eta) - 0.000167 * cos(zeta + eta) + 0.000235 * cos(zeta - eta) +
                     0.02303 * cos(zeta) - 0.00212 * cos(2 * zeta) + 0.000151 * cos(3 * zeta) + 0.00013 * cos(phi);
    const double p = wdash + rad(0.15648 * sin(chi) - 0.4457 * sin(eta) - 0.2657 * sin(zeta + eta) -
                                 0.3573 * sin(zeta - eta) - 12.872 * sin(zeta) + 1.668 * sin(2 * zeta) -
                                 0.2419 * sin(3 * zeta) - 0.07 * sin(phi));

    const double lambda1 = rad(177.047 + 16.91993829 * t6 + 0.15648 * sin(chi) + 9.142 * sin(eta) +
                               0.007 * sin(2 * eta) - 0.014 * sin(3 * eta) + 0.2275 * sin(zeta + eta) +
                               0.2112 * sin(zeta - eta) - 0.26 * sin(zeta) - 0.0098 * sin(2 * zeta) -
                               0.013 * sin(as) + 0.017 * sin(bs) - 0.0303 * sin(phi));
    const double i = rad(27.3347 + 0.643486 * cos(chi) + 0.315 * cos(num.W(3)) + 0.018 * cos(theta) - 0.018 * cos(cs));
    const double omega = rad(168.6812 + 1.40136 * cos(chi) + 0.68599 * sin(num.W(3)) - 0.0392 * sin(cs) +
                             0.0366 * sin(theta1));

    return fromFinalized(finalize(e, a, omega, i, lambda1, p, num));
}

OrbitalElements SaturnMoonOrbits::iapetus(const SaturnMoonNumbers &num)
{
    const double t7  = num.t(7);
    const double t11 = num.t(11);

    const double L      = rad(261.1582 + 22.57697855 * num.t(4));
    const double wdash1 = rad(91.796 + 0.562 * t7);
    const double psi    = rad(4.367 - 0.195 * t7);
    const double theta  = rad(146.819 - 3.198 * t7);
    const double phi    = rad(60.470 + 1.521 * t7);
    const double PHI    = rad(205.055 - 2.091 * t7);
    const double edash  = 0.028298 + 0.001156 * t11;
    const double wdash0 = rad(352.91 + 11.71 * t11);
    const double mu     = rad(76.3852 + 4.53795125 * num.t(10));
    const double i1     = rad(18.4602 - t11 * (0.9518 + t11 * (0.072 - 0.0054 * t11)));
    const double O1     = rad(143.198 - t11 * (3.919 - t11 * (0.116 + 0.008 * t11)));

    const double l      = mu - wdash0;
    const double g      = wdash0 - O1 - psi;
    const double g1     = wdash0 - O1 - phi;
    const double ls     = num.W(5) - wdash1;
    const double gs     = wdash1 - theta;
    const double lT     = L - num.W(4);
    const double gT     = num.W(4) - PHI;
    const double u1     = 2 * (l + g - ls - gs);
    const double u2     = l + g1 - lT - gT;
    const double u3     = l + 2 * (g - ls - gs);
    const double u4     = lT + gT - g1;
    const double u5     = 2 * (ls + gs);

    const double a = 58.935028 + 0.004638 * cos(u1) + 0.058222 * cos(u2);
    const double e = edash - 0.0014097 * cos(g1 - gT) + 0.0003733 * cos(u5 - 2 * g) + 0.0001180 * cos(u3) +
                     0.0002408 * cos(l) + 0.0002849 * cos(l + u2) + 0.0006190 * cos(u4);
    const double w = rad(0.08077 * sin(g1 - gT) + 0.02139 * sin(u5 - 2 * g) - 0.00676 * sin(u3) + 0.01380 * sin(l) +
                         0.01632 * sin(l + u2) + 0.03547 * sin(u4));
    const double p = wdash0 + w / edash;

    const double lambda1 = mu + rad(-0.04299 * sin(u2) - 0.00789 * sin(u1) - 0.06312 * sin(ls) - 0.00295 * sin(2 * ls) -
                                    0.02231 * sin(u5) + 0.00650 * sin(u5 + psi));
    const double i  = i1 + rad(0.04204 * cos(u5 + psi) + 0.00235 * cos(l + g1 + lT + gT + phi) + 0.00360 * cos(u2 + phi));
    const double wd = rad(0.04204 * sin(u5 + psi) + 0.00235 * sin(l + g1 + lT + gT + phi) + 0.00358 * sin(u2 + phi));

    return fromFinalized(finalize(e, a, O1 + wd / sin(i1), i, lambda1, p, num));
}
