/*
    SPDX-FileCopyrightText: 2016 Akarsh Simha <akarsh.simha@kdemail.net>

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "cachingdms.h"

#include <cmath>

CachingDms::CachingDms(const double &x) : dms(x)
{
    dms::SinCos(m_sin, m_cos);
}

CachingDms::CachingDms(const dms &angle) : dms(angle.Degrees())
{
    dms::SinCos(m_sin, m_cos);
}

void CachingDms::setUsing_atan2(const double &y, const double &x)
{
    dms::setRadians(atan2(y, x));
    double r = sqrt(y * y + x * x);
    m_cos    = x / r;
    m_sin    = y / r;
}

void CachingDms::setUsing_asin(const double &sine)
{
    dms::setRadians(asin(sine));
    m_sin = sine;
    // cosine is non-negative over the range of asin
    m_cos = std::sqrt(1 - sine * sine);
}
