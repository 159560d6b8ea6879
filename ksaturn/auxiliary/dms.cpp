/*
    SPDX-FileCopyrightText: 2001 Jason Harris <jharris@30doradus.org>

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "dms.h"

#include <QLocale>
#include <QRegExp>
#include <QStringList>

bool dms::setFromString(const QString &str, bool isDeg)
{
    const double scale = isDeg ? 1.0 : 15.0;
    bool checkValue(false), negative(false);
    QString entry = str.trimmed();
    entry.remove(QRegExp("[hdms'\"°]"));

    //QString::toDouble() requires that the decimal symbol is "."
    entry.replace(QLocale().decimalPoint(), ".");

    if (entry.isEmpty())
    {
        dms::setD(NaN::d);
        return false;
    }

    //try parsing a simple number
    double x = entry.toDouble(&checkValue);
    if (checkValue)
    {
        dms::setD(scale * x);
        return true;
    }

    QStringList fields;
    if (entry.contains(':'))
        fields = entry.split(':', Qt::SkipEmptyParts);
    else
        fields = entry.split(' ', Qt::SkipEmptyParts);

    //anything with one field is invalid!
    if (fields.count() < 2)
    {
        dms::setD(NaN::d);
        return false;
    }

    //Missing seconds are zero; anything after the 3rd field is ignored
    if (fields.count() == 2)
        fields.append(QString("0"));

    int d = fields[0].toInt(&checkValue);
    bool badEntry = !checkValue;
    double m = fields[1].toDouble(&checkValue);
    badEntry |= !checkValue;
    double s = fields[2].toDouble(&checkValue);
    badEntry |= !checkValue;

    if (badEntry)
    {
        dms::setD(NaN::d);
        return false;
    }

    //A leading "-0" keeps its sign
    if (fields[0].at(0) == '-')
        negative = true;

    double value = (double)abs(d) + fabs(m) / 60. + fabs(s) / 3600.;
    if (negative || d < 0 || m < 0 || s < 0)
        value = -value;

    dms::setD(scale * value);
    return true;
}

int dms::arcmin() const
{
    if (std::isnan(D))
        return 0;

    int am = int(60.0 * (fabs(D) - abs(degree())));
    if (D < 0.0 && D > -1.0) //angle less than zero, but greater than -1.0
    {
        am = -1 * am;
    }
    return am;
}

int dms::arcsec() const
{
    if (std::isnan(D))
        return 0;

    int as = int(60.0 * (60.0 * (fabs(D) - abs(degree())) - abs(arcmin())));
    //If the angle is slightly less than 0.0, give ArcSec a neg. sgn.
    if (degree() == 0 && arcmin() == 0 && D < 0.0)
    {
        as = -1 * as;
    }
    return as;
}

const dms dms::reduce() const
{
    if (std::isnan(D))
        return dms(0.0);

    return dms(D - 360.0 * floor(D / 360.0));
}

const QString dms::toDMSString(const bool forceSign) const
{
    QChar zero('0');
    char pm(' ');

    // set the LSD transition in the middle of the half precision range
    double half_precision = 1.0 / 7200.0;
    if (Degrees() < 0.0)
        half_precision = -half_precision;
    dms angle(Degrees() + half_precision);

    int dd = abs(angle.degree());
    int dm = abs(angle.arcmin());
    int ds = abs(angle.arcsec());

    if (Degrees() < 0.0)
        pm = '-';
    else if (forceSign && Degrees() > 0.0)
        pm = '+';

    return QString("%1%2° %3\' %4\"").arg(pm).arg(dd, 2, 10, zero).arg(dm, 2, 10, zero).arg(ds, 2, 10, zero);
}

dms dms::fromString(const QString &st, bool deg)
{
    dms result;
    result.setFromString(st, deg);
    return result;
}

void dms::reduceToRange(enum dms::AngleRanges range)
{
    if (std::isnan(D))
        return;

    switch (range)
    {
        case MINUSPI_TO_PI:
            D -= 360. * floor((D + 180.) / 360.);
            break;
        case ZERO_TO_2PI:
            D -= 360. * floor(D / 360.);
    }
}
