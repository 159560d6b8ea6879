/*
    SPDX-FileCopyrightText: 2001 Jason Harris <jharris@30doradus.org>

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ksaturndatetime.h"
#include "ksaturn_debug.h"
#include "Options.h"
#include "planetgeometry.h"
#include "saturnmoons.h"
#include "version.h"

#include <KAboutData>
#include <KLocalizedString>

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>

static const char description[] = I18N_NOOP("Apparent positions of the major satellites of Saturn");

namespace
{
bool parseAngle(const QCommandLineParser &parser, const QString &option, dms &angle)
{
    if (!angle.setFromString(parser.value(option), true))
    {
        qCWarning(KSATURN) << "Unable to parse angle" << option << ":" << parser.value(option);
        return false;
    }
    return true;
}

void printPosition(QTextStream &out, SaturnMoons::MoonID id, const MoonPosition &pos)
{
    out << QString("%1 %2 %3 %4  %5")
               .arg(SaturnMoons::translatedName(id), -10)
               .arg(pos.x, 9, 'f', 3)
               .arg(pos.y, 9, 'f', 3)
               .arg(pos.z, 9, 'f', 3)
               .arg(pos.z < 0.0 ? i18n("in front") : i18n("behind"))
        << '\n';
}
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationVersion(KSATURN_VERSION);

    KLocalizedString::setApplicationDomain("ksaturn");

    KAboutData aboutData("ksaturnmoons", i18n("KSaturn"), KSATURN_VERSION, i18n(description), KAboutLicense::GPL,
                         i18n("(c) The KSaturn Team"));
    aboutData.addAuthor(i18n("Vipul Kumar Singh"), i18n("Saturn moons"), "vipulkrsingh@gmail.com");
    aboutData.addAuthor(i18n("Jason Harris"), i18n("Original Author"), "jharris@30doradus.org",
                        "http://www.30doradus.org");
    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);
    parser.setApplicationDescription(aboutData.shortDescription());
    parser.addOption(QCommandLineOption("jd", i18n("Julian Ephemeris Day of the observation."), "value"));
    parser.addOption(QCommandLineOption("date", i18n("Date and time of the observation (TD)."), "string"));
    parser.addOption(
        QCommandLineOption("longitude", i18n("Apparent ecliptic longitude of Saturn, of date."), "degrees"));
    parser.addOption(
        QCommandLineOption("latitude", i18n("Apparent ecliptic latitude of Saturn, of date."), "degrees"));
    parser.addOption(QCommandLineOption("distance", i18n("Distance from Earth to Saturn."), "AU"));
    parser.addOption(QCommandLineOption("moon", i18n("Only compute this moon."), "name"));
    parser.addOption(
        QCommandLineOption("validate", i18n("Reject times outside the valid range of the satellite theories.")));

    parser.process(app);
    aboutData.processCommandLine(&parser);

    //parse the time of observation
    long double jde = NaN::ld;
    if (parser.isSet("jd"))
    {
        bool ok(false);
        jde = parser.value("jd").toDouble(&ok);
        if (!ok)
        {
            qCWarning(KSATURN) << "Unable to parse Julian Day: " << parser.value("jd");
            return 1;
        }
    }
    else if (parser.isSet("date"))
    {
        KSaturnDateTime dt = KSaturnDateTime::fromString(parser.value("date"));
        if (!dt.isValid())
            return 1;
        jde = dt.djd();
    }
    else
    {
        qCWarning(KSATURN) << "One of --jd or --date is required";
        return 1;
    }

    //parse Saturn's position
    dms longitude, latitude;
    if (!parser.isSet("longitude") || !parser.isSet("latitude") || !parser.isSet("distance"))
    {
        qCWarning(KSATURN) << "Saturn's --longitude, --latitude and --distance are required";
        return 1;
    }
    if (!parseAngle(parser, "longitude", longitude) || !parseAngle(parser, "latitude", latitude))
        return 1;

    bool ok(false);
    double distance = parser.value("distance").toDouble(&ok);
    if (!ok || distance <= 0.0)
    {
        qCWarning(KSATURN) << "Unable to parse distance: " << parser.value("distance");
        return 1;
    }

    if (parser.isSet("validate"))
        Options::setValidateEphemerisRange(true);

    FixedPlanetGeometry geometry;
    geometry.setPosition(KSaturn::SATURN, EclipticPosition(longitude, latitude, distance));
    SaturnMoons moons(&geometry);

    QTextStream out(stdout);

    if (parser.isSet("moon"))
    {
        SaturnMoons::MoonID id = SaturnMoons::moonFromName(parser.value("moon"), ok);
        if (!ok)
        {
            qCWarning(KSATURN) << "Unknown moon: " << parser.value("moon");
            return 1;
        }

        MoonPosition pos;
        if (!moons.findMoonPosition(jde, id, pos))
            return 1;
        printPosition(out, id, pos);
        return 0;
    }

    if (!moons.findPosition(jde))
        return 1;

    for (int i = 0; i < moons.nMoons(); ++i)
    {
        MoonPosition pos{ moons.x(i), moons.y(i), moons.z(i) };
        printPosition(out, static_cast<SaturnMoons::MoonID>(i), pos);
    }

    return 0;
}
