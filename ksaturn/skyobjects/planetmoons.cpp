/*
    SPDX-FileCopyrightText: Vipul Kumar Singh <vipulkrsingh@gmail.com>
    SPDX-FileCopyrightText: Médéric Boquien <mboquien@free.fr>

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "planetmoons.h"

#include "nan.h"

QString PlanetMoons::name(int id) const
{
    return Names[id];
}

void PlanetMoons::invalidatePositions()
{
    XP.fill(NaN::d);
    YP.fill(NaN::d);
    ZP.fill(NaN::d);
    InFront.fill(false);
}
