/*
    SPDX-FileCopyrightText: 2013 Akarsh Simha <akarsh.simha@kdemail.net>

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#pragma once

#include <limits>

/** Quiet NaN values used to mark rejected or unset numeric results. */
namespace NaN
{
const double d       = std::numeric_limits<double>::quiet_NaN();
const long double ld = std::numeric_limits<long double>::quiet_NaN();
}
