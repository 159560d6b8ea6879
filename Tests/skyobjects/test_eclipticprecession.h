/*
    SPDX-FileCopyrightText: 2026 The KSaturn Team

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TEST_ECLIPTICPRECESSION_H
#define TEST_ECLIPTICPRECESSION_H

#include <QtTest/QtTest>

/**
 * @class TestEclipticPrecession
 * @short Tests for the precession of ecliptic coordinates between equinoxes
 */

class TestEclipticPrecession : public QObject
{
        Q_OBJECT

    public:
        TestEclipticPrecession();
        ~TestEclipticPrecession() override = default;

    private slots:
        void testPrecess_data();
        void testPrecess();

        void testRoundTrip();
        void testIdentity();
        void testRadiusUnchanged();
};

#endif
