/*
    SPDX-FileCopyrightText: 2026 The KSaturn Team

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TEST_SATURNMOONS_H
#define TEST_SATURNMOONS_H

#include <QtTest/QtTest>

/**
 * @class TestSaturnMoons
 * @short Tests for the apparent positions of the moons of Saturn
 */

class TestSaturnMoons : public QObject
{
        Q_OBJECT

    public:
        TestSaturnMoons();
        ~TestSaturnMoons() override;

    private slots:
        void init();

        void testRingTilt_data();
        void testRingTilt();
        void testRingPlane();

        void testKnownPositions_data();
        void testKnownPositions();

        void testDeterminism();
        void testSingleMoon();
        void testApparentMotion();
        void testCorrections();
        void testCustomPrecession();

        void testNonFiniteTime();
        void testRangeValidation();
        void testMissingGeometry();

        void testNames();

    private:
        bool validateRange { false };
        double minimumJD { 0 };
        double maximumJD { 0 };
        bool lightTime { true };
        bool perspective { true };
};

#endif
