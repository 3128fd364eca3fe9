#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "../src/global/macros.h"

#include <QObject>

class NODISCARD_QOBJECT TestColorSpace final : public QObject
{
    Q_OBJECT

public:
    TestColorSpace();
    ~TestColorSpace() final;

private Q_SLOTS:
    static void selfTest();
    static void rgbConstructionTest();
    static void hexParsingTest_data();
    static void hexParsingTest();
    static void printingTest();
    static void labKnownValuesTest();
    static void labRoundTripTest();
    static void labThresholdTest();
    static void hsvRoundTripTest();
    static void distanceMetricTest();
};
