#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "../src/global/macros.h"

#include <QObject>

class NODISCARD_QOBJECT TestPalette final : public QObject
{
    Q_OBJECT

public:
    TestPalette();
    ~TestPalette() final;

private Q_SLOTS:
    static void selfTest();
    static void colorNameTest_data();
    static void colorNameTest();
    static void defaultRegistryTest();
    static void lookupByCodeTest();
    static void lookupByNameTest();
    static void exactMatchTest();
    static void customTableTest();
    static void variationTest();
    static void conflictTest();
};
