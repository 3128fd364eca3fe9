#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "../src/global/macros.h"

#include <QObject>

class NODISCARD_QOBJECT TestConfiguration final : public QObject
{
    Q_OBJECT

public:
    TestConfiguration();
    ~TestConfiguration() final;

private Q_SLOTS:
    static void defaultsTest();
    static void roundTripTest();
    static void invalidValuesTest();
    static void profilePathTest();
};
