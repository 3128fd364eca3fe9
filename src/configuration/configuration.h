#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "../color/DistanceMetric.h"
#include "../color/Resolver.h"
#include "../global/RuleOf5.h"
#include "../global/macros.h"

#include <QSettings>
#include <QString>

#define SUBGROUP() \
    friend class Configuration; \
    void read(const QSettings &conf); \
    void write(QSettings &conf) const

class NODISCARD Configuration final
{
public:
    // Platform settings, or the INI file named by TERMCOLOR_PROFILE_PATH.
    void read();
    void write() const;
    void reset();

    // Same, against an explicit settings object.
    void readFrom(QSettings &conf);
    void writeTo(QSettings &conf) const;

public:
    struct NODISCARD ColorSettings final
    {
        OutputPaletteEnum outputPalette = OutputPaletteEnum::XTERM_256;
        DistanceMetricEnum distanceMetric = DEFAULT_DISTANCE_METRIC;
        bool useApproximationCache = true;
        bool preferRgb = false;

        NODISCARD ResolverOptions getResolverOptions() const;

    private:
        SUBGROUP();
    } colorSettings;

public:
    Configuration() = default;
    ~Configuration() = default;
    DEFAULT_CTORS_AND_ASSIGN_OPS(Configuration);
};

#undef SUBGROUP

/// Must be called before you can call setConfig() or getConfig().
/// Only call this function from main().
void setEnteredMain();
/// Returns a reference to the application configuration object.
/// The first call reads the stored settings.
NODISCARD Configuration &setConfig();
NODISCARD const Configuration &getConfig();
