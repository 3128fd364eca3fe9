// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "TestConfiguration.h"

#include "../src/configuration/configuration.h"
#include "../src/global/HideQDebug.h"

#include <QFile>
#include <QSettings>
#include <QTemporaryDir>
#include <QtTest/QtTest>

namespace { // anonymous

NODISCARD QString makeIniPath(const QTemporaryDir &dir, const QString &name)
{
    const QString path = dir.filePath(name);
    QFile file{path};
    if (!file.open(QIODevice::WriteOnly)) {
        return QString{};
    }
    file.close();
    return path;
}

} // namespace

TestConfiguration::TestConfiguration() = default;

TestConfiguration::~TestConfiguration() = default;

void TestConfiguration::defaultsTest()
{
    const Configuration conf;
    const auto &color = conf.colorSettings;
    QVERIFY(color.outputPalette == OutputPaletteEnum::XTERM_256);
    QVERIFY(color.distanceMetric == DistanceMetricEnum::LAB);
    QVERIFY(color.useApproximationCache);
    QVERIFY(!color.preferRgb);

    const ResolverOptions options = color.getResolverOptions();
    QVERIFY(options.metric == DistanceMetricEnum::LAB);
    QVERIFY(options.useCache);
    QVERIFY(!options.preferRgb);
}

void TestConfiguration::roundTripTest()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = makeIniPath(dir, "roundtrip.ini");
    QVERIFY(!path.isEmpty());

    Configuration written;
    written.colorSettings.outputPalette = OutputPaletteEnum::NAMED_RGB;
    written.colorSettings.distanceMetric = DistanceMetricEnum::HSV;
    written.colorSettings.useApproximationCache = false;
    written.colorSettings.preferRgb = true;
    {
        QSettings conf{path, QSettings::IniFormat};
        written.writeTo(conf);
        conf.sync();
        QCOMPARE(conf.status(), QSettings::NoError);
    }

    {
        // stored by name under the Color group
        QSettings raw{path, QSettings::IniFormat};
        QCOMPARE(raw.value("Color/outputPalette").toString(), QString{"named-rgb"});
        QCOMPARE(raw.value("Color/distanceMetric").toString(), QString{"hsv"});
    }

    Configuration loaded;
    {
        QSettings conf{path, QSettings::IniFormat};
        loaded.readFrom(conf);
    }
    QVERIFY(loaded.colorSettings.outputPalette == OutputPaletteEnum::NAMED_RGB);
    QVERIFY(loaded.colorSettings.distanceMetric == DistanceMetricEnum::HSV);
    QVERIFY(!loaded.colorSettings.useApproximationCache);
    QVERIFY(loaded.colorSettings.preferRgb);

    const ResolverOptions options = loaded.colorSettings.getResolverOptions();
    QVERIFY(options.metric == DistanceMetricEnum::HSV);
    QVERIFY(!options.useCache);
    QVERIFY(options.preferRgb);
}

void TestConfiguration::invalidValuesTest()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = makeIniPath(dir, "invalid.ini");
    QVERIFY(!path.isEmpty());
    {
        QSettings conf{path, QSettings::IniFormat};
        conf.setValue("Color/outputPalette", "cga");
        conf.setValue("Color/distanceMetric", "ciede2000");
        conf.setValue("Color/preferRgb", true);
        conf.sync();
    }

    Configuration loaded;
    loaded.colorSettings.outputPalette = OutputPaletteEnum::XTERM_16;
    {
        tcqt::HideQDebug hide{tcqt::HideQDebugOptions{true, true, true}};
        QSettings conf{path, QSettings::IniFormat};
        loaded.readFrom(conf);
    }
    // bad values fall back to the defaults; good ones are still read
    QVERIFY(loaded.colorSettings.outputPalette == OutputPaletteEnum::XTERM_256);
    QVERIFY(loaded.colorSettings.distanceMetric == DistanceMetricEnum::LAB);
    QVERIFY(loaded.colorSettings.useApproximationCache);
    QVERIFY(loaded.colorSettings.preferRgb);
}

void TestConfiguration::profilePathTest()
{
    // Must be the first use of the platform settings in this process.
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = makeIniPath(dir, "profile.ini");
    QVERIFY(!path.isEmpty());
    QVERIFY(qputenv("TERMCOLOR_PROFILE_PATH", QFile::encodeName(path)));

    tcqt::HideQDebug hide;

    Configuration conf;
    conf.colorSettings.outputPalette = OutputPaletteEnum::TRUE_COLOR;
    conf.colorSettings.distanceMetric = DistanceMetricEnum::RGB;
    conf.write();

    {
        QSettings raw{path, QSettings::IniFormat};
        QCOMPARE(raw.value("Color/outputPalette").toString(), QString{"true-color"});
        QCOMPARE(raw.value("Color/distanceMetric").toString(), QString{"rgb"});
    }

    Configuration loaded;
    loaded.read();
    QVERIFY(loaded.colorSettings.outputPalette == OutputPaletteEnum::TRUE_COLOR);
    QVERIFY(loaded.colorSettings.distanceMetric == DistanceMetricEnum::RGB);

    loaded.reset();
    QVERIFY(loaded.colorSettings.outputPalette == OutputPaletteEnum::XTERM_256);
    QVERIFY(loaded.colorSettings.distanceMetric == DistanceMetricEnum::LAB);
    {
        QSettings raw{path, QSettings::IniFormat};
        QVERIFY(!raw.contains("Color/outputPalette"));
    }

    QVERIFY(qunsetenv("TERMCOLOR_PROFILE_PATH"));
}

QTEST_MAIN(TestConfiguration)
