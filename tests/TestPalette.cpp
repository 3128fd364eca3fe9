// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "TestPalette.h"

#include "TestCommon.h"

#include "../src/color/ColorErrors.h"
#include "../src/color/ColorName.h"
#include "../src/color/Palette.h"

#include <optional>
#include <tuple>
#include <vector>

#include <QtTest/QtTest>

TestPalette::TestPalette() = default;

TestPalette::~TestPalette() = default;

void TestPalette::selfTest()
{
    test::testColorName();
    test::testPalette();
}

void TestPalette::colorNameTest_data()
{
    QTest::addColumn<QString>("input");
    QTest::addColumn<QString>("expected");

    QTest::newRow("spaces") << "Icathian Yellow" << "icathian-yellow";
    QTest::newRow("underscore") << "icathian_yellow" << "icathian-yellow";
    QTest::newRow("camel") << "IcathianYellow" << "icathian-yellow";
    QTest::newRow("digit") << "grey0" << "grey-0";
    QTest::newRow("hyphen") << "dark-sea-green-7" << "dark-sea-green-7";
    QTest::newRow("runs") << "  light__sky  blue " << "light-sky-blue";
    QTest::newRow("upper") << "RED" << "red";
    QTest::newRow("nothing") << "--- " << "";
    QTest::newRow("empty") << "" << "";
}

void TestPalette::colorNameTest()
{
    QFETCH(QString, input);
    QFETCH(QString, expected);

    QCOMPARE(QString::fromStdString(normalizeColorName(input.toStdString())), expected);
}

void TestPalette::defaultRegistryTest()
{
    const PaletteRegistry &registry = PaletteRegistry::getDefault();
    QVERIFY(&registry == &PaletteRegistry::getDefault());

    QCOMPARE(registry.entries(PaletteEnum::XTERM_16).size(), size_t{16});
    QCOMPARE(registry.entries(PaletteEnum::XTERM_256).size(), size_t{256});
    // the built-in table has no variations, so every row is one entry
    const NamedRgbTable table = PaletteRegistry::getDefaultNamedTable();
    QCOMPARE(registry.entries(PaletteEnum::NAMED_RGB).size(), table.colors.size());
    QCOMPARE(table.colors.size(), size_t{143});

    const Palette &xterm16 = registry.getPalette(PaletteEnum::XTERM_16);
    QCOMPARE(xterm16.getCandidateCount(), size_t{16});
    QVERIFY(xterm16.getId() == PaletteEnum::XTERM_16);

    const Palette &xterm256 = registry.getPalette(PaletteEnum::XTERM_256);
    QCOMPARE(xterm256.getCandidateCount(), size_t{240});
    QCOMPARE(xterm256.getCandidate(0).code, 16);
    QCOMPARE(xterm256.getCandidate(239).code, 255);

    // candidate points line up with the candidates
    for (const auto metric :
         {DistanceMetricEnum::LAB, DistanceMetricEnum::RGB, DistanceMetricEnum::HSV}) {
        const auto &points = xterm256.getComparisonPoints(metric);
        QCOMPARE(points.size(), xterm256.getCandidateCount());
        QVERIFY(points[0] == toComparisonSpace(xterm256.getCandidate(0).rgb, metric));
    }

    // every declared metric has its own set of points, and nothing past the last one does
    std::vector<DistanceMetricEnum> declared;
#define X_PUSH_METRIC(UPPER, lower) declared.push_back(DistanceMetricEnum::UPPER);
    XFOREACH_DISTANCE_METRIC(X_PUSH_METRIC)
#undef X_PUSH_METRIC
    QCOMPARE(declared.size(), NUM_DISTANCE_METRICS);
    for (const auto metric : declared) {
        QCOMPARE(xterm16.getComparisonPoints(metric).size(), size_t{16});
    }
    QVERIFY(throwsException<UnknownMetricError>([&xterm16]() {
        std::ignore = xterm16.getComparisonPoints(
            static_cast<DistanceMetricEnum>(NUM_DISTANCE_METRICS));
    }));

    // codes are positions
    for (const auto palette :
         {PaletteEnum::XTERM_16, PaletteEnum::XTERM_256, PaletteEnum::NAMED_RGB}) {
        const auto &entries = registry.entries(palette);
        for (size_t i = 0; i < entries.size(); ++i) {
            QCOMPARE(entries[i].code, static_cast<int>(i));
            QVERIFY(!entries[i].name.empty());
        }
    }

    QCOMPARE(getName(PaletteEnum::NAMED_RGB), std::string_view{"named-rgb"});
}

void TestPalette::lookupByCodeTest()
{
    const PaletteRegistry &registry = PaletteRegistry::getDefault();
    QVERIFY(registry.getByCode(PaletteEnum::XTERM_16, 1) == Color{Color16{1}});
    QVERIFY(registry.getByCode(PaletteEnum::XTERM_256, 196) == Color{Color256{196}});

    const Color aqua = registry.getByCode(PaletteEnum::NAMED_RGB, 2);
    QCOMPARE(getName(aqua), std::string_view{"aqua"});
    QCOMPARE(toRgb(aqua).toInt(), 0x00FFFFu);

    QVERIFY(throwsException<NotFoundError>(
        [&registry]() { std::ignore = registry.getByCode(PaletteEnum::XTERM_16, 16); }));
    const int namedCount = static_cast<int>(registry.entries(PaletteEnum::NAMED_RGB).size());
    std::ignore = registry.getByCode(PaletteEnum::NAMED_RGB, namedCount - 1);
    QVERIFY(throwsException<NotFoundError>([&registry, namedCount]() {
        std::ignore = registry.getByCode(PaletteEnum::NAMED_RGB, namedCount);
    }));
    QVERIFY(throwsException<NotFoundError>(
        [&registry]() { std::ignore = registry.getByCode(PaletteEnum::XTERM_256, -1); }));
}

void TestPalette::lookupByNameTest()
{
    const PaletteRegistry &registry = PaletteRegistry::getDefault();

    QCOMPARE(registry.getByName("LightGoldenrodYellow").toRgb().toInt(), 0xFAFAD2u);
    QCOMPARE(registry.getByName("light_goldenrod_yellow").getName(),
             std::string_view{"light-goldenrod-yellow"});
    QVERIFY(registry.getByName("dim grey") == registry.getByName("dim-gray"));
    QCOMPARE(registry.getByName("TrueWhite").toRgb().toInt(), 0xFFFFFFu);

    QVERIFY(throwsException<NotFoundError>(
        [&registry]() { std::ignore = registry.getByName("does-not-exist"); }));
    QVERIFY(!registry.findByName(PaletteEnum::XTERM_16, "lime").has_value());
    QVERIFY(registry.findByName(PaletteEnum::XTERM_256, "lime") == Color{Color256{10}});

    // earliest registry wins
    QVERIFY(registry.findAnyByName("red") == Color{Color16{1}});
    QVERIFY(registry.findAnyByName("maroon") == Color{Color256{1}});
    QVERIFY(registry.findAnyByName("grey-50") == Color{Color256{244}});
    const Color tomato = registry.findAnyByName("tomato");
    QVERIFY(std::holds_alternative<ColorRGB>(tomato));
    QCOMPARE(toRgb(tomato).toInt(), 0xFF6347u);

    try {
        std::ignore = registry.findAnyByName("does-not-exist");
        QFAIL("expected NotFoundError");
    } catch (const NotFoundError &ex) {
        const QString message = QString::fromUtf8(ex.what());
        QVERIFY(message.contains("does-not-exist"));
        QVERIFY(message.contains("xterm16"));
        QVERIFY(message.contains("xterm256"));
        QVERIFY(message.contains("named-rgb"));
    }
}

void TestPalette::exactMatchTest()
{
    const PaletteRegistry &registry = PaletteRegistry::getDefault();

    // aqua and cyan share a value; the lower code wins
    const PaletteEntry *const cyan = registry.getPalette(PaletteEnum::NAMED_RGB)
                                         .findExact(Rgb::fromInt(0x00FFFF));
    QVERIFY(cyan != nullptr);
    QCOMPARE(cyan->name, std::string{"aqua"});

    // 0-15 are not candidates, so pure red matches the cube
    const PaletteEntry *const red = registry.getPalette(PaletteEnum::XTERM_256)
                                        .findExact(Rgb::fromInt(0xFF0000));
    QVERIFY(red != nullptr);
    QCOMPARE(red->code, 196);

    QVERIFY(registry.getPalette(PaletteEnum::XTERM_256).findExact(Rgb::fromInt(0x800000))
            == nullptr);
    QVERIFY(registry.getPalette(PaletteEnum::XTERM_16).findExact(Rgb::fromInt(0x800000))
            != nullptr);
}

void TestPalette::customTableTest()
{
    NamedRgbTable table;
    table.colors = {NamedColorDef{"Night Sky", 0x101030},
                    NamedColorDef{"ember", 0xC04010},
                    NamedColorDef{"night_sky", 0x101030}};
    table.aliases = {NamedColorAlias{"midnight", "night-sky"}};

    const PaletteRegistry registry{table};
    // identical repeat is dropped
    QCOMPARE(registry.entries(PaletteEnum::NAMED_RGB).size(), size_t{2});
    QCOMPARE(registry.getByName("NightSky").toRgb().toInt(), 0x101030u);
    QVERIFY(registry.getByName("midnight") == registry.getByName("night sky"));
    QCOMPARE(registry.getByName("midnight").getName(), std::string_view{"Night Sky"});

    // the xterm palettes do not depend on the table
    QCOMPARE(registry.entries(PaletteEnum::XTERM_256).size(), size_t{256});

    QVERIFY(!registry.getByName("ember").isVariation());
    QVERIFY(!registry.getBase(registry.getByName("ember")).has_value());
    QVERIFY(registry.getVariations(registry.getByName("ember")).empty());

    const PaletteRegistry empty{NamedRgbTable{}};
    QVERIFY(empty.getPalette(PaletteEnum::NAMED_RGB).empty());
    QCOMPARE(empty.getPalette(PaletteEnum::NAMED_RGB).getCandidateCount(), size_t{0});
}

void TestPalette::variationTest()
{
    NamedRgbTable table;
    table.colors = {NamedColorDef{"Sea Foam", 0x50B090, {{"2", 0x40A080}, {"dark", 0x205040}}},
                    NamedColorDef{"ember", 0xC04010, {}}};
    const PaletteRegistry registry{table};

    // variations take the codes right after their base
    const auto &entries = registry.entries(PaletteEnum::NAMED_RGB);
    QCOMPARE(entries.size(), size_t{4});
    QCOMPARE(entries[1].name, std::string{"Sea Foam-2"});
    QVERIFY(entries[1].baseCode == 0);
    QVERIFY(entries[2].baseCode == 0);
    QVERIFY(!entries[3].baseCode.has_value());
    QCOMPARE(entries[3].code, 3);

    // registered under the base name tokens plus the suffix
    const ColorRGB two = registry.getByName("sea foam 2");
    QCOMPARE(two.toRgb().toInt(), 0x40A080u);
    QVERIFY(two.isVariation());
    QVERIFY(registry.getByName("SeaFoamDark") == registry.getByName("sea-foam-dark"));
    QVERIFY(registry.findAnyByName("sea_foam_dark") == Color{ColorRGB{Rgb::fromInt(0x205040)}});

    const std::optional<ColorRGB> base = registry.getBase(two);
    QVERIFY(base.has_value());
    QCOMPARE(base->getName(), std::string_view{"Sea Foam"});
    QVERIFY(!base->isVariation());

    const std::vector<ColorRGB> variations = registry.getVariations(registry.getByName("sea-foam"));
    QCOMPARE(variations.size(), size_t{2});
    QVERIFY(variations[0] == two);
    QCOMPARE(variations[1].toRgb().toInt(), 0x205040u);

    // variations are approximation candidates like any other entry
    const Palette &named = registry.getPalette(PaletteEnum::NAMED_RGB);
    QCOMPARE(named.getCandidateCount(), size_t{4});
    const PaletteEntry *const exact = named.findExact(Rgb::fromInt(0x205040));
    QVERIFY(exact != nullptr);
    QCOMPARE(exact->code, 2);
    const Color made = named.makeColor(*exact);
    QVERIFY(std::get<ColorRGB>(made).getBaseCode() == 0);

    // a variation name may not collide with a different color
    NamedRgbTable clash;
    clash.colors = {NamedColorDef{"sea foam", 0x50B090, {{"2", 0x40A080}}},
                    NamedColorDef{"sea-foam-2", 0x000001, {}}};
    QVERIFY(throwsException<NameConflictError>([&clash]() { PaletteRegistry registry{clash}; }));

    // an identical repeat of the base keeps the variations on the first entry
    NamedRgbTable repeat;
    repeat.colors = {NamedColorDef{"sea foam", 0x50B090, {}},
                     NamedColorDef{"SeaFoam", 0x50B090, {{"light", 0x90E0C0}}}};
    const PaletteRegistry repeated{repeat};
    QCOMPARE(repeated.entries(PaletteEnum::NAMED_RGB).size(), size_t{2});
    QVERIFY(repeated.getByName("sea foam light").getBaseCode() == 0);
}

void TestPalette::conflictTest()
{
    NamedRgbTable conflicting;
    conflicting.colors = {NamedColorDef{"ember", 0xC04010}, NamedColorDef{"Ember", 0xC04011}};
    QVERIFY(throwsException<NameConflictError>(
        [&conflicting]() { PaletteRegistry registry{conflicting}; }));

    NamedRgbTable badAlias;
    badAlias.colors = {NamedColorDef{"ember", 0xC04010}, NamedColorDef{"ash", 0x404040}};
    badAlias.aliases = {NamedColorAlias{"ash", "ember"}};
    QVERIFY(throwsException<NameConflictError>(
        [&badAlias]() { PaletteRegistry registry{badAlias}; }));

    NamedRgbTable danglingAlias;
    danglingAlias.colors = {NamedColorDef{"ember", 0xC04010}};
    danglingAlias.aliases = {NamedColorAlias{"coal", "charcoal"}};
    QVERIFY(throwsException<NotFoundError>(
        [&danglingAlias]() { PaletteRegistry registry{danglingAlias}; }));

    NamedRgbTable unnamed;
    unnamed.colors = {NamedColorDef{" - ", 0x000001}};
    QVERIFY(throwsException<InvalidColorFormatError>(
        [&unnamed]() { PaletteRegistry registry{unnamed}; }));
}

QTEST_MAIN(TestPalette)
