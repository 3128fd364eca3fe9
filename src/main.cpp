// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "./color/Approximator.h"
#include "./color/Color.h"
#include "./color/ColorErrors.h"
#include "./color/Resolver.h"
#include "./configuration/configuration.h"
#include "./global/logging.h"

#include <iomanip>
#include <iostream>
#include <optional>

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QStringList>

namespace { // anonymous

struct NODISCARD CliOptions final
{
    Configuration::ColorSettings settings;
    size_t count = 1;
    bool writeConfig = false;
    QStringList colors;
};

NODISCARD std::optional<CliOptions> parseOptions(const QCommandLineParser &parser,
                                                 const QCommandLineOption &paletteOption,
                                                 const QCommandLineOption &countOption,
                                                 const QCommandLineOption &metricOption,
                                                 const QCommandLineOption &noCacheOption,
                                                 const QCommandLineOption &writeConfigOption)
{
    CliOptions opts;
    opts.settings = getConfig().colorSettings;

    if (parser.isSet(paletteOption)) {
        const QString value = parser.value(paletteOption);
        const auto palette = parseOutputPalette(value.toStdString());
        if (!palette.has_value()) {
            std::cerr << "termcolor-approx: unknown palette \"" << value.toStdString()
                      << "\" (expected xterm16, xterm256, named-rgb or true-color)" << std::endl;
            return std::nullopt;
        }
        opts.settings.outputPalette = *palette;
    }

    if (parser.isSet(metricOption)) {
        // throws UnknownMetricError
        opts.settings.distanceMetric = parseDistanceMetric(
            parser.value(metricOption).toStdString());
    }

    if (parser.isSet(noCacheOption)) {
        opts.settings.useApproximationCache = false;
    }

    bool ok = false;
    const auto count = parser.value(countOption).toUInt(&ok);
    if (!ok || count == 0) {
        std::cerr << "termcolor-approx: count must be a positive integer" << std::endl;
        return std::nullopt;
    }
    opts.count = count;

    opts.writeConfig = parser.isSet(writeConfigOption);
    opts.colors = parser.positionalArguments();
    return opts;
}

void printColor(const QString &arg, const CliOptions &opts)
{
    const auto &settings = opts.settings;
    Approximator &approximator = Approximator::getDefault();
    const Resolver resolver{approximator, settings.getResolverOptions()};

    const ColorDescriptor descriptor = ColorDescriptor::parse(arg.toStdString());
    const Color input = resolver.resolve(descriptor);
    std::cout << arg.toStdString() << ": " << input << std::endl;

    const std::optional<PaletteEnum> palette = toPaletteEnum(settings.outputPalette);
    if (!palette.has_value() || opts.count == 1) {
        std::cout << "  -> " << resolver.resolve(descriptor, settings.outputPalette) << std::endl;
        return;
    }

    const Rgb rgb = toRgb(input);
    const ApproximationResults results
        = settings.useApproximationCache
              ? approximator.find(rgb, *palette, opts.count, settings.distanceMetric)
              : approximator.approximate(rgb, *palette, opts.count, settings.distanceMetric);
    for (const ApproximationResult &result : results) {
        std::cout << "  " << result.rank << ". " << result.color << "  " << std::fixed
                  << std::setprecision(3) << result.distance << std::endl;
    }
}

} // namespace

int main(int argc, char **argv)
{
    setEnteredMain();

    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("termcolor-approx");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Find the closest terminal colors for color names and hex values.");
    parser.addHelpOption();

    const QCommandLineOption paletteOption({"p", "palette"},
                                           "Output palette: xterm16, xterm256, named-rgb or "
                                           "true-color.",
                                           "palette");
    const QCommandLineOption countOption({"n", "count"},
                                         "Number of ranked candidates to list.",
                                         "count",
                                         "1");
    const QCommandLineOption metricOption({"m", "metric"},
                                          "Distance metric: lab, rgb or hsv.",
                                          "metric");
    const QCommandLineOption noCacheOption("no-cache", "Do not cache approximation results.");
    const QCommandLineOption writeConfigOption("write-config", "Store the effective settings.");
    parser.addOptions({paletteOption, countOption, metricOption, noCacheOption, writeConfigOption});
    parser.addPositionalArgument("color",
                                 "Color name, or a value as #RRGGBB, #RGB or 0xRRGGBB.",
                                 "<color>...");
    parser.process(app);

    try {
        const auto opts = parseOptions(parser,
                                       paletteOption,
                                       countOption,
                                       metricOption,
                                       noCacheOption,
                                       writeConfigOption);
        if (!opts.has_value()) {
            return 1;
        }

        const auto &settings = opts->settings;
        TCLOG_INFO() << "palette=" << getName(settings.outputPalette)
                     << " metric=" << getName(settings.distanceMetric)
                     << " cache=" << (settings.useApproximationCache ? "on" : "off")
                     << " preferRgb=" << (settings.preferRgb ? "on" : "off");

        if (opts->writeConfig) {
            Configuration &config = setConfig();
            config.colorSettings = settings;
            config.write();
        }

        if (opts->colors.isEmpty()) {
            if (opts->writeConfig) {
                return 0;
            }
            parser.showHelp(1);
        }

        for (const QString &arg : opts->colors) {
            printColor(arg, *opts);
        }
    } catch (const ColorError &ex) {
        std::cerr << "termcolor-approx: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}
