#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "../global/macros.h"
#include "Approximator.h"
#include "Color.h"
#include "ColorSpace.h"
#include "DistanceMetric.h"
#include "Palette.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#define XFOREACH_OUTPUT_PALETTE(X) \
    X(XTERM_16, "xterm16") \
    X(XTERM_256, "xterm256") \
    X(NAMED_RGB, "named-rgb") \
    X(TRUE_COLOR, "true-color")

// What the output side can show. TRUE_COLOR needs no approximation.
enum class NODISCARD OutputPaletteEnum : uint8_t {
#define X_DECL_OUTPUT_PALETTE(UPPER, lower) UPPER,
    XFOREACH_OUTPUT_PALETTE(X_DECL_OUTPUT_PALETTE)
#undef X_DECL_OUTPUT_PALETTE
};

NODISCARD extern std::optional<OutputPaletteEnum> parseOutputPalette(std::string_view name);
NODISCARD extern std::string_view getName(OutputPaletteEnum palette);
NODISCARD extern std::optional<PaletteEnum> toPaletteEnum(OutputPaletteEnum palette);

// A color as a caller supplies it: a value, a name, or a Color.
class NODISCARD ColorDescriptor final
{
private:
    std::variant<Rgb, std::string, Color> m_value;

public:
    IMPLICIT ColorDescriptor(const Rgb &rgb)
        : m_value{rgb}
    {}
    IMPLICIT ColorDescriptor(Color color)
        : m_value{std::move(color)}
    {}
    IMPLICIT ColorDescriptor(const Color16 &color)
        : m_value{Color{color}}
    {}
    IMPLICIT ColorDescriptor(const Color256 &color)
        : m_value{Color{color}}
    {}
    IMPLICIT ColorDescriptor(const ColorRGB &color)
        : m_value{Color{color}}
    {}

public:
    // throws InvalidColorFormatError if value > 0xFFFFFF
    NODISCARD static ColorDescriptor fromInt(uint32_t value);
    // "#RRGGBB", "#RGB" and "0xRRGGBB" are values; anything else is a name.
    // throws InvalidColorFormatError for a malformed value or an empty name
    NODISCARD static ColorDescriptor parse(std::string_view text);

public:
    NODISCARD const Rgb *getRgb() const { return std::get_if<Rgb>(&m_value); }
    NODISCARD const std::string *getName() const { return std::get_if<std::string>(&m_value); }
    NODISCARD const Color *getColor() const { return std::get_if<Color>(&m_value); }

private:
    struct NODISCARD NameTag final
    {};
    explicit ColorDescriptor(NameTag, std::string name)
        : m_value{std::move(name)}
    {}
};

struct NODISCARD ResolverOptions final
{
    DistanceMetricEnum metric = DEFAULT_DISTANCE_METRIC;
    bool useCache = true;
    // Under TRUE_COLOR, turn a Color256 into the equivalent ColorRGB.
    bool preferRgb = false;
};

// Turns descriptors into concrete colors for an output palette.
//
// An exact representation in the target palette always wins over
// approximation: a Color of the target's own kind passes through, Color16 and
// Color256 codes 0-15 map onto each other, a name known to the target
// palette resolves to that entry, and an RGB value equal to a candidate entry
// resolves to it. Only then is the nearest candidate searched.
class NODISCARD Resolver final
{
private:
    Approximator &m_approximator;
    ResolverOptions m_options;

public:
    explicit Resolver(Approximator &approximator, ResolverOptions options = {});

public:
    NODISCARD const PaletteRegistry &getRegistry() const { return m_approximator.getRegistry(); }
    NODISCARD const ResolverOptions &getOptions() const { return m_options; }

public:
    // No target palette: values become unnamed ColorRGB, names are looked up
    // with PaletteRegistry::findAnyByName(), colors are returned as is.
    NODISCARD Color resolve(const ColorDescriptor &descriptor) const;
    NODISCARD Color resolve(const ColorDescriptor &descriptor, OutputPaletteEnum palette) const;
    // fallback if and only if the name or code is not found
    NODISCARD Color resolveOr(const ColorDescriptor &descriptor,
                              OutputPaletteEnum palette,
                              const Color &fallback) const;

private:
    NODISCARD Color resolveInto(const Color &color, PaletteEnum palette) const;
    NODISCARD Color exactOrApproximate(const Rgb &rgb, PaletteEnum palette) const;
};

namespace test {
extern void testResolver();
} // namespace test
