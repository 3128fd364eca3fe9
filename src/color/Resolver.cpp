// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "Resolver.h"

#include "../global/CaseUtils.h"
#include "../global/Consts.h"
#include "../global/tests.h"
#include "ColorErrors.h"
#include "ColorName.h"

#include <stdexcept>

std::optional<OutputPaletteEnum> parseOutputPalette(const std::string_view name)
{
#define X_PARSE_OUTPUT_PALETTE(UPPER, lower) \
    if (areEqualAsLowerAscii(name, lower)) { \
        return OutputPaletteEnum::UPPER; \
    }
    XFOREACH_OUTPUT_PALETTE(X_PARSE_OUTPUT_PALETTE)
#undef X_PARSE_OUTPUT_PALETTE
    return std::nullopt;
}

std::string_view getName(const OutputPaletteEnum palette)
{
    switch (palette) {
#define X_CASE_OUTPUT_PALETTE(UPPER, lower) \
    case OutputPaletteEnum::UPPER: \
        return lower;
        XFOREACH_OUTPUT_PALETTE(X_CASE_OUTPUT_PALETTE)
#undef X_CASE_OUTPUT_PALETTE
    }
    throw std::invalid_argument("invalid output palette");
}

std::optional<PaletteEnum> toPaletteEnum(const OutputPaletteEnum palette)
{
    switch (palette) {
    case OutputPaletteEnum::XTERM_16:
        return PaletteEnum::XTERM_16;
    case OutputPaletteEnum::XTERM_256:
        return PaletteEnum::XTERM_256;
    case OutputPaletteEnum::NAMED_RGB:
        return PaletteEnum::NAMED_RGB;
    case OutputPaletteEnum::TRUE_COLOR:
        return std::nullopt;
    }
    throw std::invalid_argument("invalid output palette");
}

ColorDescriptor ColorDescriptor::fromInt(const uint32_t value)
{
    return ColorDescriptor{Rgb::fromInt(value)};
}

ColorDescriptor ColorDescriptor::parse(const std::string_view text)
{
    if (text.empty()) {
        throw InvalidColorFormatError("empty color descriptor");
    }
    if (text.front() == char_consts::C_POUND_SIGN
        || (text.size() > 2 && areEqualAsLowerAscii(text.substr(0, 2), string_consts::SV_HEX_PREFIX))) {
        return ColorDescriptor{Rgb::fromHex(text)};
    }
    if (normalizeColorName(text).empty()) {
        throw InvalidColorFormatError("not a color name: \"" + std::string{text} + "\"");
    }
    return ColorDescriptor{NameTag{}, std::string{text}};
}

Resolver::Resolver(Approximator &approximator, const ResolverOptions options)
    : m_approximator{approximator}
    , m_options{options}
{}

Color Resolver::resolve(const ColorDescriptor &descriptor) const
{
    if (const Rgb *const rgb = descriptor.getRgb()) {
        return ColorRGB{*rgb};
    }
    if (const std::string *const name = descriptor.getName()) {
        return getRegistry().findAnyByName(*name);
    }
    return *descriptor.getColor();
}

Color Resolver::resolve(const ColorDescriptor &descriptor, const OutputPaletteEnum output) const
{
    const std::optional<PaletteEnum> target = toPaletteEnum(output);
    if (!target.has_value()) {
        Color color = resolve(descriptor);
        if (m_options.preferRgb) {
            if (const Color256 *const c256 = std::get_if<Color256>(&color)) {
                return ColorRGB{c256->toRgb(), std::string{c256->getName()}};
            }
        }
        return color;
    }

    const PaletteEnum palette = *target;
    if (const Rgb *const rgb = descriptor.getRgb()) {
        return exactOrApproximate(*rgb, palette);
    }
    if (const std::string *const name = descriptor.getName()) {
        if (auto exact = getRegistry().findByName(palette, *name)) {
            return std::move(*exact);
        }
        return resolveInto(getRegistry().findAnyByName(*name), palette);
    }
    return resolveInto(*descriptor.getColor(), palette);
}

Color Resolver::resolveOr(const ColorDescriptor &descriptor,
                          const OutputPaletteEnum palette,
                          const Color &fallback) const
{
    try {
        return resolve(descriptor, palette);
    } catch (const NotFoundError &) {
        return fallback;
    }
}

Color Resolver::resolveInto(const Color &color, const PaletteEnum palette) const
{
    switch (palette) {
    case PaletteEnum::XTERM_16:
        if (std::holds_alternative<Color16>(color)) {
            return color;
        }
        if (const Color256 *const c256 = std::get_if<Color256>(&color)) {
            if (const auto equivalent = c256->getColor16Equivalent()) {
                return *equivalent;
            }
        }
        break;

    case PaletteEnum::XTERM_256:
        if (std::holds_alternative<Color256>(color)) {
            return color;
        }
        if (const Color16 *const c16 = std::get_if<Color16>(&color)) {
            return Color256{c16->getCode()};
        }
        break;

    case PaletteEnum::NAMED_RGB:
        if (const ColorRGB *const rgb = std::get_if<ColorRGB>(&color); rgb && rgb->hasName()) {
            const PaletteEntry *const entry = getRegistry().getPalette(palette).findByName(
                rgb->getName());
            if (entry != nullptr && entry->rgb == rgb->toRgb()) {
                return color;
            }
        }
        break;
    }

    return exactOrApproximate(toRgb(color), palette);
}

Color Resolver::exactOrApproximate(const Rgb &rgb, const PaletteEnum palette) const
{
    const Palette &p = getRegistry().getPalette(palette);
    if (const PaletteEntry *const exact = p.findExact(rgb)) {
        return p.makeColor(*exact);
    }
    if (m_options.useCache) {
        return m_approximator.findClosest(rgb, palette, m_options.metric).color;
    }
    return m_approximator.approximate(rgb, palette, 1, m_options.metric).front().color;
}

namespace test {
void testResolver()
{
    const Resolver resolver{Approximator::getDefault()};
    TEST_ASSERT(resolver.resolve(ColorDescriptor::fromInt(0xFF0000), OutputPaletteEnum::XTERM_256)
                == Color{Color256{196}});
    TEST_ASSERT(resolver.resolve(ColorDescriptor::parse("red"), OutputPaletteEnum::XTERM_16)
                == Color{Color16{1}});
    TEST_ASSERT(resolver.resolve(Color16{1}, OutputPaletteEnum::XTERM_256) == Color{Color256{1}});
    TEST_ASSERT(resolver.resolve(Color256{9}, OutputPaletteEnum::XTERM_16) == Color{Color16{9}});
    TEST_ASSERT(resolver.resolve(ColorDescriptor::parse("#123456"))
                == Color{ColorRGB{Rgb::fromInt(0x123456)}});
}
} // namespace test
