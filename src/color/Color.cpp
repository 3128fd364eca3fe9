// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "Color.h"

#include "../global/Consts.h"
#include "../global/tests.h"
#include "../global/utils.h"
#include "ColorErrors.h"
#include "XtermData.h"

#include <array>
#include <cmath>
#include <ostream>
#include <sstream>

namespace { // anonymous

struct NODISCARD Xterm16Entry final
{
    std::string_view name;
    uint32_t value = 0;
};

constexpr const std::array<Xterm16Entry, Color16::COUNT> g_xterm16{{
#define X_XTERM16_ENTRY(code, name, value) {name, value},
    XFOREACH_XTERM16_COLOR(X_XTERM16_ENTRY)
#undef X_XTERM16_ENTRY
}};

constexpr const std::array<std::string_view, Color256::COUNT> g_xterm256Names{{
#define X_XTERM256_NAME(code, name) name,
    XFOREACH_XTERM256_NAME(X_XTERM256_NAME)
#undef X_XTERM256_NAME
}};

// channel levels of the 6x6x6 cube
constexpr const std::array<int, 6> g_cubeLevels{0, 95, 135, 175, 215, 255};

NODISCARD int checkCode(const int code, const int count, const char *const what)
{
    if (code < 0 || code >= count) {
        throw InvalidCodeError(std::string(what) + " code out of range: " + std::to_string(code));
    }
    return code;
}

NODISCARD bool isClampedSgr(const int sgr, const int base)
{
    return isClamped(sgr, base, base + 7);
}

} // namespace

Color16::Color16(const int code)
    : m_code{static_cast<uint8_t>(checkCode(code, COUNT, "Color16"))}
{}

Color16 Color16::fromSgrCode(const int sgr)
{
    for (const int base : {SGR_FG_BASE, SGR_FG_BASE + SGR_BG_OFFSET}) {
        if (isClampedSgr(sgr, base)) {
            return Color16{sgr - base};
        }
    }
    for (const int base : {SGR_FG_BRIGHT_BASE, SGR_FG_BRIGHT_BASE + SGR_BG_OFFSET}) {
        if (isClampedSgr(sgr, base)) {
            return Color16{sgr - base + 8};
        }
    }
    throw InvalidCodeError("not a 16-color SGR code: " + std::to_string(sgr));
}

int Color16::getSgrFg() const
{
    return isBright() ? (SGR_FG_BRIGHT_BASE + m_code - 8) : (SGR_FG_BASE + m_code);
}

Rgb Color16::toRgb() const
{
    return Rgb::fromInt(g_xterm16[m_code].value);
}

std::string_view Color16::getName() const
{
    return g_xterm16[m_code].name;
}

Color256::Color256(const int code)
    : m_code{static_cast<uint8_t>(checkCode(code, COUNT, "Color256"))}
{}

Rgb Color256::toRgb() const
{
    if (m_code < CUBE_START) {
        return Color16{m_code}.toRgb();
    }
    if (m_code < GRAY_START) {
        const int i = m_code - CUBE_START;
        return Rgb::fromChannels(g_cubeLevels[static_cast<size_t>(i / 36)],
                                 g_cubeLevels[static_cast<size_t>((i / 6) % 6)],
                                 g_cubeLevels[static_cast<size_t>(i % 6)]);
    }
    const int level = 8 + 10 * (m_code - GRAY_START);
    return Rgb::fromChannels(level, level, level);
}

std::string_view Color256::getName() const
{
    return g_xterm256Names[m_code];
}

std::optional<Color16> Color256::getColor16Equivalent() const
{
    if (m_code < CUBE_START) {
        return Color16{m_code};
    }
    return std::nullopt;
}

Rgb toRgb(const Color &color)
{
    return std::visit([](const auto &c) -> Rgb { return c.toRgb(); }, color);
}

int getCode(const Color &color)
{
    return std::visit([](const auto &c) -> int { return c.getCode(); }, color);
}

std::string_view getName(const Color &color)
{
    return std::visit([](const auto &c) -> std::string_view { return c.getName(); }, color);
}

double distanceTo(const Color &color, const Color &other, const DistanceMetricEnum metric)
{
    return colorDistance(toRgb(color), toRgb(other), metric);
}

std::ostream &operator<<(std::ostream &os, const Color16 &color)
{
    return os << "c" << color.getSgrFg() << char_consts::C_OPEN_PARENS
              << color.toRgb().formatValue("#") << char_consts::C_QUESTION_MARK
              << char_consts::C_SPACE << color.getName() << char_consts::C_CLOSE_PARENS;
}

std::ostream &operator<<(std::ostream &os, const Color256 &color)
{
    os << "x" << color.getCode() << char_consts::C_OPEN_PARENS << color.toRgb().formatValue("#");
    if (!color.isAvailableForApproximation()) {
        os << char_consts::C_QUESTION_MARK;
    }
    return os << char_consts::C_SPACE << color.getName() << char_consts::C_CLOSE_PARENS;
}

std::ostream &operator<<(std::ostream &os, const ColorRGB &color)
{
    os << color.toRgb().formatValue("#");
    if (color.hasName()) {
        os << char_consts::C_OPEN_PARENS << color.getName() << char_consts::C_CLOSE_PARENS;
    }
    return os;
}

std::ostream &operator<<(std::ostream &os, const Color &color)
{
    std::visit([&os](const auto &c) { os << c; }, color);
    return os;
}

std::string describe(const Color &color)
{
    std::ostringstream os;
    os << color;
    return os.str();
}

ColorRGB textColorFor(const Color &color)
{
    // Perceived brightness:
    // http://www.nbdtech.com/Blog/archive/2008/04/27/Calculating-the-Perceived-Brightness-of-a-Color.aspx
    constexpr const auto redMagic = 241;
    constexpr const auto greenMagic = 691;
    constexpr const auto blueMagic = 68;
    constexpr const auto divisor = redMagic + greenMagic + blueMagic;

    const Rgb rgb = toRgb(color);
    const auto brightness = std::sqrt(((std::pow(rgb.r(), 2) * redMagic)
                                       + (std::pow(rgb.g(), 2) * greenMagic)
                                       + (std::pow(rgb.b(), 2) * blueMagic))
                                      / divisor);
    const auto percentage = 100 * brightness / 255;
    return percentage < 50 ? ColorRGB{Rgb::fromInt(0xFFFFFF), "white"}
                           : ColorRGB{Rgb::fromInt(0x000000), "black"};
}

namespace test {
void testColor()
{
    TEST_ASSERT(Color16{9}.getSgrFg() == 91);
    TEST_ASSERT(Color16{9}.getSgrBg() == 101);
    TEST_ASSERT(Color16::fromSgrCode(31) == Color16{1});
    TEST_ASSERT(Color16::fromSgrCode(107) == Color16{15});

    TEST_ASSERT(Color256{16}.toRgb().toInt() == 0x000000u);
    TEST_ASSERT(Color256{196}.toRgb().toInt() == 0xFF0000u);
    TEST_ASSERT(Color256{231}.toRgb().toInt() == 0xFFFFFFu);
    TEST_ASSERT(Color256{232}.toRgb().toInt() == 0x080808u);
    TEST_ASSERT(Color256{255}.toRgb().toInt() == 0xEEEEEEu);
    TEST_ASSERT(Color256{1}.getColor16Equivalent() == Color16{1});
    TEST_ASSERT(!Color256{16}.getColor16Equivalent().has_value());

    const Color a = Color16{1};
    const Color b = Color256{1};
    TEST_ASSERT(a != b);
    TEST_ASSERT(toRgb(a) == toRgb(b));
    TEST_ASSERT(ColorRGB(Rgb::fromInt(0x123456), "x") == ColorRGB(Rgb::fromInt(0x123456)));
    TEST_ASSERT(distanceTo(a, b) == 0.0);
}
} // namespace test
