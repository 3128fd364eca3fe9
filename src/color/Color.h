#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "../global/RuleOf5.h"
#include "../global/macros.h"
#include "ColorSpace.h"
#include "DistanceMetric.h"

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

// One of the 16 basic terminal colors.
// Codes 0-7 are the normal hues and 8-15 their bright versions.
class NODISCARD Color16 final
{
public:
    static constexpr const int COUNT = 16;
    static constexpr const int SGR_FG_BASE = 30;
    static constexpr const int SGR_FG_BRIGHT_BASE = 90;
    static constexpr const int SGR_BG_OFFSET = 10;

private:
    uint8_t m_code = 0;

public:
    // throws InvalidCodeError
    explicit Color16(int code);
    // Accepts foreground (30-37, 90-97) and background (40-47, 100-107) codes.
    // throws InvalidCodeError
    NODISCARD static Color16 fromSgrCode(int sgr);

public:
    NODISCARD int getCode() const { return m_code; }
    NODISCARD bool isBright() const { return m_code >= 8; }
    NODISCARD int getSgrFg() const;
    NODISCARD int getSgrBg() const { return getSgrFg() + SGR_BG_OFFSET; }

    // Typical terminal default; the real color is up to the terminal.
    NODISCARD Rgb toRgb() const;
    NODISCARD std::string_view getName() const;

public:
    NODISCARD bool operator==(const Color16 &other) const { return m_code == other.m_code; }
    NODISCARD bool operator!=(const Color16 &other) const { return !operator==(other); }
};

// xterm-256 indexed color.
// 0-15 mirror Color16, 16-231 are the 6x6x6 cube, 232-255 the gray ramp.
class NODISCARD Color256 final
{
public:
    static constexpr const int COUNT = 256;
    static constexpr const int CUBE_START = 16;
    static constexpr const int GRAY_START = 232;

private:
    uint8_t m_code = 0;

public:
    // throws InvalidCodeError
    explicit Color256(int code);

public:
    NODISCARD int getCode() const { return m_code; }
    NODISCARD Rgb toRgb() const;
    NODISCARD std::string_view getName() const;

    NODISCARD std::optional<Color16> getColor16Equivalent() const;
    // Codes 0-15 are left out of approximation because their values are
    // terminal-dependent.
    NODISCARD bool isAvailableForApproximation() const { return m_code >= CUBE_START; }

public:
    NODISCARD bool operator==(const Color256 &other) const { return m_code == other.m_code; }
    NODISCARD bool operator!=(const Color256 &other) const { return !operator==(other); }
};

// Arbitrary 24-bit color, optionally carrying the name it was registered under.
// A variation of a named color also carries the named-palette code of its base.
class NODISCARD ColorRGB final
{
private:
    Rgb m_rgb;
    std::string m_name;
    std::optional<int> m_baseCode;

public:
    explicit ColorRGB(const Rgb &rgb,
                      std::string name = {},
                      const std::optional<int> baseCode = std::nullopt)
        : m_rgb{rgb}
        , m_name{std::move(name)}
        , m_baseCode{baseCode}
    {}

public:
    NODISCARD const Rgb &toRgb() const { return m_rgb; }
    NODISCARD int getCode() const { return static_cast<int>(m_rgb.toInt()); }
    NODISCARD std::string_view getName() const { return m_name; }
    NODISCARD bool hasName() const { return !m_name.empty(); }

    NODISCARD bool isVariation() const { return m_baseCode.has_value(); }
    NODISCARD const std::optional<int> &getBaseCode() const { return m_baseCode; }

public:
    // The name is a label, not part of the value.
    NODISCARD bool operator==(const ColorRGB &other) const { return m_rgb == other.m_rgb; }
    NODISCARD bool operator!=(const ColorRGB &other) const { return !operator==(other); }
};

// Equality is per alternative: a Color16 and a Color256 are never equal,
// even where their codes alias the same terminal color.
using Color = std::variant<Color16, Color256, ColorRGB>;

NODISCARD extern Rgb toRgb(const Color &color);
// Color16/Color256 code, or the 24-bit value of a ColorRGB.
NODISCARD extern int getCode(const Color &color);
// Empty if the color has no name.
NODISCARD extern std::string_view getName(const Color &color);

NODISCARD extern double distanceTo(const Color &color,
                                   const Color &other,
                                   DistanceMetricEnum metric = DEFAULT_DISTANCE_METRIC);

// Short stable form: "c31(#800000? red)", "x196(#ff0000 red-1)", "#ff0000(name)".
NODISCARD extern std::string describe(const Color &color);

// Black or white, whichever reads better on top of the color.
NODISCARD extern ColorRGB textColorFor(const Color &color);

std::ostream &operator<<(std::ostream &os, const Color16 &color);
std::ostream &operator<<(std::ostream &os, const Color256 &color);
std::ostream &operator<<(std::ostream &os, const ColorRGB &color);
std::ostream &operator<<(std::ostream &os, const Color &color);

namespace test {
extern void testColor();
} // namespace test
