#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "../global/macros.h"

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

#include <glm/glm.hpp>

// 24-bit sRGB value. Channels are always in [0, 255]; every factory that
// takes wider input rejects out-of-range values instead of clamping them,
// except fromRatios(), which is the landing point of the float transforms.
class NODISCARD Rgb final
{
public:
    static constexpr const uint32_t MAX_VALUE = 0xFFFFFFu;

private:
    uint8_t m_r = 0;
    uint8_t m_g = 0;
    uint8_t m_b = 0;

private:
    constexpr Rgb(const uint8_t r, const uint8_t g, const uint8_t b)
        : m_r{r}
        , m_g{g}
        , m_b{b}
    {}

public:
    constexpr Rgb() = default;

public:
    // throws InvalidColorFormatError if value > 0xFFFFFF
    NODISCARD static Rgb fromInt(uint32_t value);
    // throws InvalidColorFormatError if any channel is outside [0, 255]
    NODISCARD static Rgb fromChannels(int r, int g, int b);
    // rounds and clamps; ratios are nominally in [0, 1]
    NODISCARD static Rgb fromRatios(double r, double g, double b);
    // accepts "#RRGGBB", "#RGB", "RRGGBB" and "0xRRGGBB" in either case
    NODISCARD static Rgb fromHex(std::string_view hex);

public:
    NODISCARD constexpr int r() const { return m_r; }
    NODISCARD constexpr int g() const { return m_g; }
    NODISCARD constexpr int b() const { return m_b; }

    NODISCARD constexpr uint32_t toInt() const
    {
        return (static_cast<uint32_t>(m_r) << 16u) | (static_cast<uint32_t>(m_g) << 8u)
               | static_cast<uint32_t>(m_b);
    }

    // 6 lowercase hex digits, no prefix
    NODISCARD std::string toHex() const;
    NODISCARD std::string formatValue(std::string_view prefix = "0x") const;

    NODISCARD glm::dvec3 toVec() const;

public:
    NODISCARD constexpr bool operator==(const Rgb &other) const
    {
        return m_r == other.m_r && m_g == other.m_g && m_b == other.m_b;
    }
    NODISCARD constexpr bool operator!=(const Rgb &other) const { return !operator==(other); }

    friend std::ostream &operator<<(std::ostream &os, const Rgb &rgb);
};

// hue in degrees [0, 360); saturation and value in [0, 1]
struct NODISCARD Hsv final
{
    double h = 0.0;
    double s = 0.0;
    double v = 0.0;

    NODISCARD glm::dvec3 toVec() const { return glm::dvec3{h, s, v}; }
    friend std::ostream &operator<<(std::ostream &os, const Hsv &hsv);
};

// CIE XYZ scaled so that the D65 white point has Y = 100
struct NODISCARD Xyz final
{
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    NODISCARD glm::dvec3 toVec() const { return glm::dvec3{x, y, z}; }
    friend std::ostream &operator<<(std::ostream &os, const Xyz &xyz);
};

// CIE L*a*b* relative to D65; L in [0, 100]
struct NODISCARD Lab final
{
    double l = 0.0;
    double a = 0.0;
    double b = 0.0;

    NODISCARD glm::dvec3 toVec() const { return glm::dvec3{l, a, b}; }
    friend std::ostream &operator<<(std::ostream &os, const Lab &lab);
};

NODISCARD extern Hsv rgbToHsv(const Rgb &rgb);
NODISCARD extern Rgb hsvToRgb(const Hsv &hsv);

NODISCARD extern Xyz rgbToXyz(const Rgb &rgb);
NODISCARD extern Rgb xyzToRgb(const Xyz &xyz);

NODISCARD extern Lab xyzToLab(const Xyz &xyz);
NODISCARD extern Xyz labToXyz(const Lab &lab);

NODISCARD extern Lab rgbToLab(const Rgb &rgb);
NODISCARD extern Rgb labToRgb(const Lab &lab);

namespace test {
extern void testColorSpace();
} // namespace test
