// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "ColorSpace.h"

#include "../global/CaseUtils.h"
#include "../global/Consts.h"
#include "../global/tests.h"
#include "../global/utils.h"
#include "ColorErrors.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace { // anonymous

// sRGB primaries, D65
const glm::dmat3 &getRgbToXyzMatrix()
{
    // glm is column-major; rows are written out and transposed.
    static const glm::dmat3 g_matrix = glm::transpose(glm::dmat3{0.4124564,
                                                                 0.3575761,
                                                                 0.1804375,
                                                                 0.2126729,
                                                                 0.7151522,
                                                                 0.0721750,
                                                                 0.0193339,
                                                                 0.1191920,
                                                                 0.9503041});
    return g_matrix;
}

const glm::dmat3 &getXyzToRgbMatrix()
{
    static const glm::dmat3 g_matrix = glm::transpose(glm::dmat3{3.2404542,
                                                                 -1.5371385,
                                                                 -0.4985314,
                                                                 -0.9692660,
                                                                 1.8760108,
                                                                 0.0415560,
                                                                 0.0556434,
                                                                 -0.2040259,
                                                                 1.0572252});
    return g_matrix;
}

const glm::dvec3 REF_WHITE_D65{95.047, 100.0, 108.883};
constexpr const double CIE_E = 216.0 / 24389.0;
// slope of the linear segment; meets the cube root at CIE_E
constexpr const double CIE_K_FACTOR = (24389.0 / 27.0) / 116.0;
constexpr const double CIE_OFFSET = 16.0 / 116.0;

NODISCARD double gammaExpand(const double v)
{
    return (v <= 0.04045) ? (v / 12.92) : std::pow((v + 0.055) / 1.055, 2.4);
}

NODISCARD double gammaCompress(const double v)
{
    return (v <= 0.0031308) ? (12.92 * v) : (1.055 * std::pow(v, 1.0 / 2.4) - 0.055);
}

NODISCARD double labForward(const double v)
{
    return (v > CIE_E) ? std::cbrt(v) : (CIE_K_FACTOR * v + CIE_OFFSET);
}

NODISCARD double labInverse(const double v)
{
    const double cube = v * v * v;
    return (cube > CIE_E) ? cube : ((v - CIE_OFFSET) / CIE_K_FACTOR);
}

NODISCARD int hexDigitValue(const char c)
{
    const char lower = toLowerAscii(c);
    if (isDigitAscii(lower)) {
        return lower - '0';
    }
    if (lower >= 'a' && lower <= 'f') {
        return lower - 'a' + 10;
    }
    return -1;
}

NORETURN void throwBadHex(const std::string_view hex)
{
    throw InvalidColorFormatError("invalid hex color: \"" + std::string{hex} + "\"");
}

} // namespace

Rgb Rgb::fromInt(const uint32_t value)
{
    if (value > MAX_VALUE) {
        std::ostringstream os;
        os << "color value out of range: 0x" << std::hex << value;
        throw InvalidColorFormatError(os.str());
    }
    return Rgb{static_cast<uint8_t>((value >> 16u) & 0xFFu),
               static_cast<uint8_t>((value >> 8u) & 0xFFu),
               static_cast<uint8_t>(value & 0xFFu)};
}

Rgb Rgb::fromChannels(const int r, const int g, const int b)
{
    const auto check = [](const char name, const int v) {
        if (!isClamped(v, 0, 255)) {
            throw InvalidColorFormatError(std::string("channel ") + name + " out of range: "
                                          + std::to_string(v));
        }
        return static_cast<uint8_t>(v);
    };
    return Rgb{check('R', r), check('G', g), check('B', b)};
}

Rgb Rgb::fromRatios(const double r, const double g, const double b)
{
    return Rgb{static_cast<uint8_t>(utils::clampToByte(r * 255.0)),
               static_cast<uint8_t>(utils::clampToByte(g * 255.0)),
               static_cast<uint8_t>(utils::clampToByte(b * 255.0))};
}

Rgb Rgb::fromHex(const std::string_view hex)
{
    std::string_view digits = hex;
    if (!digits.empty() && digits.front() == char_consts::C_POUND_SIGN) {
        digits.remove_prefix(1);
    } else if (digits.size() > 2 && areEqualAsLowerAscii(digits.substr(0, 2), "0x")) {
        digits.remove_prefix(2);
    }

    const bool isShort = digits.size() == 3 && hex.size() == 4
                         && hex.front() == char_consts::C_POUND_SIGN;
    if (!isShort && digits.size() != 6) {
        throwBadHex(hex);
    }

    uint32_t value = 0;
    for (const char c : digits) {
        const int d = hexDigitValue(c);
        if (d < 0) {
            throwBadHex(hex);
        }
        value = (value << 4u) | static_cast<uint32_t>(d);
        if (isShort) {
            value = (value << 4u) | static_cast<uint32_t>(d);
        }
    }
    return fromInt(value);
}

std::string Rgb::toHex() const
{
    using string_consts::SV_HEX_DIGITS;
    std::string result;
    result.reserve(6);
    for (const int channel : {r(), g(), b()}) {
        result += SV_HEX_DIGITS[static_cast<size_t>(channel >> 4)];
        result += SV_HEX_DIGITS[static_cast<size_t>(channel & 0xF)];
    }
    return result;
}

std::string Rgb::formatValue(const std::string_view prefix) const
{
    return std::string{prefix} + toHex();
}

glm::dvec3 Rgb::toVec() const
{
    return glm::dvec3{static_cast<double>(m_r), static_cast<double>(m_g), static_cast<double>(m_b)};
}

std::ostream &operator<<(std::ostream &os, const Rgb &rgb)
{
    std::string upper = rgb.toHex();
    for (char &c : upper) {
        if (isLowerAscii(c)) {
            c = static_cast<char>(c - ('a' - 'A'));
        }
    }
    return os << "RGB[#" << upper << "][R=" << rgb.r() << " G=" << rgb.g() << " B=" << rgb.b()
              << "]";
}

std::ostream &operator<<(std::ostream &os, const Hsv &hsv)
{
    std::ostringstream tmp;
    tmp << std::fixed << std::setprecision(0) << "HSV[H=" << hsv.h << "° S=" << 100.0 * hsv.s
        << "% V=" << 100.0 * hsv.v << "%]";
    return os << tmp.str();
}

std::ostream &operator<<(std::ostream &os, const Xyz &xyz)
{
    std::ostringstream tmp;
    tmp << std::fixed << std::setprecision(2) << "XYZ[X=" << xyz.x << " Y=" << xyz.y
        << "% Z=" << xyz.z << "]";
    return os << tmp.str();
}

std::ostream &operator<<(std::ostream &os, const Lab &lab)
{
    std::ostringstream tmp;
    tmp << std::fixed << std::setprecision(3) << "LAB[L=" << lab.l << "% a=" << lab.a
        << " b=" << lab.b << "]";
    return os << tmp.str();
}

Hsv rgbToHsv(const Rgb &rgb)
{
    const glm::dvec3 c = rgb.toVec() / 255.0;
    const double vmax = std::max({c.r, c.g, c.b});
    const double vmin = std::min({c.r, c.g, c.b});
    const double delta = vmax - vmin;

    double h = 0.0;
    if (delta > 0.0) {
        if (vmax == c.r) {
            h = 60.0 * ((c.g - c.b) / delta);
        } else if (vmax == c.g) {
            h = 60.0 * ((c.b - c.r) / delta + 2.0);
        } else {
            h = 60.0 * ((c.r - c.g) / delta + 4.0);
        }
        if (h < 0.0) {
            h += 360.0;
        }
    }

    const double s = (vmax > 0.0) ? (delta / vmax) : 0.0;
    return Hsv{h, s, vmax};
}

Rgb hsvToRgb(const Hsv &hsv)
{
    double h = std::fmod(hsv.h, 360.0);
    if (h < 0.0) {
        h += 360.0;
    }
    const double c = hsv.v * hsv.s;
    const double x = c * (1.0 - std::abs(std::fmod(h / 60.0, 2.0) - 1.0));
    const double m = hsv.v - c;

    glm::dvec3 out{0.0};
    switch (static_cast<int>(h / 60.0)) {
    case 0:
        out = glm::dvec3{c, x, 0.0};
        break;
    case 1:
        out = glm::dvec3{x, c, 0.0};
        break;
    case 2:
        out = glm::dvec3{0.0, c, x};
        break;
    case 3:
        out = glm::dvec3{0.0, x, c};
        break;
    case 4:
        out = glm::dvec3{x, 0.0, c};
        break;
    default:
        out = glm::dvec3{c, 0.0, x};
        break;
    }
    out += m;
    return Rgb::fromRatios(out.r, out.g, out.b);
}

Xyz rgbToXyz(const Rgb &rgb)
{
    const glm::dvec3 c = rgb.toVec() / 255.0;
    const glm::dvec3 linear{gammaExpand(c.r), gammaExpand(c.g), gammaExpand(c.b)};
    const glm::dvec3 xyz = getRgbToXyzMatrix() * (linear * 100.0);
    return Xyz{xyz.x, xyz.y, xyz.z};
}

Rgb xyzToRgb(const Xyz &xyz)
{
    const glm::dvec3 linear = getXyzToRgbMatrix() * (xyz.toVec() / 100.0);
    return Rgb::fromRatios(gammaCompress(linear.r),
                           gammaCompress(linear.g),
                           gammaCompress(linear.b));
}

Lab xyzToLab(const Xyz &xyz)
{
    const glm::dvec3 n = xyz.toVec() / REF_WHITE_D65;
    const double fx = labForward(n.x);
    const double fy = labForward(n.y);
    const double fz = labForward(n.z);
    return Lab{116.0 * fy - 16.0, 500.0 * (fx - fy), 200.0 * (fy - fz)};
}

Xyz labToXyz(const Lab &lab)
{
    const double fy = (lab.l + 16.0) / 116.0;
    const double fx = lab.a / 500.0 + fy;
    const double fz = fy - lab.b / 200.0;
    const glm::dvec3 xyz = glm::dvec3{labInverse(fx), labInverse(fy), labInverse(fz)}
                           * REF_WHITE_D65;
    return Xyz{xyz.x, xyz.y, xyz.z};
}

Lab rgbToLab(const Rgb &rgb)
{
    return xyzToLab(rgbToXyz(rgb));
}

Rgb labToRgb(const Lab &lab)
{
    return xyzToRgb(labToXyz(lab));
}

namespace test {
void testColorSpace()
{
    TEST_ASSERT(Rgb::fromInt(0x123456).toInt() == 0x123456u);
    TEST_ASSERT(Rgb::fromHex("#f00").toInt() == 0xFF0000u);
    TEST_ASSERT(Rgb::fromHex("0x00FF80").toHex() == "00ff80");
    TEST_ASSERT(Rgb::fromChannels(1, 2, 3).formatValue("#") == "#010203");

    const Lab white = rgbToLab(Rgb::fromInt(0xFFFFFF));
    TEST_ASSERT(std::abs(white.l - 100.0) < 0.01);
    TEST_ASSERT(std::abs(white.a) < 0.01 && std::abs(white.b) < 0.01);

    const Lab black = rgbToLab(Rgb{});
    TEST_ASSERT(std::abs(black.l) < 1e-9);

    const Hsv red = rgbToHsv(Rgb::fromInt(0xFF0000));
    TEST_ASSERT(red.h == 0.0 && red.s == 1.0 && red.v == 1.0);
    TEST_ASSERT(hsvToRgb(Hsv{120.0, 1.0, 1.0}).toInt() == 0x00FF00u);
    TEST_ASSERT(hsvToRgb(Hsv{240.0, 1.0, 0.5}).toInt() == 0x000080u);
}
} // namespace test
