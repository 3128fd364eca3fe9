// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "Palette.h"

#include "../global/Consts.h"
#include "../global/logging.h"
#include "../global/tests.h"
#include "ColorErrors.h"
#include "ColorName.h"
#include "NamedRgbData.h"
#include "XtermData.h"

#include <stdexcept>
#include <tuple>
#include <utility>

namespace { // anonymous

NODISCARD size_t metricIndex(const DistanceMetricEnum metric)
{
    const auto index = static_cast<size_t>(metric);
    if (index >= NUM_DISTANCE_METRICS) {
        throw UnknownMetricError("unknown distance metric: " + std::to_string(index));
    }
    return index;
}

NODISCARD std::vector<PaletteEntry> buildXterm16Entries()
{
    std::vector<PaletteEntry> entries;
    entries.reserve(Color16::COUNT);
    for (int code = 0; code < Color16::COUNT; ++code) {
        const Color16 color{code};
        entries.push_back(PaletteEntry{code, color.toRgb(), std::string{color.getName()}});
    }
    return entries;
}

NODISCARD std::vector<PaletteEntry> buildXterm256Entries()
{
    std::vector<PaletteEntry> entries;
    entries.reserve(Color256::COUNT);
    for (int code = 0; code < Color256::COUNT; ++code) {
        const Color256 color{code};
        entries.push_back(PaletteEntry{code, color.toRgb(), std::string{color.getName()}});
    }
    return entries;
}

// Codes are assigned in table order, each variation right after its base.
// A repeated name with the same value is dropped; a repeated name with a
// different value is a conflict.
class NODISCARD NamedEntriesBuilder final
{
private:
    std::vector<PaletteEntry> m_entries;
    std::unordered_map<std::string, size_t> m_seen;

public:
    // Returns the code of the entry now registered under the name.
    NODISCARD int add(const std::string &name,
                      const uint32_t value,
                      const std::optional<int> baseCode)
    {
        const Rgb rgb = Rgb::fromInt(value);
        const std::string key = normalizeColorName(name);
        if (key.empty()) {
            throw InvalidColorFormatError("named color without a usable name: \"" + name + "\"");
        }
        if (const auto it = m_seen.find(key); it != m_seen.end()) {
            const PaletteEntry &existing = m_entries[it->second];
            if (existing.rgb == rgb) {
                return existing.code;
            }
            throw NameConflictError("color name \"" + name + "\" is already registered as #"
                                    + existing.rgb.toHex());
        }
        const int code = static_cast<int>(m_entries.size());
        m_seen.emplace(key, m_entries.size());
        m_entries.push_back(PaletteEntry{code, rgb, name, baseCode});
        return code;
    }

    NODISCARD std::vector<PaletteEntry> release() { return std::exchange(m_entries, {}); }
};

NODISCARD std::vector<PaletteEntry> buildNamedEntries(const std::vector<NamedColorDef> &colors)
{
    NamedEntriesBuilder builder;
    for (const NamedColorDef &def : colors) {
        const int baseCode = builder.add(def.name, def.value, std::nullopt);
        for (const NamedColorVariation &variation : def.variations) {
            std::ignore = builder.add(def.name + char_consts::C_MINUS_SIGN + variation.suffix,
                                      variation.value,
                                      baseCode);
        }
    }
    return builder.release();
}

} // namespace

std::string_view getName(const PaletteEnum palette)
{
    switch (palette) {
#define X_CASE_PALETTE(UPPER, lower) \
    case PaletteEnum::UPPER: \
        return lower;
        XFOREACH_PALETTE(X_CASE_PALETTE)
#undef X_CASE_PALETTE
    }
    throw std::invalid_argument("invalid palette");
}

Palette::Palette(const PaletteEnum id,
                 std::vector<PaletteEntry> entries,
                 const std::vector<NamedColorAlias> &aliases,
                 const int firstCandidateCode)
    : m_id{id}
    , m_entries{std::move(entries)}
{
    for (size_t i = 0; i < m_entries.size(); ++i) {
        const PaletteEntry &entry = m_entries[i];
        if (entry.code != static_cast<int>(i)) {
            throw std::invalid_argument("palette entries must be numbered in order");
        }

        if (!entry.name.empty()) {
            const auto [it, inserted] = m_nameIndex.emplace(normalizeColorName(entry.name), i);
            if (!inserted) {
                throw NameConflictError("duplicate color name \"" + entry.name + "\" in "
                                        + std::string{getName(id)});
            }
        }

        if (entry.code < firstCandidateCode) {
            continue;
        }
        m_candidates.push_back(i);
        // first (lowest code) wins
        m_exactIndex.emplace(entry.rgb.toInt(), i);
        for (size_t m = 0; m < NUM_DISTANCE_METRICS; ++m) {
            m_comparisonPoints[m].push_back(
                toComparisonSpace(entry.rgb, static_cast<DistanceMetricEnum>(m)));
        }
    }

    for (const NamedColorAlias &alias : aliases) {
        const auto target = m_nameIndex.find(normalizeColorName(alias.target));
        if (target == m_nameIndex.end()) {
            throw NotFoundError("alias \"" + alias.alias + "\" refers to unknown color \""
                                + alias.target + "\"");
        }
        const size_t index = target->second;
        const auto [it, inserted] = m_nameIndex.emplace(normalizeColorName(alias.alias), index);
        if (!inserted && it->second != index) {
            throw NameConflictError("alias \"" + alias.alias + "\" is already a different color");
        }
    }
}

const PaletteEntry &Palette::getByCode(const int code) const
{
    if (code < 0 || static_cast<size_t>(code) >= m_entries.size()) {
        throw NotFoundError("no color with code " + std::to_string(code) + " in "
                            + std::string{getName(m_id)});
    }
    return m_entries[static_cast<size_t>(code)];
}

const PaletteEntry *Palette::findByName(const std::string_view name) const
{
    const auto it = m_nameIndex.find(normalizeColorName(name));
    if (it == m_nameIndex.end()) {
        return nullptr;
    }
    return &m_entries[it->second];
}

const PaletteEntry *Palette::findExact(const Rgb &rgb) const
{
    const auto it = m_exactIndex.find(rgb.toInt());
    if (it == m_exactIndex.end()) {
        return nullptr;
    }
    return &m_entries[it->second];
}

const PaletteEntry &Palette::getCandidate(const size_t i) const
{
    return m_entries[m_candidates.at(i)];
}

const std::vector<glm::dvec3> &Palette::getComparisonPoints(const DistanceMetricEnum metric) const
{
    return m_comparisonPoints[metricIndex(metric)];
}

Color Palette::makeColor(const PaletteEntry &entry) const
{
    switch (m_id) {
    case PaletteEnum::XTERM_16:
        return Color16{entry.code};
    case PaletteEnum::XTERM_256:
        return Color256{entry.code};
    case PaletteEnum::NAMED_RGB:
        return ColorRGB{entry.rgb, entry.name, entry.baseCode};
    }
    throw std::invalid_argument("invalid palette");
}

PaletteRegistry::PaletteRegistry(const NamedRgbTable &named)
    : m_xterm16{PaletteEnum::XTERM_16, buildXterm16Entries()}
    , m_xterm256{PaletteEnum::XTERM_256, buildXterm256Entries(), {}, Color256::CUBE_START}
    , m_named{PaletteEnum::NAMED_RGB, buildNamedEntries(named.colors), named.aliases}
{}

NamedRgbTable PaletteRegistry::getDefaultNamedTable()
{
    NamedRgbTable table;
#define X_NAMED_COLOR(name, value) table.colors.push_back(NamedColorDef{name, value});
    XFOREACH_NAMED_RGB_COLOR(X_NAMED_COLOR)
#undef X_NAMED_COLOR
#define X_NAMED_ALIAS(alias, target) table.aliases.push_back(NamedColorAlias{alias, target});
    XFOREACH_NAMED_RGB_ALIAS(X_NAMED_ALIAS)
#undef X_NAMED_ALIAS
    return table;
}

const PaletteRegistry &PaletteRegistry::getDefault()
{
    static const PaletteRegistry &g_registry = []() -> const PaletteRegistry & {
        static const PaletteRegistry registry{getDefaultNamedTable()};
        TCLOG_DEBUG() << "palette registry built: " << getName(PaletteEnum::XTERM_16) << "="
                      << registry.m_xterm16.size() << " " << getName(PaletteEnum::XTERM_256)
                      << "=" << registry.m_xterm256.size() << " "
                      << getName(PaletteEnum::NAMED_RGB) << "=" << registry.m_named.size();
        return registry;
    }();
    return g_registry;
}

const Palette &PaletteRegistry::getPalette(const PaletteEnum palette) const
{
    switch (palette) {
    case PaletteEnum::XTERM_16:
        return m_xterm16;
    case PaletteEnum::XTERM_256:
        return m_xterm256;
    case PaletteEnum::NAMED_RGB:
        return m_named;
    }
    throw std::invalid_argument("invalid palette");
}

Color PaletteRegistry::getByCode(const PaletteEnum palette, const int code) const
{
    const Palette &p = getPalette(palette);
    return p.makeColor(p.getByCode(code));
}

ColorRGB PaletteRegistry::getByName(const std::string_view name) const
{
    if (const PaletteEntry *const entry = m_named.findByName(name)) {
        return ColorRGB{entry->rgb, entry->name, entry->baseCode};
    }
    throw NotFoundError("color \"" + std::string{name} + "\" not found in "
                        + std::string{getName(PaletteEnum::NAMED_RGB)});
}

std::optional<Color> PaletteRegistry::findByName(const PaletteEnum palette,
                                                 const std::string_view name) const
{
    const Palette &p = getPalette(palette);
    if (const PaletteEntry *const entry = p.findByName(name)) {
        return p.makeColor(*entry);
    }
    return std::nullopt;
}

Color PaletteRegistry::findAnyByName(const std::string_view name) const
{
    for (const PaletteEnum palette :
         {PaletteEnum::XTERM_16, PaletteEnum::XTERM_256, PaletteEnum::NAMED_RGB}) {
        if (auto color = findByName(palette, name)) {
            return std::move(*color);
        }
    }
    throw NotFoundError("color \"" + std::string{name} + "\" not found in "
                        + std::string{getName(PaletteEnum::XTERM_16)} + ", "
                        + std::string{getName(PaletteEnum::XTERM_256)} + " or "
                        + std::string{getName(PaletteEnum::NAMED_RGB)} + " registry");
}

std::optional<ColorRGB> PaletteRegistry::getBase(const ColorRGB &color) const
{
    const std::optional<int> &baseCode = color.getBaseCode();
    if (!baseCode.has_value()) {
        return std::nullopt;
    }
    const PaletteEntry &base = m_named.getByCode(*baseCode);
    return ColorRGB{base.rgb, base.name, base.baseCode};
}

std::vector<ColorRGB> PaletteRegistry::getVariations(const ColorRGB &color) const
{
    std::vector<ColorRGB> result;
    const PaletteEntry *const self = m_named.findByName(color.getName());
    if (self == nullptr) {
        return result;
    }
    for (const PaletteEntry &entry : m_named.getEntries()) {
        if (entry.baseCode == self->code) {
            result.emplace_back(entry.rgb, entry.name, entry.baseCode);
        }
    }
    return result;
}

namespace test {
void testPalette()
{
    const PaletteRegistry &registry = PaletteRegistry::getDefault();
    TEST_ASSERT(registry.entries(PaletteEnum::XTERM_16).size() == 16);
    TEST_ASSERT(registry.entries(PaletteEnum::XTERM_256).size() == 256);
    TEST_ASSERT(registry.entries(PaletteEnum::NAMED_RGB).size()
                == PaletteRegistry::getDefaultNamedTable().colors.size());
    TEST_ASSERT(registry.getPalette(PaletteEnum::XTERM_256).getCandidateCount() == 240);
    TEST_ASSERT(registry.getPalette(PaletteEnum::XTERM_256).getCandidate(0).code == 16);
    TEST_ASSERT(registry.getByName("Light Goldenrod Yellow").toRgb().toInt() == 0xFAFAD2u);
    TEST_ASSERT(registry.getByName("grey") == registry.getByName("gray"));
    TEST_ASSERT(registry.findAnyByName("red-1") == Color{Color256{196}});
}
} // namespace test
