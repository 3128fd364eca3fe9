#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "../global/RuleOf5.h"
#include "../global/macros.h"
#include "Color.h"
#include "ColorSpace.h"
#include "DistanceMetric.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <glm/glm.hpp>

#define XFOREACH_PALETTE(X) \
    X(XTERM_16, "xterm16") \
    X(XTERM_256, "xterm256") \
    X(NAMED_RGB, "named-rgb")

enum class NODISCARD PaletteEnum : uint8_t {
#define X_DECL_PALETTE(UPPER, lower) UPPER,
    XFOREACH_PALETTE(X_DECL_PALETTE)
#undef X_DECL_PALETTE
};

NODISCARD extern std::string_view getName(PaletteEnum palette);

struct NODISCARD PaletteEntry final
{
    int code = 0;
    Rgb rgb;
    std::string name;
    // set for a variation; the code of the entry it varies
    std::optional<int> baseCode;
};

// A color similar to its base, named by the base name plus a suffix.
struct NODISCARD NamedColorVariation final
{
    std::string suffix;
    uint32_t value = 0;
};

struct NODISCARD NamedColorDef final
{
    std::string name;
    uint32_t value = 0;
    std::vector<NamedColorVariation> variations;
};

struct NODISCARD NamedColorAlias final
{
    std::string alias;
    std::string target;
};

struct NODISCARD NamedRgbTable final
{
    std::vector<NamedColorDef> colors;
    std::vector<NamedColorAlias> aliases;
};

// Immutable set of (code, RGB, name) entries, indexed by code, by
// normalized name, and by exact RGB value.
//
// Entries with code < firstCandidateCode are addressable but are never
// approximation candidates. Candidate coordinates in the comparison space of
// every distance metric are computed once at construction.
class NODISCARD Palette final
{
private:
    PaletteEnum m_id;
    std::vector<PaletteEntry> m_entries;
    std::vector<size_t> m_candidates;
    std::array<std::vector<glm::dvec3>, NUM_DISTANCE_METRICS> m_comparisonPoints;
    std::unordered_map<std::string, size_t> m_nameIndex;
    std::unordered_map<uint32_t, size_t> m_exactIndex;

public:
    // throws NameConflictError if two entries or aliases claim the same name
    // throws NotFoundError for an alias to an unknown name
    Palette(PaletteEnum id,
            std::vector<PaletteEntry> entries,
            const std::vector<NamedColorAlias> &aliases = {},
            int firstCandidateCode = 0);
    DEFAULT_RULE_OF_5(Palette);

public:
    NODISCARD PaletteEnum getId() const { return m_id; }
    NODISCARD size_t size() const { return m_entries.size(); }
    NODISCARD bool empty() const { return m_entries.empty(); }
    NODISCARD const std::vector<PaletteEntry> &getEntries() const { return m_entries; }

    // throws NotFoundError
    NODISCARD const PaletteEntry &getByCode(int code) const;
    NODISCARD const PaletteEntry *findByName(std::string_view name) const;
    // Lowest-code approximation candidate with exactly this value.
    NODISCARD const PaletteEntry *findExact(const Rgb &rgb) const;

public:
    NODISCARD size_t getCandidateCount() const { return m_candidates.size(); }
    NODISCARD const PaletteEntry &getCandidate(size_t i) const;
    // Parallel to the candidates, in code order.
    NODISCARD const std::vector<glm::dvec3> &getComparisonPoints(DistanceMetricEnum metric) const;

public:
    NODISCARD Color makeColor(const PaletteEntry &entry) const;
};

// The three palettes a color can be resolved into.
// The xterm palettes are fixed; the named palette comes from a table.
class NODISCARD PaletteRegistry final
{
private:
    Palette m_xterm16;
    Palette m_xterm256;
    Palette m_named;

public:
    // throws NameConflictError
    explicit PaletteRegistry(const NamedRgbTable &named);
    DELETE_CTORS_AND_ASSIGN_OPS(PaletteRegistry);
    ~PaletteRegistry() = default;

public:
    // Built on first use; thread-safe and never modified afterwards.
    NODISCARD static const PaletteRegistry &getDefault();
    NODISCARD static NamedRgbTable getDefaultNamedTable();

public:
    NODISCARD const Palette &getPalette(PaletteEnum palette) const;
    NODISCARD const std::vector<PaletteEntry> &entries(PaletteEnum palette) const
    {
        return getPalette(palette).getEntries();
    }

    // throws NotFoundError
    NODISCARD Color getByCode(PaletteEnum palette, int code) const;
    // Named palette only. throws NotFoundError
    NODISCARD ColorRGB getByName(std::string_view name) const;
    NODISCARD std::optional<Color> findByName(PaletteEnum palette, std::string_view name) const;
    // Tries xterm16, then xterm256, then the named palette.
    // throws NotFoundError
    NODISCARD Color findAnyByName(std::string_view name) const;

    // Named palette only.
    // throws NotFoundError if the color refers to a code that does not exist
    NODISCARD std::optional<ColorRGB> getBase(const ColorRGB &color) const;
    // Variations registered under the named entry of the given color, in code order.
    NODISCARD std::vector<ColorRGB> getVariations(const ColorRGB &color) const;
};

namespace test {
extern void testPalette();
} // namespace test
