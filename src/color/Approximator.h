#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "../global/ImmUnorderedMap.h"
#include "../global/RuleOf5.h"
#include "../global/macros.h"
#include "Color.h"
#include "ColorSpace.h"
#include "DistanceMetric.h"
#include "Palette.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

struct NODISCARD ApproximationResult final
{
    Color color;
    double distance = 0.0;
    // 1 is the closest match
    size_t rank = 0;

    NODISCARD bool operator==(const ApproximationResult &other) const
    {
        return color == other.color && distance == other.distance && rank == other.rank;
    }
    NODISCARD bool operator!=(const ApproximationResult &other) const
    {
        return !operator==(other);
    }
};

using ApproximationResults = std::vector<ApproximationResult>;
using SharedApproximationResults = std::shared_ptr<const ApproximationResults>;

struct NODISCARD ApproximationKey final
{
    uint32_t rgb = 0;
    PaletteEnum palette = PaletteEnum::XTERM_256;
    DistanceMetricEnum metric = DEFAULT_DISTANCE_METRIC;
    size_t count = 1;

    NODISCARD bool operator==(const ApproximationKey &other) const
    {
        return rgb == other.rgb && palette == other.palette && metric == other.metric
               && count == other.count;
    }
    NODISCARD bool operator!=(const ApproximationKey &other) const { return !operator==(other); }
};

struct NODISCARD ApproximationKeyHash final
{
    NODISCARD size_t operator()(const ApproximationKey &key) const noexcept;
};

// Results of previous approximations.
//
// Readers load the current snapshot and never block. A writer copies the
// snapshot (cheap: the map is persistent), adds its entry and publishes the
// copy with compare-and-swap. When two threads compute the same key, the
// first published result wins and the other is discarded.
//
// Entries are never evicted; palettes do not change while the process runs.
class NODISCARD ApproximationCache final
{
private:
    using Map = ImmUnorderedMap<ApproximationKey, SharedApproximationResults, ApproximationKeyHash>;
    std::shared_ptr<const Map> m_snapshot;

public:
    ApproximationCache();
    ~ApproximationCache();
    DELETE_CTORS_AND_ASSIGN_OPS(ApproximationCache);

public:
    NODISCARD SharedApproximationResults find(const ApproximationKey &key) const;
    // Returns whatever is stored for the key after the call.
    NODISCARD SharedApproximationResults insert(const ApproximationKey &key,
                                                SharedApproximationResults results);
    NODISCARD size_t size() const;
    void clear();
};

// Nearest-color search over a palette's approximation candidates.
//
// Ties are broken by lower palette code. A request for more results than the
// palette has candidates returns all of them.
class NODISCARD Approximator final
{
private:
    const PaletteRegistry &m_registry;
    ApproximationCache m_cache;

public:
    explicit Approximator(const PaletteRegistry &registry);
    ~Approximator();
    DELETE_CTORS_AND_ASSIGN_OPS(Approximator);

public:
    // Shared instance over PaletteRegistry::getDefault().
    NODISCARD static Approximator &getDefault();

public:
    NODISCARD const PaletteRegistry &getRegistry() const { return m_registry; }
    NODISCARD ApproximationCache &getCache() { return m_cache; }

public:
    // Cached single best match.
    NODISCARD ApproximationResult findClosest(const Rgb &rgb,
                                              PaletteEnum palette,
                                              DistanceMetricEnum metric = DEFAULT_DISTANCE_METRIC);

    // Cached top-n matches in ascending distance.
    // throws std::invalid_argument if n == 0
    // throws EmptyPaletteError, UnknownMetricError
    NODISCARD ApproximationResults find(const Rgb &rgb,
                                        PaletteEnum palette,
                                        size_t n,
                                        DistanceMetricEnum metric = DEFAULT_DISTANCE_METRIC);

    // Same as find(), but never reads or writes the cache.
    NODISCARD ApproximationResults approximate(const Rgb &rgb,
                                               PaletteEnum palette,
                                               size_t n = 1,
                                               DistanceMetricEnum metric
                                               = DEFAULT_DISTANCE_METRIC) const;
};

namespace test {
extern void testApproximator();
} // namespace test
