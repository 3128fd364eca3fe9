// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "Approximator.h"

#include "../global/hash.h"
#include "../global/logging.h"
#include "../global/tests.h"
#include "../global/utils.h"
#include "ColorErrors.h"

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <string>
#include <utility>

size_t ApproximationKeyHash::operator()(const ApproximationKey &key) const noexcept
{
    size_t seed = numeric_hash(key.rgb);
    seed = hash_combine(seed, numeric_hash(static_cast<uint8_t>(key.palette)));
    seed = hash_combine(seed, numeric_hash(static_cast<uint8_t>(key.metric)));
    seed = hash_combine(seed, numeric_hash(key.count));
    return seed;
}

ApproximationCache::ApproximationCache()
    : m_snapshot{std::make_shared<const Map>()}
{}

ApproximationCache::~ApproximationCache() = default;

SharedApproximationResults ApproximationCache::find(const ApproximationKey &key) const
{
    const auto snapshot = std::atomic_load(&m_snapshot);
    if (const SharedApproximationResults *const found = deref(snapshot).find(key)) {
        return *found;
    }
    return nullptr;
}

SharedApproximationResults ApproximationCache::insert(const ApproximationKey &key,
                                                      SharedApproximationResults results)
{
    auto current = std::atomic_load(&m_snapshot);
    while (true) {
        if (const SharedApproximationResults *const existing = deref(current).find(key)) {
            TCLOG_DEBUG() << "approximation cache: discarding duplicate result for "
                          << Rgb::fromInt(key.rgb).formatValue("#") << " in "
                          << getName(key.palette) << "/" << getName(key.metric);
            return *existing;
        }

        auto next = std::make_shared<Map>(*current);
        next->set(key, results);
        if (std::atomic_compare_exchange_strong(&m_snapshot,
                                                &current,
                                                std::shared_ptr<const Map>{std::move(next)})) {
            return results;
        }
        // lost the race; current now holds the newer snapshot
    }
}

size_t ApproximationCache::size() const
{
    const auto snapshot = std::atomic_load(&m_snapshot);
    return deref(snapshot).size();
}

void ApproximationCache::clear()
{
    std::atomic_store(&m_snapshot, std::make_shared<const Map>());
}

Approximator::Approximator(const PaletteRegistry &registry)
    : m_registry{registry}
{}

Approximator::~Approximator() = default;

Approximator &Approximator::getDefault()
{
    static Approximator g_approximator{PaletteRegistry::getDefault()};
    return g_approximator;
}

ApproximationResult Approximator::findClosest(const Rgb &rgb,
                                              const PaletteEnum palette,
                                              const DistanceMetricEnum metric)
{
    return find(rgb, palette, 1, metric).front();
}

ApproximationResults Approximator::find(const Rgb &rgb,
                                        const PaletteEnum palette,
                                        const size_t n,
                                        const DistanceMetricEnum metric)
{
    const ApproximationKey key{rgb.toInt(), palette, metric, n};
    if (const SharedApproximationResults hit = m_cache.find(key)) {
        return *hit;
    }

    // computed without holding anything; a concurrent duplicate is harmless
    auto computed = std::make_shared<const ApproximationResults>(
        approximate(rgb, palette, n, metric));
    const SharedApproximationResults stored = m_cache.insert(key, std::move(computed));
    return deref(stored);
}

ApproximationResults Approximator::approximate(const Rgb &rgb,
                                               const PaletteEnum palette,
                                               const size_t n,
                                               const DistanceMetricEnum metric) const
{
    if (n == 0) {
        throw std::invalid_argument("approximation result count must be at least 1");
    }

    const Palette &p = m_registry.getPalette(palette);
    const size_t count = p.getCandidateCount();
    if (count == 0) {
        throw EmptyPaletteError("palette " + std::string{getName(palette)}
                                + " has no colors to approximate with");
    }

    const std::vector<glm::dvec3> &points = p.getComparisonPoints(metric);
    const glm::dvec3 target = toComparisonSpace(rgb, metric);
    const size_t keep = std::min(n, count);

    // (distance, candidate index), sorted by distance; among equal distances
    // the earlier candidate (lower code) stays first.
    using Scored = std::pair<double, size_t>;
    std::vector<Scored> best;
    best.reserve(keep + 1);
    for (size_t i = 0; i < count; ++i) {
        const double d = comparisonDistance(metric, target, points[i]);
        if (best.size() == keep && !(d < best.back().first)) {
            continue;
        }
        const auto pos = std::upper_bound(best.begin(),
                                          best.end(),
                                          d,
                                          [](const double value, const Scored &s) {
                                              return value < s.first;
                                          });
        best.insert(pos, Scored{d, i});
        if (best.size() > keep) {
            best.pop_back();
        }
    }

    ApproximationResults results;
    results.reserve(best.size());
    for (size_t rank = 0; rank < best.size(); ++rank) {
        const auto &[distance, index] = best[rank];
        results.push_back(
            ApproximationResult{p.makeColor(p.getCandidate(index)), distance, rank + 1});
    }
    return results;
}

namespace test {
void testApproximator()
{
    Approximator approximator{PaletteRegistry::getDefault()};

    const auto red = approximator.findClosest(Rgb::fromInt(0xFF0000), PaletteEnum::XTERM_256);
    TEST_ASSERT(red.color == Color{Color256{196}});
    TEST_ASSERT(red.distance == 0.0);
    TEST_ASSERT(approximator.getCache().size() == 1);

    const auto gray = approximator.approximate(Rgb::fromInt(0x808080), PaletteEnum::XTERM_256);
    TEST_ASSERT(gray.size() == 1 && gray.front().color == Color{Color256{244}});
    TEST_ASSERT(approximator.getCache().size() == 1);
}
} // namespace test
