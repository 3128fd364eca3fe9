#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "../global/macros.h"
#include "ColorSpace.h"

#include <cstddef>
#include <cstdint>
#include <string_view>

#include <glm/glm.hpp>

#define XFOREACH_DISTANCE_METRIC(X) \
    X(LAB, "lab") \
    X(RGB, "rgb") \
    X(HSV, "hsv")

enum class NODISCARD DistanceMetricEnum : uint8_t {
#define X_DECL_METRIC(UPPER, lower) UPPER,
    XFOREACH_DISTANCE_METRIC(X_DECL_METRIC)
#undef X_DECL_METRIC
};

#define X_COUNT(UPPER, lower) +1
static constexpr const size_t NUM_DISTANCE_METRICS = (XFOREACH_DISTANCE_METRIC(X_COUNT));
#undef X_COUNT

static constexpr const DistanceMetricEnum DEFAULT_DISTANCE_METRIC = DistanceMetricEnum::LAB;

// throws UnknownMetricError
NODISCARD extern DistanceMetricEnum parseDistanceMetric(std::string_view name);
// throws UnknownMetricError for a value outside the enum
NODISCARD extern std::string_view getName(DistanceMetricEnum metric);

// Coordinates of rgb in the space the metric compares in:
// LAB is (L, a, b), RGB is (r, g, b) in 0..255, HSV is (h, s, v).
NODISCARD extern glm::dvec3 toComparisonSpace(const Rgb &rgb, DistanceMetricEnum metric);

// Distance between two points already in the metric's comparison space.
NODISCARD extern double comparisonDistance(DistanceMetricEnum metric,
                                           const glm::dvec3 &a,
                                           const glm::dvec3 &b);

NODISCARD extern double colorDistance(const Rgb &a, const Rgb &b, DistanceMetricEnum metric);
