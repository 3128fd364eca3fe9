// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "DistanceMetric.h"

#include "../global/CaseUtils.h"
#include "ColorErrors.h"

#include <algorithm>
#include <cmath>
#include <string>

namespace { // anonymous

NORETURN void throwUnknownMetric(const DistanceMetricEnum metric)
{
    throw UnknownMetricError("unknown distance metric: "
                             + std::to_string(static_cast<int>(metric)));
}

NODISCARD double hsvDistance(const glm::dvec3 &a, const glm::dvec3 &b)
{
    const double rawHue = std::abs(a.x - b.x);
    const double dh = std::min(rawHue, 360.0 - rawHue) / 180.0;
    const double ds = a.y - b.y;
    const double dv = a.z - b.z;
    return std::sqrt(dh * dh + ds * ds + dv * dv);
}

} // namespace

DistanceMetricEnum parseDistanceMetric(const std::string_view name)
{
#define X_PARSE_METRIC(UPPER, lower) \
    if (areEqualAsLowerAscii(name, lower)) { \
        return DistanceMetricEnum::UPPER; \
    }
    XFOREACH_DISTANCE_METRIC(X_PARSE_METRIC)
#undef X_PARSE_METRIC

    throw UnknownMetricError("unknown distance metric: \"" + std::string{name}
                             + "\" (expected lab, rgb or hsv)");
}

std::string_view getName(const DistanceMetricEnum metric)
{
    switch (metric) {
#define X_CASE_METRIC(UPPER, lower) \
    case DistanceMetricEnum::UPPER: \
        return lower;
        XFOREACH_DISTANCE_METRIC(X_CASE_METRIC)
#undef X_CASE_METRIC
    }
    throwUnknownMetric(metric);
}

glm::dvec3 toComparisonSpace(const Rgb &rgb, const DistanceMetricEnum metric)
{
    switch (metric) {
    case DistanceMetricEnum::LAB:
        return rgbToLab(rgb).toVec();
    case DistanceMetricEnum::RGB:
        return rgb.toVec();
    case DistanceMetricEnum::HSV:
        return rgbToHsv(rgb).toVec();
    }
    throwUnknownMetric(metric);
}

double comparisonDistance(const DistanceMetricEnum metric, const glm::dvec3 &a, const glm::dvec3 &b)
{
    switch (metric) {
    case DistanceMetricEnum::LAB:
    case DistanceMetricEnum::RGB:
        return glm::distance(a, b);
    case DistanceMetricEnum::HSV:
        return hsvDistance(a, b);
    }
    throwUnknownMetric(metric);
}

double colorDistance(const Rgb &a, const Rgb &b, const DistanceMetricEnum metric)
{
    return comparisonDistance(metric, toComparisonSpace(a, metric), toComparisonSpace(b, metric));
}
