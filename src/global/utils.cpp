// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "utils.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <limits>

int utils::round_dtoi(const double d)
{
    using lim = std::numeric_limits<int>;
    assert(std::isfinite(d));
    const long l = std::lround(d);
    assert(isClamped<long>(l, lim::min(), lim::max()));
    return static_cast<int>(l);
}

int utils::clampToByte(const double d)
{
    if (!std::isfinite(d)) {
        return 0;
    }
    return round_dtoi(std::clamp(d, 0.0, 255.0));
}
