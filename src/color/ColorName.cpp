// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "ColorName.h"

#include "../global/CaseUtils.h"
#include "../global/Consts.h"
#include "../global/tests.h"

std::string normalizeColorName(const std::string_view name)
{
    std::string result;
    result.reserve(name.size());

    bool pendingSeparator = false;
    char prev = char_consts::C_SPACE;
    for (const char c : name) {
        if (!isAlnumAscii(c)) {
            pendingSeparator = true;
            prev = c;
            continue;
        }
        if (isLowerAscii(prev) && (isUpperAscii(c) || isDigitAscii(c))) {
            pendingSeparator = true;
        }
        if (pendingSeparator && !result.empty()) {
            result += char_consts::C_MINUS_SIGN;
        }
        pendingSeparator = false;
        result += toLowerAscii(c);
        prev = c;
    }
    return result;
}

namespace test {
void testColorName()
{
    TEST_ASSERT(normalizeColorName("Icathian Yellow") == "icathian-yellow");
    TEST_ASSERT(normalizeColorName("icathian-yellow") == "icathian-yellow");
    TEST_ASSERT(normalizeColorName("IcathianYellow") == "icathian-yellow");
    TEST_ASSERT(normalizeColorName("icathianyellow") == "icathianyellow");
    TEST_ASSERT(normalizeColorName("__deep_sky_blue7__") == "deep-sky-blue-7");
    TEST_ASSERT(normalizeColorName("grey0") == "grey-0");
    TEST_ASSERT(normalizeColorName("HI-RED") == "hi-red");
    TEST_ASSERT(normalizeColorName(" -_ ").empty());
}
} // namespace test
