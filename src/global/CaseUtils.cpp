// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "CaseUtils.h"

#include "tests.h"

bool isLowerAscii(const char c)
{
    return c >= 'a' && c <= 'z';
}

bool isUpperAscii(const char c)
{
    return c >= 'A' && c <= 'Z';
}

bool isDigitAscii(const char c)
{
    return c >= '0' && c <= '9';
}

bool isAlnumAscii(const char c)
{
    return isLowerAscii(c) || isUpperAscii(c) || isDigitAscii(c);
}

char toLowerAscii(const char c)
{
    if (isUpperAscii(c)) {
        return static_cast<char>(c + ('a' - 'A'));
    }
    return c;
}

bool areEqualAsLowerAscii(const std::string_view a, const std::string_view b)
{
    const size_t size = a.size();
    if (size != b.size()) {
        return false;
    }
    for (size_t i = 0; i < size; ++i) {
        if (toLowerAscii(a[i]) != toLowerAscii(b[i])) {
            return false;
        }
    }
    return true;
}

std::string toLowerAscii(const std::string_view sv)
{
    std::string result;
    result.reserve(sv.size());
    for (const char c : sv) {
        result += toLowerAscii(c);
    }
    return result;
}

namespace test {
void testCaseUtils()
{
    TEST_ASSERT(toLowerAscii('A') == 'a');
    TEST_ASSERT(toLowerAscii('z') == 'z');
    TEST_ASSERT(toLowerAscii('-') == '-');
    TEST_ASSERT(isAlnumAscii('7') && !isAlnumAscii('_'));
    TEST_ASSERT(areEqualAsLowerAscii("DarkRed", "darkred"));
    TEST_ASSERT(!areEqualAsLowerAscii("DarkRed", "dark-red"));
    TEST_ASSERT(toLowerAscii(std::string_view{"HI-Red 9"}) == "hi-red 9");
}
} // namespace test
