#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "macros.h"

#include <string>
#include <string_view>

NODISCARD extern bool isLowerAscii(char c);
NODISCARD extern bool isUpperAscii(char c);
NODISCARD extern bool isDigitAscii(char c);
NODISCARD extern bool isAlnumAscii(char c);
NODISCARD extern char toLowerAscii(char c);

NODISCARD extern bool areEqualAsLowerAscii(std::string_view a, std::string_view b);
NODISCARD extern std::string toLowerAscii(std::string_view sv);

namespace test {
extern void testCaseUtils();
} // namespace test
