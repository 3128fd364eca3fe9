#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "../global/macros.h"

#include <string>
#include <string_view>

// Canonical lookup key for a color name.
//
// The input is split into tokens at every run of characters that are not
// ASCII letters or digits (underscore included), and also where a lowercase
// letter is directly followed by an uppercase letter or a digit. Tokens are
// lowercased and joined with '-':
//
//   "Icathian Yellow", "icathian_yellow" and "IcathianYellow" all give
//   "icathian-yellow"; "grey0" gives "grey-0".
//
// Returns an empty string if the input has no letters or digits.
NODISCARD extern std::string normalizeColorName(std::string_view name);

namespace test {
extern void testColorName();
} // namespace test
