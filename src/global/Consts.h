#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include <string_view>

#define XFOREACH_CHAR_CONST(X) \
    X(CARRIAGE_RETURN, '\r') \
    X(CLOSE_PARENS, ')') \
    X(MINUS_SIGN, '-') \
    X(NEWLINE, '\n') \
    X(OPEN_PARENS, '(') \
    X(POUND_SIGN, '#') \
    X(QUESTION_MARK, '?') \
    X(SPACE, ' ')

namespace char_consts {
#define X_DEFINE_CHAR_CONST(NAME, val) static inline constexpr const char C_##NAME{(val)};
XFOREACH_CHAR_CONST(X_DEFINE_CHAR_CONST)
#undef X_DEFINE_CHAR_CONST
} // namespace char_consts

namespace string_consts {
static inline constexpr const std::string_view SV_HEX_PREFIX = "0x";
static inline constexpr const std::string_view SV_HEX_DIGITS = "0123456789abcdef";
} // namespace string_consts
