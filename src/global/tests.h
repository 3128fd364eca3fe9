#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "tc_source_location.h"

NORETURN
extern void test_assert_fail(tc::source_location loc, const char *reason);
#define TEST_ASSERT(x) \
    do { \
        if (!(x)) { \
            test_assert_fail(TC_SOURCE_LOCATION(), #x); \
        } \
    } while (false)
