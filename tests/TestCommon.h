#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "../src/global/macros.h"

// True if fn() throws Ex; any other exception escapes to the test runner.
template<typename Ex, typename Fn>
NODISCARD bool throwsException(Fn &&fn)
{
    try {
        fn();
    } catch (const Ex &) {
        return true;
    }
    return false;
}
