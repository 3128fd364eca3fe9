// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "tests.h"

#include <cstdlib>

#include <QDebug>

NORETURN
void test_assert_fail(const tc::source_location loc, const char *const reason)
{
    QMessageLogger(loc.file_name(), static_cast<int>(loc.line()), loc.function_name())
        .fatal("self-check failed: (%s) is false at %s:%d",
               (reason != nullptr) ? reason : "false",
               loc.file_name(),
               static_cast<int>(loc.line()));

    // fatal() does not return.
    // NOLINTNEXTLINE
    std::abort();
}
