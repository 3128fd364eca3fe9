#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "macros.h"

#include <stdexcept>

struct NODISCARD NullPointerException final : public std::runtime_error
{
    NullPointerException()
        : std::runtime_error("NullPointerException")
    {}
    ~NullPointerException() final;
};
