#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "../global/macros.h"

#include <stdexcept>
#include <string>

struct NODISCARD ColorError : public std::runtime_error
{
    explicit ColorError(const std::string &msg)
        : std::runtime_error(msg)
    {}
    ~ColorError() override;
};

#define XFOREACH_COLOR_ERROR(X) \
    X(InvalidColorFormatError) \
    X(InvalidCodeError) \
    X(NotFoundError) \
    X(EmptyPaletteError) \
    X(UnknownMetricError) \
    X(NameConflictError)

#define X_DECL_COLOR_ERROR(_Name) \
    struct NODISCARD _Name final : public ColorError \
    { \
        explicit _Name(const std::string &msg) \
            : ColorError(msg) \
        {} \
        ~_Name() final; \
    };
XFOREACH_COLOR_ERROR(X_DECL_COLOR_ERROR)
#undef X_DECL_COLOR_ERROR
