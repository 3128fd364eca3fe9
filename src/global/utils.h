#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "NullPointerException.h"
#include "macros.h"

#include <memory>
#include <optional>

template<typename T>
NODISCARD constexpr bool isClamped(T x, T lo, T hi)
{
    return x >= lo && x <= hi;
}

namespace utils {
NODISCARD extern int round_dtoi(double d);
NODISCARD extern int clampToByte(double d);
} // namespace utils

template<typename T>
inline T &deref(T *const ptr)
{
    if (ptr == nullptr)
        throw NullPointerException();
    return *ptr;
}

template<typename T>
inline const T &deref(const std::optional<T> &opt)
{
    // note: this can throw bad_optional_access
    return opt.value();
}

template<typename T>
inline T deref(std::shared_ptr<T> &&ptr) = delete;
template<typename T>
inline T &deref(const std::shared_ptr<T> &ptr)
{
    if (ptr == nullptr)
        throw NullPointerException();
    return *ptr;
}
