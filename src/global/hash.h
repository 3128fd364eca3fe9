#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "macros.h"

#include <cstddef>
#include <cstring>
#include <string_view>
#include <type_traits>

template<typename T>
NODISCARD static auto numeric_hash(const T val) noexcept
    -> std::enable_if_t<std::is_arithmetic_v<T>, size_t>
{
    static constexpr const size_t size = sizeof(val);
    char buf[size];
    std::memcpy(buf, &val, size);
    return std::hash<std::string_view>()({buf, size});
}

// boost-style mixing step for composite keys
NODISCARD static inline size_t hash_combine(const size_t seed, const size_t h) noexcept
{
    return seed ^ (h + 0x9e3779b9u + (seed << 6u) + (seed >> 2u));
}
