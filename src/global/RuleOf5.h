#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#define DEFAULT_CTORS(T) \
    T(T &&) = default; \
    T(const T &) = default

#define DEFAULT_ASSIGN_OPS(T) \
    T &operator=(T &&) = default; \
    T &operator=(const T &) = default

#define DEFAULT_CTORS_AND_ASSIGN_OPS(T) \
    DEFAULT_CTORS(T); \
    DEFAULT_ASSIGN_OPS(T)

#define DELETE_CTORS(T) \
    T(T &&) = delete; \
    T(const T &) = delete

#define DELETE_ASSIGN_OPS(T) \
    T &operator=(T &&) = delete; \
    T &operator=(const T &) = delete

#define DELETE_CTORS_AND_ASSIGN_OPS(T) \
    DELETE_CTORS(T); \
    DELETE_ASSIGN_OPS(T)

#define DEFAULT_RULE_OF_5(T) \
    DEFAULT_CTORS_AND_ASSIGN_OPS(T); \
    ~T() = default
