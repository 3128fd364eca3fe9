#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#if __cplusplus >= 202000L
#define IMPLICIT explicit(false)
#else
#define IMPLICIT
#endif

#define NODISCARD [[nodiscard]]
#define NORETURN [[noreturn]]

#if defined(__clang__) && !defined(Q_MOC_RUN)
// moc does not understand the attribute on a QObject class.
#define NODISCARD_QOBJECT NODISCARD
#else
#define NODISCARD_QOBJECT
#endif
