// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "NullPointerException.h"

NullPointerException::~NullPointerException() = default;
