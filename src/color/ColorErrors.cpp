// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "ColorErrors.h"

ColorError::~ColorError() = default;

#define X_DEFINE_DTOR(_Name) _Name::~_Name() = default;
XFOREACH_COLOR_ERROR(X_DEFINE_DTOR)
#undef X_DEFINE_DTOR
