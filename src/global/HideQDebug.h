#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "RuleOf5.h"
#include "macros.h"

namespace tcqt {

struct NODISCARD HideQDebugOptions final
{
    bool hideDebug = true;
    bool hideInfo = true;
    bool hideWarning = false;
};

// Suppresses the selected Qt message types for the lifetime of the object.
// Guards nest: a message is hidden if any live guard hides its type.
//
// {
//    HideQDebug forThisScope;
//    qInfo() << "hidden";
//    qWarning() << "shown";
// }
class NODISCARD HideQDebug final
{
private:
    const HideQDebugOptions m_options;

public:
    explicit HideQDebug(HideQDebugOptions options = {});
    ~HideQDebug();
    DELETE_CTORS_AND_ASSIGN_OPS(HideQDebug);
};

} // namespace tcqt
