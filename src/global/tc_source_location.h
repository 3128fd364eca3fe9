#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "macros.h"

#include <cstdint>

#if __cplusplus >= 202000L && __has_builtin(__builtin_source_location)
#include <source_location>
namespace tc {
using source_location = std::source_location;
}
#define TC_SOURCE_LOCATION() (std::source_location::current())
#else
namespace tc {
struct NODISCARD source_location final
{
    const char *m_file_name = "";
    const char *m_function_name = "";
    std::uint_least32_t m_line = 0;

    NODISCARD const char *file_name() const { return this->m_file_name; }
    NODISCARD const char *function_name() const { return this->m_function_name; }
    NODISCARD std::uint_least32_t line() const { return this->m_line; }
};
} // namespace tc
#define TC_SOURCE_LOCATION() (tc::source_location{__FILE__, __FUNCTION__, __LINE__})
#endif
