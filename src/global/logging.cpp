// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "logging.h"

#include "Consts.h"

#include <utility>

namespace tc {

AbstractDebugOStream::AbstractDebugOStream(QDebug &&os)
    : m_debug(os)
{}

AbstractDebugOStream::~AbstractDebugOStream()
{
    const std::string str = std::move(m_os).str();
    if (str.empty()) {
        return;
    }

    auto &debug = m_debug;
    debug.noquote();
    debug.nospace();

    // Qt appends its own newline, so only separate lines.
    std::string_view rest = str;
    bool needsNewline = false;
    while (!rest.empty()) {
        const auto pos = rest.find(char_consts::C_NEWLINE);
        std::string_view line = rest.substr(0, pos);
        rest = (pos == std::string_view::npos) ? std::string_view{} : rest.substr(pos + 1);

        if (!line.empty() && line.back() == char_consts::C_CARRIAGE_RETURN) {
            line.remove_suffix(1);
        }
        if (needsNewline) {
            debug << char_consts::C_NEWLINE;
        }
        if (!line.empty()) {
            debug << QString::fromUtf8(line.data(), static_cast<int>(line.size()));
        }
        needsNewline = true;
    }
}

AbstractDebugOStream &AbstractDebugOStream::operator<<(const char *const s)
{
    if (s != nullptr) {
        m_os << s;
    }
    return *this;
}

AbstractDebugOStream &AbstractDebugOStream::operator<<(const std::string_view s)
{
    m_os << s;
    return *this;
}

AbstractDebugOStream &AbstractDebugOStream::operator<<(const std::string &s)
{
    m_os << s;
    return *this;
}

AbstractDebugOStream &AbstractDebugOStream::operator<<(const QString &s)
{
    m_os << s.toStdString();
    return *this;
}

DebugOstream::~DebugOstream() = default;
InfoOstream::~InfoOstream() = default;
WarningOstream::~WarningOstream() = default;

} // namespace tc
