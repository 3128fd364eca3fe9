#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "macros.h"
#include "tc_source_location.h"

#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

#include <QDebug>

namespace tc {

// Collects text with operator<< and hands it to QDebug, one line at a time,
// when the temporary goes out of scope.
struct NODISCARD AbstractDebugOStream
{
private:
    QDebug m_debug;
    std::ostringstream m_os;

protected:
    NODISCARD static QMessageLogger getMessageLogger(const source_location loc)
    {
        return QMessageLogger{loc.file_name(), static_cast<int>(loc.line()), loc.function_name()};
    }

public:
    explicit AbstractDebugOStream(QDebug &&os);
    ~AbstractDebugOStream();

public:
    template<typename T>
    AbstractDebugOStream &operator<<(const T &x)
    {
        m_os << x;
        return *this;
    }

    AbstractDebugOStream &operator<<(const char *s);
    AbstractDebugOStream &operator<<(std::string_view s);
    AbstractDebugOStream &operator<<(const std::string &s);
    AbstractDebugOStream &operator<<(const QString &s);
};

struct NODISCARD DebugOstream final : public AbstractDebugOStream
{
public:
    explicit DebugOstream(source_location loc)
        : AbstractDebugOStream(getMessageLogger(loc).debug())
    {}
    ~DebugOstream();
};

struct NODISCARD InfoOstream final : public AbstractDebugOStream
{
public:
    explicit InfoOstream(source_location loc)
        : AbstractDebugOStream(getMessageLogger(loc).info())
    {}
    ~InfoOstream();
};

struct NODISCARD WarningOstream final : public AbstractDebugOStream
{
public:
    explicit WarningOstream(source_location loc)
        : AbstractDebugOStream(getMessageLogger(loc).warning())
    {}
    ~WarningOstream();
};

} // namespace tc

#define TCLOG_DEBUG() (tc::DebugOstream{TC_SOURCE_LOCATION()})
#define TCLOG_INFO() (tc::InfoOstream{TC_SOURCE_LOCATION()})
#define TCLOG_WARNING() (tc::WarningOstream{TC_SOURCE_LOCATION()})
#define TCLOG_ERROR() TCLOG_WARNING()
#define TCLOG() TCLOG_INFO()
