// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "HideQDebug.h"

#include <algorithm>
#include <cstdio>
#include <mutex>
#include <vector>

#include <QDebug>

namespace tcqt {

namespace { // anonymous

std::mutex g_mutex;
std::vector<const HideQDebugOptions *> g_guards;
QtMessageHandler g_next_handler = nullptr;

NODISCARD bool isHidden_locked(const QtMsgType type)
{
    return std::any_of(g_guards.begin(), g_guards.end(), [type](const HideQDebugOptions *opts) {
        switch (type) {
        case QtDebugMsg:
            return opts->hideDebug;
        case QtInfoMsg:
            return opts->hideInfo;
        case QtWarningMsg:
            return opts->hideWarning;
        case QtCriticalMsg:
        case QtFatalMsg:
            break;
        }
        return false;
    });
}

void messageOutput(const QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    QtMessageHandler next = nullptr;
    {
        std::lock_guard<std::mutex> lock{g_mutex};
        if (isHidden_locked(type)) {
            return;
        }
        next = g_next_handler;
    }

    if (next != nullptr) {
        next(type, context, msg);
    } else {
        const QString formatted = qFormatLogMessage(type, context, msg);
        std::fprintf(stderr, "%s\n", formatted.toLocal8Bit().constData());
        std::fflush(stderr);
    }
}

} // namespace

HideQDebug::HideQDebug(const HideQDebugOptions options)
    : m_options{options}
{
    std::lock_guard<std::mutex> lock{g_mutex};
    if (g_guards.empty()) {
        g_next_handler = qInstallMessageHandler(&messageOutput);
    }
    g_guards.push_back(&m_options);
}

HideQDebug::~HideQDebug()
{
    std::lock_guard<std::mutex> lock{g_mutex};
    g_guards.erase(std::remove(g_guards.begin(), g_guards.end(), &m_options), g_guards.end());
    if (g_guards.empty()) {
        qInstallMessageHandler(g_next_handler);
        g_next_handler = nullptr;
    }
}

} // namespace tcqt
