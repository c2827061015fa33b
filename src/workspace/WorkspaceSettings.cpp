/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "WorkspaceSettings.h"

#include "GridLayout.h"

#include <QDir>
#include <QLoggingCategory>
#include <QSettings>

Q_DECLARE_LOGGING_CATEGORY(SynkController)

namespace Synk
{

namespace
{
int readInt(const QSettings &settings, const QString &key, int fallback, int minimum, int maximum)
{
    bool ok = false;
    const int value = settings.value(key, fallback).toInt(&ok);
    if (!ok) {
        qCWarning(SynkController) << "ignoring non-numeric value for" << key;
        return fallback;
    }
    return qBound(minimum, value, maximum);
}
}

WorkspaceSettings WorkspaceSettings::load(const QSettings &settings)
{
    WorkspaceSettings result;

    const QString exitMethod = settings.value(QStringLiteral("keyboard/terminalExitMethod")).toString();
    if (!exitMethod.isEmpty()) {
        if (auto method = exitMethodFromName(exitMethod)) {
            result.terminalExitMethod = *method;
        } else {
            qCWarning(SynkController) << "unknown terminal exit method" << exitMethod;
        }
    }

    result.doubleEscapeTimeoutMs = readInt(settings, QStringLiteral("keyboard/doubleEscapeTimeoutMs"), result.doubleEscapeTimeoutMs, 50, 2000);
    result.resizeDebounceMs = readInt(settings, QStringLiteral("terminal/resizeDebounceMs"), result.resizeDebounceMs, 0, 1000);
    result.maxActiveSessions = readInt(settings, QStringLiteral("performance/maxActiveSessions"), result.maxActiveSessions, 1, GridLayout::MaxPanes);

    const QString policy = settings.value(QStringLiteral("scrollback/policy")).toString();
    if (!policy.isEmpty()) {
        if (auto parsed = scrollbackPolicyFromName(policy)) {
            result.scrollbackPolicy = *parsed;
        } else {
            qCWarning(SynkController) << "unknown scrollback policy" << policy;
        }
    }

    result.backendProgram = settings.value(QStringLiteral("backend/program")).toString();
    result.backendArguments = settings.value(QStringLiteral("backend/arguments")).toStringList();
    result.defaultAgent = agentTypeFromName(settings.value(QStringLiteral("session/defaultAgent"), agentTypeName(result.defaultAgent)).toString());
    result.defaultWorkingDir = settings.value(QStringLiteral("session/defaultWorkingDir"), QDir::homePath()).toString();

    return result;
}

void WorkspaceSettings::save(QSettings &settings) const
{
    settings.setValue(QStringLiteral("keyboard/terminalExitMethod"), exitMethodName(terminalExitMethod));
    settings.setValue(QStringLiteral("keyboard/doubleEscapeTimeoutMs"), doubleEscapeTimeoutMs);
    settings.setValue(QStringLiteral("terminal/resizeDebounceMs"), resizeDebounceMs);
    settings.setValue(QStringLiteral("performance/maxActiveSessions"), maxActiveSessions);
    settings.setValue(QStringLiteral("scrollback/policy"), scrollbackPolicyName(scrollbackPolicy));
    settings.setValue(QStringLiteral("backend/program"), backendProgram);
    settings.setValue(QStringLiteral("backend/arguments"), backendArguments);
    settings.setValue(QStringLiteral("session/defaultAgent"), agentTypeName(defaultAgent));
    settings.setValue(QStringLiteral("session/defaultWorkingDir"), defaultWorkingDir);
}

QString WorkspaceSettings::exitMethodName(TerminalExitMethod method)
{
    switch (method) {
    case TerminalExitMethod::DoubleEscape:
        return QStringLiteral("double_escape");
    case TerminalExitMethod::CtrlBackslash:
        return QStringLiteral("ctrl_backslash");
    case TerminalExitMethod::CtrlShiftEscape:
        return QStringLiteral("ctrl_shift_escape");
    }
    return QString();
}

std::optional<TerminalExitMethod> WorkspaceSettings::exitMethodFromName(const QString &name)
{
    for (auto method : {TerminalExitMethod::DoubleEscape, TerminalExitMethod::CtrlBackslash, TerminalExitMethod::CtrlShiftEscape}) {
        if (exitMethodName(method) == name) {
            return method;
        }
    }
    return std::nullopt;
}

QString WorkspaceSettings::scrollbackPolicyName(ScrollbackPolicy policy)
{
    return policy == ScrollbackPolicy::RegisterAfterFetch ? QStringLiteral("after_fetch") : QStringLiteral("queue");
}

std::optional<ScrollbackPolicy> WorkspaceSettings::scrollbackPolicyFromName(const QString &name)
{
    if (name == QLatin1String("queue")) {
        return ScrollbackPolicy::QueueDuringFetch;
    }
    if (name == QLatin1String("after_fetch")) {
        return ScrollbackPolicy::RegisterAfterFetch;
    }
    return std::nullopt;
}

} // namespace Synk
