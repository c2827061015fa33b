/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef WORKSPACESETTINGS_H
#define WORKSPACESETTINGS_H

#include <QString>
#include <QStringList>

#include <optional>

#include "InputModeMachine.h"
#include "ScrollbackReconciler.h"
#include "backend/SessionInfo.h"
#include "synkprivate_export.h"

class QSettings;

namespace Synk
{

struct SYNKPRIVATE_EXPORT WorkspaceSettings {
    TerminalExitMethod terminalExitMethod = TerminalExitMethod::DoubleEscape;
    int doubleEscapeTimeoutMs = InputModeMachine::DefaultEscapeTimeoutMs;
    int resizeDebounceMs = 80;
    int maxActiveSessions = 12;
    ScrollbackPolicy scrollbackPolicy = ScrollbackPolicy::QueueDuringFetch;
    QString backendProgram;
    QStringList backendArguments;
    AgentType defaultAgent = AgentType::Terminal;
    QString defaultWorkingDir;

    /** Missing or invalid keys keep their defaults; numbers are clamped. */
    static WorkspaceSettings load(const QSettings &settings);
    void save(QSettings &settings) const;

    static QString exitMethodName(TerminalExitMethod method);
    static std::optional<TerminalExitMethod> exitMethodFromName(const QString &name);
    static QString scrollbackPolicyName(ScrollbackPolicy policy);
    static std::optional<ScrollbackPolicy> scrollbackPolicyFromName(const QString &name);
};

} // namespace Synk

#endif // WORKSPACESETTINGS_H
