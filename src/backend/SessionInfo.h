/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONINFO_H
#define SESSIONINFO_H

#include <QList>
#include <QString>

#include "synkprivate_export.h"

namespace Synk
{

using SessionId = int;

// Sentinel for "no session", in the same way pane lookups return -1
constexpr SessionId NoSession = -1;

enum class AgentType { ClaudeCode, GeminiCli, Codex, Terminal };

struct SessionInfo {
    SessionId sessionId = NoSession;
    int paneIndex = 0;
    AgentType agentType = AgentType::Terminal;
    QString branch; // display only
    QString workingDir; // display only
};

/** Wire name used by the backend, e.g. "claude_code". */
SYNKPRIVATE_EXPORT QString agentTypeName(AgentType type);

/** Parses a wire name; anything unknown is treated as a plain terminal. */
SYNKPRIVATE_EXPORT AgentType agentTypeFromName(const QString &name);

/** Short badge label shown in the pane header. */
SYNKPRIVATE_EXPORT QString agentTypeLabel(AgentType type);

SYNKPRIVATE_EXPORT QList<AgentType> allAgentTypes();

} // namespace Synk

#endif // SESSIONINFO_H
