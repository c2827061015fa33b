/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionInfo.h"

#include <iterator>

namespace Synk
{

namespace
{

struct AgentTypeEntry {
    AgentType type;
    const char *name;
    const char *label;
};

const AgentTypeEntry agentTypeTable[] = {
    {AgentType::ClaudeCode, "claude_code", "Claude"},
    {AgentType::GeminiCli, "gemini_cli", "Gemini"},
    {AgentType::Codex, "codex", "Codex"},
    {AgentType::Terminal, "terminal", "Terminal"},
};

const AgentTypeEntry &entryFor(AgentType type)
{
    for (const AgentTypeEntry &entry : agentTypeTable) {
        if (entry.type == type) {
            return entry;
        }
    }
    // Terminal is always the last row
    return agentTypeTable[std::size(agentTypeTable) - 1];
}

} // namespace

QString agentTypeName(AgentType type)
{
    return QLatin1String(entryFor(type).name);
}

AgentType agentTypeFromName(const QString &name)
{
    for (const AgentTypeEntry &entry : agentTypeTable) {
        if (name == QLatin1String(entry.name)) {
            return entry.type;
        }
    }
    return AgentType::Terminal;
}

QString agentTypeLabel(AgentType type)
{
    return QLatin1String(entryFor(type).label);
}

QList<AgentType> allAgentTypes()
{
    QList<AgentType> types;
    for (const AgentTypeEntry &entry : agentTypeTable) {
        types.append(entry.type);
    }
    return types;
}

} // namespace Synk
