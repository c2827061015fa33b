/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "OutputRouter.h"

#include "backend/SessionBackend.h"

#include <QLoggingCategory>

#include <utility>

Q_LOGGING_CATEGORY(SynkRouter, "synk.workspace.router", QtInfoMsg)

namespace Synk
{

OutputRouter::OutputRouter(SessionBackend *backend, QObject *parent)
    : QObject(parent)
{
    connect(backend, &SessionBackend::outputReceived, this, &OutputRouter::route);
    connect(backend, &SessionBackend::sessionExited, this, &OutputRouter::onSessionExited);
}

void OutputRouter::registerHandler(SessionId sessionId, OutputHandler handler)
{
    if (!handler) {
        unregisterHandler(sessionId);
        return;
    }
    _handlers.insert(sessionId, std::move(handler));
}

void OutputRouter::unregisterHandler(SessionId sessionId)
{
    _handlers.remove(sessionId);
}

bool OutputRouter::hasHandler(SessionId sessionId) const
{
    return _handlers.contains(sessionId);
}

int OutputRouter::handlerCount() const
{
    return _handlers.size();
}

void OutputRouter::route(SessionId sessionId, const QByteArray &data)
{
    auto it = _handlers.constFind(sessionId);
    if (it == _handlers.constEnd()) {
        qCDebug(SynkRouter) << "dropping" << data.size() << "bytes for unregistered session" << sessionId;
        return;
    }

    // A handler may unregister or replace itself while running
    const OutputHandler handler = it.value();
    handler(data);
}

QByteArray OutputRouter::exitMarker(int exitCode)
{
    return "\r\n[session exited: " + QByteArray::number(exitCode) + "]\r\n";
}

void OutputRouter::onSessionExited(SessionId sessionId, int exitCode)
{
    qCInfo(SynkRouter) << "session" << sessionId << "exited with code" << exitCode;
    route(sessionId, exitMarker(exitCode));
    Q_EMIT sessionExited(sessionId, exitCode);
}

} // namespace Synk

#include "moc_OutputRouter.cpp"
