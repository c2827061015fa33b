/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "FakeSessionBackend.h"

namespace Synk
{

FakeSessionBackend::FakeSessionBackend(QObject *parent)
    : SessionBackend(parent)
{
}

void FakeSessionBackend::create(AgentType agentType, const QString &workingDir, CreateCallback callback)
{
    createRequests.append({agentType, workingDir, callback});
}

void FakeSessionBackend::destroy(SessionId sessionId, AckCallback callback)
{
    if (onDestroy) {
        onDestroy(sessionId);
    }
    destroyedSessions.append(sessionId);
    destroyRequests.append({sessionId, callback});
}

void FakeSessionBackend::write(SessionId sessionId, const QByteArray &data)
{
    writes.append(qMakePair(sessionId, data));
}

void FakeSessionBackend::resize(SessionId sessionId, int columns, int rows)
{
    resizes.append({sessionId, columns, rows});
}

void FakeSessionBackend::fetchScrollback(SessionId sessionId, ScrollbackCallback callback)
{
    scrollbackRequests.append({sessionId, callback});
}

void FakeSessionBackend::list(ListCallback callback)
{
    listRequests.append(callback);
}

bool FakeSessionBackend::completeCreate(SessionId sessionId, int paneIndex)
{
    if (createRequests.isEmpty()) {
        return false;
    }
    const CreateRequest request = createRequests.takeFirst();
    SessionInfo info = session(sessionId, paneIndex, request.agentType);
    info.workingDir = request.workingDir;
    request.callback(true, info, QString());
    return true;
}

bool FakeSessionBackend::failCreate(const QString &error)
{
    if (createRequests.isEmpty()) {
        return false;
    }
    const CreateRequest request = createRequests.takeFirst();
    request.callback(false, SessionInfo(), error);
    return true;
}

bool FakeSessionBackend::completeDestroy(SessionId sessionId, bool success)
{
    for (int i = 0; i < destroyRequests.size(); ++i) {
        if (destroyRequests[i].sessionId == sessionId) {
            const DestroyRequest request = destroyRequests.takeAt(i);
            request.callback(success, success ? QString() : QStringLiteral("destroy failed"));
            return true;
        }
    }
    return false;
}

bool FakeSessionBackend::completeScrollback(SessionId sessionId, const QByteArray &data, bool success)
{
    for (int i = 0; i < scrollbackRequests.size(); ++i) {
        if (scrollbackRequests[i].sessionId == sessionId) {
            const ScrollbackRequest request = scrollbackRequests.takeAt(i);
            request.callback(success, success ? data : QByteArray(), success ? QString() : QStringLiteral("fetch failed"));
            return true;
        }
    }
    return false;
}

bool FakeSessionBackend::completeList(const QList<SessionInfo> &sessions, bool success)
{
    if (listRequests.isEmpty()) {
        return false;
    }
    const ListCallback callback = listRequests.takeFirst();
    callback(success, success ? sessions : QList<SessionInfo>(), success ? QString() : QStringLiteral("list failed"));
    return true;
}

void FakeSessionBackend::emitOutput(SessionId sessionId, const QByteArray &data)
{
    Q_EMIT outputReceived(sessionId, data);
}

void FakeSessionBackend::emitExit(SessionId sessionId, int exitCode)
{
    Q_EMIT sessionExited(sessionId, exitCode);
}

QByteArray FakeSessionBackend::writtenTo(SessionId sessionId) const
{
    QByteArray result;
    for (const auto &write : writes) {
        if (write.first == sessionId) {
            result += write.second;
        }
    }
    return result;
}

SessionInfo FakeSessionBackend::session(SessionId sessionId, int paneIndex, AgentType agentType)
{
    SessionInfo info;
    info.sessionId = sessionId;
    info.paneIndex = paneIndex;
    info.agentType = agentType;
    return info;
}

} // namespace Synk

#include "moc_FakeSessionBackend.cpp"
