/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "WorkspaceController.h"

#include "OutputRouter.h"
#include "ScrollbackReconciler.h"
#include "backend/SessionBackend.h"
#include "terminal/TerminalBuffer.h"
#include "terminal/TerminalBufferAdapter.h"

#include <QLoggingCategory>
#include <QPointer>

#include <algorithm>
#include <utility>

Q_LOGGING_CATEGORY(SynkController, "synk.workspace.controller", QtInfoMsg)

namespace Synk
{

namespace
{
bool sameSessions(const QList<SessionInfo> &a, const QList<SessionInfo> &b)
{
    if (a.size() != b.size()) {
        return false;
    }
    for (int i = 0; i < a.size(); ++i) {
        if (a[i].sessionId != b[i].sessionId || a[i].paneIndex != b[i].paneIndex || a[i].agentType != b[i].agentType || a[i].branch != b[i].branch
            || a[i].workingDir != b[i].workingDir) {
            return false;
        }
    }
    return true;
}
}

WorkspaceController::WorkspaceController(SessionBackend *backend, const WorkspaceSettings &settings, QObject *parent)
    : QObject(parent)
    , _backend(backend)
    , _settings(settings)
    , _router(new OutputRouter(backend, this))
    , _reconciler(new ScrollbackReconciler(backend, _router, this))
    , _input(new InputModeMachine(this))
{
    _reconciler->setPolicy(_settings.scrollbackPolicy);
    _input->setExitMethod(_settings.terminalExitMethod);
    _input->setEscapeTimeout(_settings.doubleEscapeTimeoutMs);

    connect(_router, &OutputRouter::sessionExited, this, &WorkspaceController::onSessionExited);
    connect(_input, &InputModeMachine::writeRequested, this, &WorkspaceController::onWriteRequested);
    connect(_input, &InputModeMachine::focusChanged, this, &WorkspaceController::focusChanged);
    connect(_backend, &SessionBackend::sessionsChanged, this, &WorkspaceController::refreshSessions);
    connect(_backend, &SessionBackend::disconnected, this, &WorkspaceController::onBackendDisconnected);
}

WorkspaceController::~WorkspaceController()
{
    for (auto it = _adapters.constBegin(); it != _adapters.constEnd(); ++it) {
        _router->unregisterHandler(it.key());
        _reconciler->cancel(it.key());
        it.value()->dispose();
    }
}

void WorkspaceController::setBufferFactory(BufferFactory factory)
{
    _bufferFactory = std::move(factory);
}

void WorkspaceController::initialize()
{
    refreshSessions();
}

QList<SessionId> WorkspaceController::sessionIds() const
{
    QList<SessionId> ids;
    ids.reserve(_sessions.size());
    for (const SessionInfo &session : _sessions) {
        ids.append(session.sessionId);
    }
    return ids;
}

bool WorkspaceController::hasSession(SessionId sessionId) const
{
    return indexOfSession(sessionId) >= 0;
}

int WorkspaceController::indexOfSession(SessionId sessionId) const
{
    for (int i = 0; i < _sessions.size(); ++i) {
        if (_sessions[i].sessionId == sessionId) {
            return i;
        }
    }
    return -1;
}

bool WorkspaceController::isDestroyPending(SessionId sessionId) const
{
    return _pendingDestroy.contains(sessionId);
}

GridGeometry WorkspaceController::gridGeometry() const
{
    return GridLayout::forCount(_sessions.size());
}

TerminalBufferAdapter *WorkspaceController::adapterForSession(SessionId sessionId) const
{
    return _adapters.value(sessionId, nullptr);
}

bool WorkspaceController::createSession(AgentType agentType, const QString &workingDir)
{
    if (_sessions.size() + _pendingCreates >= _settings.maxActiveSessions) {
        raiseNotice(tr("Maximum of %1 sessions reached").arg(_settings.maxActiveSessions));
        return false;
    }

    ++_pendingCreates;
    qCInfo(SynkController) << "creating" << agentTypeName(agentType) << "session in" << workingDir;
    QPointer<WorkspaceController> guard(this);
    _backend->create(agentType, workingDir, [guard](bool success, const SessionInfo &session, const QString &error) {
        if (guard) {
            guard->handleCreateResponse(success, session, error);
        }
    });
    return true;
}

void WorkspaceController::handleCreateResponse(bool success, const SessionInfo &session, const QString &error)
{
    --_pendingCreates;
    if (!success) {
        raiseNotice(tr("Could not create session: %1").arg(error));
        return;
    }
    if (hasSession(session.sessionId) || _retiredSessions.contains(session.sessionId)) {
        // A refresh got there first, or the session already exited
        return;
    }

    addSession(session);
    renumberSessions();
    syncFocus();
    Q_EMIT sessionsChanged();
}

bool WorkspaceController::destroySession(SessionId sessionId)
{
    if (!hasSession(sessionId) || _pendingDestroy.contains(sessionId)) {
        return false;
    }

    qCInfo(SynkController) << "destroying session" << sessionId;
    _pendingDestroy.insert(sessionId);
    teardownSession(sessionId);
    renumberSessions();
    syncFocus();
    Q_EMIT sessionRemoved(sessionId);
    Q_EMIT sessionsChanged();

    // Only now that nothing local can receive its output
    QPointer<WorkspaceController> guard(this);
    _backend->destroy(sessionId, [guard, sessionId](bool success, const QString &error) {
        if (guard) {
            guard->handleDestroyResponse(sessionId, success, error);
        }
    });
    return true;
}

void WorkspaceController::handleDestroyResponse(SessionId sessionId, bool success, const QString &error)
{
    _pendingDestroy.remove(sessionId);
    if (success) {
        // The backend has let go of the id; no later reply can mention it
        _retiredSessions.remove(sessionId);
        return;
    }
    raiseNotice(tr("Could not close session %1: %2").arg(sessionId).arg(error));
    // The backend may still be running it; let the next listing decide
    _retiredSessions.remove(sessionId);
    refreshSessions();
}

void WorkspaceController::refreshSessions()
{
    const QList<SessionId> ids = sessionIds();
    const QSet<SessionId> known(ids.cbegin(), ids.cend());
    QPointer<WorkspaceController> guard(this);
    _backend->list([guard, known](bool success, const QList<SessionInfo> &listed, const QString &error) {
        if (guard) {
            guard->handleListResponse(known, success, listed, error);
        }
    });
}

void WorkspaceController::handleListResponse(const QSet<SessionId> &knownAtRequest, bool success, const QList<SessionInfo> &listed, const QString &error)
{
    if (!success) {
        raiseNotice(tr("Could not list sessions: %1").arg(error));
        return;
    }

    QSet<SessionId> reportedIds;
    for (const SessionInfo &session : listed) {
        reportedIds.insert(session.sessionId);
    }
    // Ids the backend no longer reports can never come back
    _retiredSessions.removeIf([&reportedIds](SessionId sessionId) {
        return !reportedIds.contains(sessionId);
    });

    QList<SessionInfo> current;
    for (const SessionInfo &session : listed) {
        if (!_pendingDestroy.contains(session.sessionId) && !_retiredSessions.contains(session.sessionId)) {
            current.append(session);
        }
    }
    std::stable_sort(current.begin(), current.end(), [](const SessionInfo &a, const SessionInfo &b) {
        return a.paneIndex < b.paneIndex;
    });

    QSet<SessionId> listedIds;
    for (const SessionInfo &session : std::as_const(current)) {
        listedIds.insert(session.sessionId);
    }

    const QList<SessionInfo> before = _sessions;

    // Sessions created after the request was sent are legitimately missing
    // from the reply
    QList<SessionId> removed;
    for (SessionId sessionId : knownAtRequest) {
        if (hasSession(sessionId) && !listedIds.contains(sessionId)) {
            qCInfo(SynkController) << "session" << sessionId << "no longer exists";
            teardownSession(sessionId);
            removed.append(sessionId);
        }
    }

    for (const SessionInfo &session : std::as_const(current)) {
        if (!hasSession(session.sessionId)) {
            addSession(session);
        }
    }

    QList<SessionInfo> ordered;
    ordered.reserve(_sessions.size());
    for (const SessionInfo &session : std::as_const(current)) {
        SessionInfo updated = _sessions.at(indexOfSession(session.sessionId));
        updated.agentType = session.agentType;
        updated.branch = session.branch;
        updated.workingDir = session.workingDir;
        ordered.append(updated);
    }
    for (const SessionInfo &session : std::as_const(_sessions)) {
        if (!listedIds.contains(session.sessionId)) {
            ordered.append(session);
        }
    }
    _sessions = ordered;
    renumberSessions();
    syncFocus();
    for (SessionId sessionId : std::as_const(removed)) {
        Q_EMIT sessionRemoved(sessionId);
    }

    if (!sameSessions(before, _sessions)) {
        Q_EMIT sessionsChanged();
    }
}

void WorkspaceController::addSession(const SessionInfo &session)
{
    const SessionId sessionId = session.sessionId;
    _sessions.append(session);

    TerminalBuffer *buffer = _bufferFactory ? _bufferFactory(session) : nullptr;
    auto *adapter = new TerminalBufferAdapter(sessionId, buffer, _settings.resizeDebounceMs, this);
    connect(adapter, &TerminalBufferAdapter::resizeSettled, this, [this](SessionId id, int columns, int rows) {
        if (hasSession(id) && !_pendingDestroy.contains(id)) {
            _backend->resize(id, columns, rows);
        }
    });
    _adapters.insert(sessionId, adapter);

    qCInfo(SynkController) << "session" << sessionId << "added";
    Q_EMIT sessionAdded(sessionId);

    _reconciler->attach(sessionId, adapter);
    adapter->notifyGeometryChanged();
}

void WorkspaceController::teardownSession(SessionId sessionId)
{
    // Late output must find no handler before the render target goes away
    _router->unregisterHandler(sessionId);
    _reconciler->cancel(sessionId);
    if (TerminalBufferAdapter *adapter = _adapters.take(sessionId)) {
        adapter->dispose();
        adapter->deleteLater();
    }

    const int index = indexOfSession(sessionId);
    if (index >= 0) {
        _sessions.removeAt(index);
    }
    _retiredSessions.insert(sessionId);
}

void WorkspaceController::renumberSessions()
{
    for (int i = 0; i < _sessions.size(); ++i) {
        _sessions[i].paneIndex = i;
    }
}

void WorkspaceController::syncFocus()
{
    _input->setSessions(sessionIds());
}

void WorkspaceController::raiseNotice(const QString &message)
{
    qCWarning(SynkController) << message;
    Q_EMIT noticeRaised(message);
}

void WorkspaceController::onSessionExited(SessionId sessionId, int exitCode)
{
    Q_UNUSED(exitCode)
    if (!hasSession(sessionId)) {
        return;
    }
    teardownSession(sessionId);
    renumberSessions();
    syncFocus();
    Q_EMIT sessionRemoved(sessionId);
    Q_EMIT sessionsChanged();
}

void WorkspaceController::onWriteRequested(SessionId sessionId, const QByteArray &data)
{
    if (!hasSession(sessionId) || _pendingDestroy.contains(sessionId)) {
        return;
    }
    _backend->write(sessionId, data);
}

void WorkspaceController::onBackendDisconnected(const QString &reason)
{
    raiseNotice(tr("Backend disconnected: %1").arg(reason));
}

InputMode WorkspaceController::currentMode() const
{
    return _input->mode();
}

SessionId WorkspaceController::selectedSessionId() const
{
    return _input->selectedSessionId();
}

SessionId WorkspaceController::activeSessionId() const
{
    return _input->activeSessionId();
}

bool WorkspaceController::isEscapePending() const
{
    return _input->isEscapePending();
}

bool WorkspaceController::selectDirection(Direction direction)
{
    return _input->selectDirection(direction);
}

bool WorkspaceController::selectIndex(int index)
{
    return _input->selectIndex(index);
}

bool WorkspaceController::selectSession(SessionId sessionId)
{
    return _input->selectSession(sessionId);
}

bool WorkspaceController::activate()
{
    return _input->activate();
}

bool WorkspaceController::activateSession(SessionId sessionId)
{
    return _input->activateSession(sessionId);
}

void WorkspaceController::exitToNavigation()
{
    _input->exitToNavigation();
}

bool WorkspaceController::exitToNavigation(SessionId selectSessionId)
{
    return _input->exitToNavigation(selectSessionId);
}

bool WorkspaceController::handleKeyPress(const QKeyEvent *event)
{
    return _input->handleKeyPress(event);
}

void WorkspaceController::notifyPaneGeometryChanged(SessionId sessionId)
{
    if (TerminalBufferAdapter *adapter = _adapters.value(sessionId, nullptr)) {
        adapter->notifyGeometryChanged();
    }
}

} // namespace Synk

#include "moc_WorkspaceController.cpp"
