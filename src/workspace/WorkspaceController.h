/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef WORKSPACECONTROLLER_H
#define WORKSPACECONTROLLER_H

#include <QHash>
#include <QList>
#include <QObject>
#include <QSet>

#include <functional>

#include "GridLayout.h"
#include "InputModeMachine.h"
#include "WorkspaceSettings.h"
#include "backend/SessionInfo.h"
#include "synkprivate_export.h"

class QKeyEvent;

namespace Synk
{

class OutputRouter;
class ScrollbackReconciler;
class SessionBackend;
class TerminalBuffer;
class TerminalBufferAdapter;

/**
 * Owns the ordered session list of one workspace and everything hanging off
 * it: one buffer adapter per session, the output router, the scrollback
 * reconciler and the input mode machine.
 *
 * Sessions are ordered by the backend's pane index and renumbered densely
 * whenever the list changes. Operations on a session that is gone or being
 * destroyed are ignored and return false.
 */
class SYNKPRIVATE_EXPORT WorkspaceController : public QObject
{
    Q_OBJECT
public:
    // Supplies the render target for a new session; may return nullptr
    using BufferFactory = std::function<TerminalBuffer *(const SessionInfo &session)>;

    WorkspaceController(SessionBackend *backend, const WorkspaceSettings &settings, QObject *parent = nullptr);
    ~WorkspaceController() override;

    void setBufferFactory(BufferFactory factory);
    const WorkspaceSettings &settings() const
    {
        return _settings;
    }

    /** Picks up whatever sessions the backend already runs. */
    void initialize();

    bool createSession(AgentType agentType, const QString &workingDir);
    bool destroySession(SessionId sessionId);
    void refreshSessions();

    const QList<SessionInfo> &sessions() const
    {
        return _sessions;
    }
    QList<SessionId> sessionIds() const;
    bool hasSession(SessionId sessionId) const;
    int indexOfSession(SessionId sessionId) const;
    bool isDestroyPending(SessionId sessionId) const;
    /** Ids torn down locally that the backend has not yet confirmed gone. */
    bool isRetired(SessionId sessionId) const
    {
        return _retiredSessions.contains(sessionId);
    }
    int pendingCreateCount() const
    {
        return _pendingCreates;
    }
    GridGeometry gridGeometry() const;
    TerminalBufferAdapter *adapterForSession(SessionId sessionId) const;

    const FocusState &focusState() const
    {
        return _input->state();
    }
    InputMode currentMode() const;
    SessionId selectedSessionId() const;
    SessionId activeSessionId() const;
    bool isEscapePending() const;

    bool selectDirection(Direction direction);
    bool selectIndex(int index);
    bool selectSession(SessionId sessionId);
    bool activate();
    bool activateSession(SessionId sessionId);
    void exitToNavigation();
    bool exitToNavigation(SessionId selectSessionId);
    bool handleKeyPress(const QKeyEvent *event);

    // The pane showing sessionId changed size
    void notifyPaneGeometryChanged(SessionId sessionId);

    OutputRouter *router() const
    {
        return _router;
    }
    ScrollbackReconciler *reconciler() const
    {
        return _reconciler;
    }

Q_SIGNALS:
    void sessionsChanged();
    void sessionAdded(Synk::SessionId sessionId);
    void sessionRemoved(Synk::SessionId sessionId);
    void focusChanged();
    void noticeRaised(const QString &message);

private Q_SLOTS:
    void onSessionExited(Synk::SessionId sessionId, int exitCode);
    void onWriteRequested(Synk::SessionId sessionId, const QByteArray &data);
    void onBackendDisconnected(const QString &reason);

private:
    void handleCreateResponse(bool success, const SessionInfo &session, const QString &error);
    void handleDestroyResponse(SessionId sessionId, bool success, const QString &error);
    void handleListResponse(const QSet<SessionId> &knownAtRequest, bool success, const QList<SessionInfo> &listed, const QString &error);
    void addSession(const SessionInfo &session);
    void teardownSession(SessionId sessionId);
    void renumberSessions();
    void syncFocus();
    void raiseNotice(const QString &message);

    SessionBackend *_backend;
    WorkspaceSettings _settings;
    OutputRouter *_router; // owned (Qt parent = this)
    ScrollbackReconciler *_reconciler; // owned (Qt parent = this)
    InputModeMachine *_input; // owned (Qt parent = this)
    BufferFactory _bufferFactory;

    QList<SessionInfo> _sessions;
    QHash<SessionId, TerminalBufferAdapter *> _adapters;
    QSet<SessionId> _pendingDestroy;
    // Sessions removed locally; ids are never reused, so a stale list reply
    // must not bring them back
    QSet<SessionId> _retiredSessions;
    int _pendingCreates = 0;
};

} // namespace Synk

#endif // WORKSPACECONTROLLER_H
