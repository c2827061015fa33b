/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef INPUTMODEMACHINE_H
#define INPUTMODEMACHINE_H

#include <QByteArray>
#include <QList>
#include <QObject>
#include <QTimer>

#include "GridLayout.h"
#include "backend/SessionInfo.h"
#include "synkprivate_export.h"

class QKeyEvent;

namespace Synk
{

enum class InputMode { Navigation, Terminal };

enum class TerminalExitMethod { DoubleEscape, CtrlBackslash, CtrlShiftEscape };

/**
 * Snapshot of the workspace focus. activeSessionId is set exactly when
 * mode is Terminal; selectedSessionId is NoSession only while there are
 * no sessions.
 */
struct FocusState {
    InputMode mode = InputMode::Navigation;
    SessionId selectedSessionId = NoSession;
    SessionId activeSessionId = NoSession;

    bool operator==(const FocusState &other) const
    {
        return mode == other.mode && selectedSessionId == other.selectedSessionId && activeSessionId == other.activeSessionId;
    }
    bool operator!=(const FocusState &other) const
    {
        return !(*this == other);
    }
};

/**
 * Navigation/Terminal mode switching, pane selection and keyboard routing.
 *
 * Keys typed in Terminal mode come out of writeRequested() as the bytes a
 * terminal would send. With the double-escape exit method a lone Escape is
 * held back for the escape timeout: a second Escape inside the window leaves
 * Terminal mode without writing anything, while the timeout or any other key
 * releases the held Escape to the session first.
 */
class SYNKPRIVATE_EXPORT InputModeMachine : public QObject
{
    Q_OBJECT
public:
    static constexpr int DefaultEscapeTimeoutMs = 300;

    explicit InputModeMachine(QObject *parent = nullptr);

    void setExitMethod(TerminalExitMethod method);
    TerminalExitMethod exitMethod() const
    {
        return _exitMethod;
    }
    void setEscapeTimeout(int msec);
    int escapeTimeout() const;

    /** Replaces the ordered session list and repairs selection and focus. */
    void setSessions(const QList<SessionId> &sessions);
    const QList<SessionId> &sessions() const
    {
        return _sessions;
    }

    const FocusState &state() const
    {
        return _state;
    }
    InputMode mode() const
    {
        return _state.mode;
    }
    SessionId selectedSessionId() const
    {
        return _state.selectedSessionId;
    }
    SessionId activeSessionId() const
    {
        return _state.activeSessionId;
    }
    bool isEscapePending() const
    {
        return _escapePending;
    }

    // Navigation mode only
    bool selectDirection(Direction direction);
    bool selectIndex(int index);

    // Selects a pane in any mode; in Terminal mode focus follows it
    bool selectSession(SessionId sessionId);

    bool activate();
    bool activateSession(SessionId sessionId);

    void exitToNavigation();
    bool exitToNavigation(SessionId selectSessionId);

    /** Returns true when the key was consumed by the workspace. */
    bool handleKeyPress(const QKeyEvent *event);

    static QByteArray encodeKey(const QKeyEvent *event);
    static int keyToSessionIndex(int key);

Q_SIGNALS:
    void writeRequested(Synk::SessionId sessionId, const QByteArray &data);
    void focusChanged();

private:
    bool handleNavigationKey(const QKeyEvent *event);
    bool handleTerminalKey(const QKeyEvent *event);
    bool isExitGesture(const QKeyEvent *event) const;
    void flushPendingEscape();
    void dropPendingEscape();
    void onEscapeTimeout();
    void applyState(const FocusState &state);
    int indexOf(SessionId sessionId) const;

    QList<SessionId> _sessions;
    FocusState _state;
    TerminalExitMethod _exitMethod = TerminalExitMethod::DoubleEscape;
    QTimer _escapeTimer;
    bool _escapePending = false;
};

} // namespace Synk

#endif // INPUTMODEMACHINE_H
