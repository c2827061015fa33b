/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "InputModeMachine.h"

#include <QKeyEvent>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(SynkInput, "synk.workspace.input", QtInfoMsg)

namespace Synk
{

namespace
{
const char EscapeByte = '\x1b';

bool isModifierKey(int key)
{
    switch (key) {
    case Qt::Key_Shift:
    case Qt::Key_Control:
    case Qt::Key_Meta:
    case Qt::Key_Alt:
    case Qt::Key_AltGr:
    case Qt::Key_CapsLock:
    case Qt::Key_NumLock:
    case Qt::Key_ScrollLock:
    case Qt::Key_Super_L:
    case Qt::Key_Super_R:
    case Qt::Key_Hyper_L:
    case Qt::Key_Hyper_R:
        return true;
    default:
        return false;
    }
}

Qt::KeyboardModifiers relevantModifiers(const QKeyEvent *event)
{
    return event->modifiers() & (Qt::ShiftModifier | Qt::ControlModifier | Qt::AltModifier | Qt::MetaModifier);
}

QByteArray specialKeySequence(int key, Qt::KeyboardModifiers modifiers)
{
    switch (key) {
    case Qt::Key_Return:
    case Qt::Key_Enter:
        return QByteArray("\r");
    case Qt::Key_Backspace:
        return QByteArray("\x7f");
    case Qt::Key_Tab:
        return (modifiers & Qt::ShiftModifier) ? QByteArray("\x1b[Z") : QByteArray("\t");
    case Qt::Key_Backtab:
        return QByteArray("\x1b[Z");
    case Qt::Key_Escape:
        return QByteArray(1, EscapeByte);
    case Qt::Key_Up:
        return QByteArray("\x1b[A");
    case Qt::Key_Down:
        return QByteArray("\x1b[B");
    case Qt::Key_Right:
        return QByteArray("\x1b[C");
    case Qt::Key_Left:
        return QByteArray("\x1b[D");
    case Qt::Key_Home:
        return QByteArray("\x1b[H");
    case Qt::Key_End:
        return QByteArray("\x1b[F");
    case Qt::Key_Insert:
        return QByteArray("\x1b[2~");
    case Qt::Key_Delete:
        return QByteArray("\x1b[3~");
    case Qt::Key_PageUp:
        return QByteArray("\x1b[5~");
    case Qt::Key_PageDown:
        return QByteArray("\x1b[6~");
    case Qt::Key_F1:
        return QByteArray("\x1bOP");
    case Qt::Key_F2:
        return QByteArray("\x1bOQ");
    case Qt::Key_F3:
        return QByteArray("\x1bOR");
    case Qt::Key_F4:
        return QByteArray("\x1bOS");
    case Qt::Key_F5:
        return QByteArray("\x1b[15~");
    case Qt::Key_F6:
        return QByteArray("\x1b[17~");
    case Qt::Key_F7:
        return QByteArray("\x1b[18~");
    case Qt::Key_F8:
        return QByteArray("\x1b[19~");
    case Qt::Key_F9:
        return QByteArray("\x1b[20~");
    case Qt::Key_F10:
        return QByteArray("\x1b[21~");
    case Qt::Key_F11:
        return QByteArray("\x1b[23~");
    case Qt::Key_F12:
        return QByteArray("\x1b[24~");
    default:
        return QByteArray();
    }
}

QByteArray controlKeySequence(int key)
{
    if (key >= Qt::Key_A && key <= Qt::Key_Z) {
        return QByteArray(1, static_cast<char>(key - Qt::Key_A + 1));
    }
    switch (key) {
    case Qt::Key_At:
    case Qt::Key_Space:
        return QByteArray(1, '\0');
    case Qt::Key_BracketLeft:
        return QByteArray(1, EscapeByte);
    case Qt::Key_Backslash:
        return QByteArray(1, '\x1c');
    case Qt::Key_BracketRight:
        return QByteArray(1, '\x1d');
    case Qt::Key_AsciiCircum:
        return QByteArray(1, '\x1e');
    case Qt::Key_Underscore:
        return QByteArray(1, '\x1f');
    default:
        return QByteArray();
    }
}
}

InputModeMachine::InputModeMachine(QObject *parent)
    : QObject(parent)
{
    _escapeTimer.setSingleShot(true);
    _escapeTimer.setInterval(DefaultEscapeTimeoutMs);
    connect(&_escapeTimer, &QTimer::timeout, this, &InputModeMachine::onEscapeTimeout);
}

void InputModeMachine::setExitMethod(TerminalExitMethod method)
{
    if (method != TerminalExitMethod::DoubleEscape) {
        flushPendingEscape();
    }
    _exitMethod = method;
}

void InputModeMachine::setEscapeTimeout(int msec)
{
    _escapeTimer.setInterval(qMax(1, msec));
}

int InputModeMachine::escapeTimeout() const
{
    return _escapeTimer.interval();
}

int InputModeMachine::indexOf(SessionId sessionId) const
{
    return sessionId == NoSession ? -1 : _sessions.indexOf(sessionId);
}

void InputModeMachine::applyState(const FocusState &state)
{
    if (state == _state) {
        return;
    }
    _state = state;
    qCDebug(SynkInput) << "focus:" << (_state.mode == InputMode::Terminal ? "terminal" : "navigation") << "selected" << _state.selectedSessionId
                       << "active" << _state.activeSessionId;
    Q_EMIT focusChanged();
}

void InputModeMachine::setSessions(const QList<SessionId> &sessions)
{
    const QList<SessionId> previous = _sessions;
    _sessions = sessions;

    if (_sessions.isEmpty()) {
        dropPendingEscape();
        applyState(FocusState());
        return;
    }

    FocusState next = _state;
    if (indexOf(next.selectedSessionId) < 0) {
        // Prefer whichever session took over the removed one's cell
        const int previousIndex = previous.indexOf(next.selectedSessionId);
        if (next.selectedSessionId != NoSession && previousIndex >= 0 && previousIndex < _sessions.size()) {
            next.selectedSessionId = _sessions.at(previousIndex);
        } else {
            next.selectedSessionId = _sessions.first();
        }
    }

    if (next.mode == InputMode::Terminal && indexOf(next.activeSessionId) < 0) {
        qCInfo(SynkInput) << "active session" << next.activeSessionId << "is gone, back to navigation";
        dropPendingEscape();
        next.mode = InputMode::Navigation;
        next.activeSessionId = NoSession;
    }

    applyState(next);
}

bool InputModeMachine::selectDirection(Direction direction)
{
    if (_state.mode != InputMode::Navigation || _sessions.isEmpty()) {
        return false;
    }
    const int current = qMax(0, indexOf(_state.selectedSessionId));
    const int target = GridLayout::moveIndex(current, direction, _sessions.size());
    if (target < 0 || _sessions.at(target) == _state.selectedSessionId) {
        return false;
    }
    FocusState next = _state;
    next.selectedSessionId = _sessions.at(target);
    applyState(next);
    return true;
}

bool InputModeMachine::selectIndex(int index)
{
    if (_state.mode != InputMode::Navigation || index < 0 || index >= _sessions.size()) {
        return false;
    }
    FocusState next = _state;
    next.selectedSessionId = _sessions.at(index);
    applyState(next);
    return true;
}

bool InputModeMachine::selectSession(SessionId sessionId)
{
    if (indexOf(sessionId) < 0) {
        return false;
    }
    FocusState next = _state;
    next.selectedSessionId = sessionId;
    if (next.mode == InputMode::Terminal && next.activeSessionId != sessionId) {
        // Whatever was typed for the old target goes there first
        flushPendingEscape();
        next.activeSessionId = sessionId;
    }
    applyState(next);
    return true;
}

bool InputModeMachine::activate()
{
    if (_state.mode == InputMode::Terminal || _sessions.isEmpty()) {
        return false;
    }
    const SessionId target = indexOf(_state.selectedSessionId) >= 0 ? _state.selectedSessionId : _sessions.first();
    applyState({InputMode::Terminal, target, target});
    return true;
}

bool InputModeMachine::activateSession(SessionId sessionId)
{
    if (indexOf(sessionId) < 0) {
        return false;
    }
    if (_state.mode == InputMode::Terminal) {
        return selectSession(sessionId);
    }
    applyState({InputMode::Terminal, sessionId, sessionId});
    return true;
}

void InputModeMachine::exitToNavigation()
{
    dropPendingEscape();
    if (_state.mode == InputMode::Navigation) {
        return;
    }
    FocusState next = _state;
    next.mode = InputMode::Navigation;
    if (indexOf(next.activeSessionId) >= 0) {
        next.selectedSessionId = next.activeSessionId;
    }
    next.activeSessionId = NoSession;
    applyState(next);
}

bool InputModeMachine::exitToNavigation(SessionId selectSessionId)
{
    if (indexOf(selectSessionId) < 0) {
        return false;
    }
    dropPendingEscape();
    applyState({InputMode::Navigation, selectSessionId, NoSession});
    return true;
}

bool InputModeMachine::handleKeyPress(const QKeyEvent *event)
{
    if (!event) {
        return false;
    }
    if (_state.mode == InputMode::Terminal) {
        return handleTerminalKey(event);
    }
    return handleNavigationKey(event);
}

bool InputModeMachine::handleNavigationKey(const QKeyEvent *event)
{
    if (event->modifiers() & (Qt::ControlModifier | Qt::AltModifier | Qt::MetaModifier)) {
        return false;
    }

    switch (event->key()) {
    case Qt::Key_Left:
    case Qt::Key_H:
        selectDirection(Direction::Left);
        return true;
    case Qt::Key_Right:
    case Qt::Key_L:
        selectDirection(Direction::Right);
        return true;
    case Qt::Key_Up:
    case Qt::Key_K:
        selectDirection(Direction::Up);
        return true;
    case Qt::Key_Down:
    case Qt::Key_J:
        selectDirection(Direction::Down);
        return true;
    case Qt::Key_Return:
    case Qt::Key_Enter:
        activate();
        return true;
    default:
        break;
    }

    const int index = keyToSessionIndex(event->key());
    if (index >= 0) {
        selectIndex(index);
        return true;
    }
    return false;
}

bool InputModeMachine::isExitGesture(const QKeyEvent *event) const
{
    const Qt::KeyboardModifiers modifiers = relevantModifiers(event);
    switch (_exitMethod) {
    case TerminalExitMethod::DoubleEscape:
        return event->key() == Qt::Key_Escape && modifiers == Qt::NoModifier;
    case TerminalExitMethod::CtrlBackslash:
        return event->key() == Qt::Key_Backslash && (modifiers & Qt::ControlModifier);
    case TerminalExitMethod::CtrlShiftEscape:
        return event->key() == Qt::Key_Escape && modifiers == (Qt::ControlModifier | Qt::ShiftModifier);
    }
    return false;
}

bool InputModeMachine::handleTerminalKey(const QKeyEvent *event)
{
    if (_state.activeSessionId == NoSession || isModifierKey(event->key())) {
        return false;
    }

    if (isExitGesture(event)) {
        if (_exitMethod != TerminalExitMethod::DoubleEscape) {
            exitToNavigation();
        } else if (_escapePending) {
            // exitToNavigation() drops the held Escape
            exitToNavigation();
        } else {
            _escapePending = true;
            _escapeTimer.start();
        }
        return true;
    }

    const QByteArray bytes = encodeKey(event);
    flushPendingEscape();
    if (bytes.isEmpty()) {
        return false;
    }
    Q_EMIT writeRequested(_state.activeSessionId, bytes);
    return true;
}

void InputModeMachine::flushPendingEscape()
{
    if (!_escapePending) {
        return;
    }
    _escapePending = false;
    _escapeTimer.stop();
    if (_state.mode == InputMode::Terminal && _state.activeSessionId != NoSession) {
        Q_EMIT writeRequested(_state.activeSessionId, QByteArray(1, EscapeByte));
    }
}

void InputModeMachine::dropPendingEscape()
{
    _escapePending = false;
    _escapeTimer.stop();
}

void InputModeMachine::onEscapeTimeout()
{
    flushPendingEscape();
}

QByteArray InputModeMachine::encodeKey(const QKeyEvent *event)
{
    const int key = event->key();
    const Qt::KeyboardModifiers modifiers = relevantModifiers(event);

    QByteArray bytes = specialKeySequence(key, modifiers);
    if (bytes.isEmpty() && (modifiers & Qt::ControlModifier)) {
        bytes = controlKeySequence(key);
    }
    if (bytes.isEmpty()) {
        bytes = event->text().toUtf8();
    }
    if (!bytes.isEmpty() && (modifiers & Qt::AltModifier)) {
        bytes.prepend(EscapeByte);
    }
    return bytes;
}

int InputModeMachine::keyToSessionIndex(int key)
{
    if (key >= Qt::Key_1 && key <= Qt::Key_9) {
        return key - Qt::Key_1;
    }
    if (key == Qt::Key_0) {
        return 9;
    }
    return -1;
}

} // namespace Synk

#include "moc_InputModeMachine.cpp"
