/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "widgets/WorkspaceWindow.h"

#include "widgets/PaneWidget.h"
#include "widgets/SessionGridWidget.h"
#include "workspace/WorkspaceController.h"

#include <QAction>
#include <QKeyEvent>
#include <QKeySequence>
#include <QLabel>
#include <QMenu>
#include <QMenuBar>
#include <QStatusBar>

namespace Synk
{

namespace
{
const int NoticeTimeoutMs = 5000;
}

WorkspaceWindow::WorkspaceWindow(SessionBackend *backend, const WorkspaceSettings &settings, QWidget *parent)
    : QMainWindow(parent)
    // Created before the grid so that it is destroyed first and releases
    // the panes it still holds
    , _controller(new WorkspaceController(backend, settings, this))
    , _grid(new SessionGridWidget(this))
    , _modeLabel(new QLabel(this))
{
    setWindowTitle(tr("Synk"));
    setCentralWidget(_grid);
    statusBar()->addPermanentWidget(_modeLabel);

    _controller->setBufferFactory([this](const SessionInfo &session) -> TerminalBuffer * {
        return _grid->createPane(session);
    });

    connect(_controller, &WorkspaceController::sessionsChanged, this, &WorkspaceWindow::onSessionsChanged);
    connect(_controller, &WorkspaceController::focusChanged, this, &WorkspaceWindow::onFocusChanged);
    connect(_controller, &WorkspaceController::noticeRaised, this, [this](const QString &message) {
        statusBar()->showMessage(message, NoticeTimeoutMs);
    });

    connect(_grid, &SessionGridWidget::paneClicked, _controller, &WorkspaceController::selectSession);
    connect(_grid, &SessionGridWidget::paneDoubleClicked, _controller, &WorkspaceController::activateSession);
    connect(_grid, &SessionGridWidget::paneHeaderClicked, _controller, qOverload<SessionId>(&WorkspaceController::exitToNavigation));
    connect(_grid, &SessionGridWidget::paneCloseRequested, _controller, &WorkspaceController::destroySession);
    connect(_grid, &SessionGridWidget::paneGeometryChanged, _controller, &WorkspaceController::notifyPaneGeometryChanged);

    _grid->installEventFilter(this);
    _grid->setFocus();

    setupActions();
    onFocusChanged();
    resize(1200, 800);
}

void WorkspaceWindow::setupActions()
{
    QMenu *sessionMenu = menuBar()->addMenu(tr("&Session"));

    auto *newDefault = sessionMenu->addAction(tr("&New Session"));
    newDefault->setShortcut(QKeySequence(Qt::CTRL | Qt::SHIFT | Qt::Key_T));
    connect(newDefault, &QAction::triggered, this, [this]() {
        newSession(_controller->settings().defaultAgent);
    });

    QMenu *agentMenu = sessionMenu->addMenu(tr("New &Agent Session"));
    const auto agentTypes = allAgentTypes();
    for (AgentType agentType : agentTypes) {
        auto *action = agentMenu->addAction(agentTypeLabel(agentType));
        connect(action, &QAction::triggered, this, [this, agentType]() {
            newSession(agentType);
        });
    }

    sessionMenu->addSeparator();
    auto *closeAction = sessionMenu->addAction(tr("&Close Selected Session"));
    closeAction->setShortcut(QKeySequence(Qt::CTRL | Qt::SHIFT | Qt::Key_W));
    connect(closeAction, &QAction::triggered, this, &WorkspaceWindow::closeSelectedSession);

    auto *refreshAction = sessionMenu->addAction(tr("&Refresh"));
    connect(refreshAction, &QAction::triggered, _controller, &WorkspaceController::refreshSessions);

    sessionMenu->addSeparator();
    auto *quitAction = sessionMenu->addAction(tr("&Quit"));
    quitAction->setShortcut(QKeySequence::Quit);
    connect(quitAction, &QAction::triggered, this, &QWidget::close);
}

void WorkspaceWindow::newSession(AgentType agentType)
{
    _controller->createSession(agentType, _controller->settings().defaultWorkingDir);
}

void WorkspaceWindow::closeSelectedSession()
{
    const SessionId sessionId = _controller->selectedSessionId();
    if (sessionId != NoSession) {
        _controller->destroySession(sessionId);
    }
}

void WorkspaceWindow::onSessionsChanged()
{
    _grid->relayout(_controller->sessions(), _controller->gridGeometry());
    _grid->updateFocus(_controller->focusState());
}

void WorkspaceWindow::onFocusChanged()
{
    const FocusState &state = _controller->focusState();
    _grid->updateFocus(state);

    if (state.mode == InputMode::Terminal) {
        const int index = _controller->indexOfSession(state.activeSessionId);
        _modeLabel->setText(tr("TERMINAL: pane %1").arg(index + 1));
    } else {
        _modeLabel->setText(tr("NAVIGATION"));
    }
}

bool WorkspaceWindow::eventFilter(QObject *watched, QEvent *event)
{
    if (watched == _grid && event->type() == QEvent::ShortcutOverride && _controller->currentMode() == InputMode::Terminal) {
        // The active session gets every key, window shortcuts included
        event->accept();
        return true;
    }
    if (watched == _grid && event->type() == QEvent::KeyPress) {
        if (_controller->handleKeyPress(static_cast<QKeyEvent *>(event))) {
            return true;
        }
    }
    return QMainWindow::eventFilter(watched, event);
}

} // namespace Synk

#include "moc_WorkspaceWindow.cpp"
