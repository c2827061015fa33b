/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef WORKSPACEWINDOW_H
#define WORKSPACEWINDOW_H

#include <QMainWindow>

#include "synkprivate_export.h"
#include "workspace/WorkspaceSettings.h"

class QLabel;

namespace Synk
{

class SessionBackend;
class SessionGridWidget;
class WorkspaceController;

class SYNKPRIVATE_EXPORT WorkspaceWindow : public QMainWindow
{
    Q_OBJECT
public:
    WorkspaceWindow(SessionBackend *backend, const WorkspaceSettings &settings, QWidget *parent = nullptr);

    WorkspaceController *controller() const
    {
        return _controller;
    }
    SessionGridWidget *grid() const
    {
        return _grid;
    }

protected:
    bool eventFilter(QObject *watched, QEvent *event) override;

private:
    void setupActions();
    void onSessionsChanged();
    void onFocusChanged();
    void newSession(AgentType agentType);
    void closeSelectedSession();

    WorkspaceController *_controller; // owned (Qt parent = this)
    SessionGridWidget *_grid;
    QLabel *_modeLabel;
};

} // namespace Synk

#endif // WORKSPACEWINDOW_H
