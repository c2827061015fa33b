/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "widgets/SessionGridWidget.h"

#include "widgets/PaneWidget.h"

#include <QGridLayout>
#include <QLabel>

namespace Synk
{

SessionGridWidget::SessionGridWidget(QWidget *parent)
    : QWidget(parent)
    , _layout(new QGridLayout(this))
    , _placeholder(new QLabel(this))
{
    setFocusPolicy(Qt::StrongFocus);
    _layout->setContentsMargins(4, 4, 4, 4);
    _layout->setSpacing(4);

    _placeholder->setAlignment(Qt::AlignCenter);
    _placeholder->setText(tr("No sessions. Use Session > New Session to start one."));
    _layout->addWidget(_placeholder, 0, 0);
}

PaneWidget *SessionGridWidget::createPane(const SessionInfo &session)
{
    auto *pane = new PaneWidget(session, this);
    pane->hide();
    _panes.insert(session.sessionId, pane);

    const SessionId sessionId = session.sessionId;
    connect(pane, &QObject::destroyed, this, [this, sessionId]() {
        _panes.remove(sessionId);
    });
    connect(pane, &PaneWidget::clicked, this, &SessionGridWidget::paneClicked);
    connect(pane, &PaneWidget::doubleClicked, this, &SessionGridWidget::paneDoubleClicked);
    connect(pane, &PaneWidget::headerClicked, this, &SessionGridWidget::paneHeaderClicked);
    connect(pane, &PaneWidget::closeRequested, this, &SessionGridWidget::paneCloseRequested);
    connect(pane, &PaneWidget::geometryChanged, this, &SessionGridWidget::paneGeometryChanged);
    return pane;
}

PaneWidget *SessionGridWidget::paneForSession(SessionId sessionId) const
{
    return _panes.value(sessionId).data();
}

int SessionGridWidget::paneCount() const
{
    int count = 0;
    for (const QPointer<PaneWidget> &pane : _panes) {
        if (pane) {
            ++count;
        }
    }
    return count;
}

void SessionGridWidget::relayout(const QList<SessionInfo> &sessions, const GridGeometry &geometry)
{
    while (QLayoutItem *item = _layout->takeAt(0)) {
        delete item;
    }
    for (int i = 0; i < _layout->columnCount(); ++i) {
        _layout->setColumnStretch(i, 0);
    }
    for (int i = 0; i < _layout->rowCount(); ++i) {
        _layout->setRowStretch(i, 0);
    }

    if (sessions.isEmpty()) {
        _layout->addWidget(_placeholder, 0, 0);
        _placeholder->show();
        return;
    }
    _placeholder->hide();

    for (int column = 0; column < geometry.columns; ++column) {
        _layout->setColumnStretch(column, 1);
    }
    for (int row = 0; row < geometry.rows; ++row) {
        _layout->setRowStretch(row, 1);
    }

    for (int i = 0; i < sessions.size(); ++i) {
        PaneWidget *pane = paneForSession(sessions[i].sessionId);
        if (!pane) {
            continue;
        }
        pane->setSessionInfo(sessions[i]);
        _layout->addWidget(pane, i / geometry.columns, i % geometry.columns);
        pane->show();
    }
}

void SessionGridWidget::updateFocus(const FocusState &state)
{
    for (auto it = _panes.constBegin(); it != _panes.constEnd(); ++it) {
        if (PaneWidget *pane = it.value().data()) {
            pane->setSelected(it.key() == state.selectedSessionId);
            pane->setActive(state.mode == InputMode::Terminal && it.key() == state.activeSessionId);
        }
    }
}

} // namespace Synk

#include "moc_SessionGridWidget.cpp"
