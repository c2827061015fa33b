/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONGRIDWIDGET_H
#define SESSIONGRIDWIDGET_H

#include <QHash>
#include <QList>
#include <QPointer>
#include <QWidget>

#include "backend/SessionInfo.h"
#include "synkprivate_export.h"
#include "workspace/GridLayout.h"
#include "workspace/InputModeMachine.h"

class QGridLayout;
class QLabel;

namespace Synk
{

class PaneWidget;

/**
 * Lays the session panes out row by row in the grid computed for the
 * current session count. Shows a placeholder while there are no sessions.
 */
class SYNKPRIVATE_EXPORT SessionGridWidget : public QWidget
{
    Q_OBJECT
public:
    explicit SessionGridWidget(QWidget *parent = nullptr);

    PaneWidget *createPane(const SessionInfo &session);
    PaneWidget *paneForSession(SessionId sessionId) const;
    int paneCount() const;

    void relayout(const QList<SessionInfo> &sessions, const GridGeometry &geometry);
    void updateFocus(const FocusState &state);

Q_SIGNALS:
    void paneClicked(Synk::SessionId sessionId);
    void paneDoubleClicked(Synk::SessionId sessionId);
    void paneHeaderClicked(Synk::SessionId sessionId);
    void paneCloseRequested(Synk::SessionId sessionId);
    void paneGeometryChanged(Synk::SessionId sessionId);

private:
    QGridLayout *_layout;
    QLabel *_placeholder;
    QHash<SessionId, QPointer<PaneWidget>> _panes;
};

} // namespace Synk

#endif // SESSIONGRIDWIDGET_H
