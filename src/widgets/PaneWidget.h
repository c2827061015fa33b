/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PANEWIDGET_H
#define PANEWIDGET_H

#include <QFrame>

#include "backend/SessionInfo.h"
#include "synkprivate_export.h"
#include "terminal/TerminalBuffer.h"

class QLabel;
class QPlainTextEdit;
class QToolButton;

namespace Synk
{

/**
 * One grid cell: a header with the agent badge, the session title and a
 * close button above a read-only text view that receives the session's
 * output.
 *
 * The pane never takes keyboard focus; keys are routed by the workspace.
 */
class SYNKPRIVATE_EXPORT PaneWidget : public QFrame, public TerminalBuffer
{
    Q_OBJECT
public:
    explicit PaneWidget(const SessionInfo &session, QWidget *parent = nullptr);

    SessionId sessionId() const
    {
        return _session.sessionId;
    }

    void setSessionInfo(const SessionInfo &session);
    void setSelected(bool selected);
    void setActive(bool active);

    bool isSelected() const
    {
        return _selected;
    }
    bool isActive() const
    {
        return _active;
    }

    QString contents() const;

    // TerminalBuffer
    void write(const QString &text) override;
    int columns() const override;
    int rows() const override;
    void release() override;

Q_SIGNALS:
    void clicked(Synk::SessionId sessionId);
    void doubleClicked(Synk::SessionId sessionId);
    void headerClicked(Synk::SessionId sessionId);
    void closeRequested(Synk::SessionId sessionId);
    void geometryChanged(Synk::SessionId sessionId);

protected:
    bool eventFilter(QObject *watched, QEvent *event) override;
    void resizeEvent(QResizeEvent *event) override;

private:
    void updateHeader();
    void updateFrame();

    SessionInfo _session;
    QWidget *_header;
    QLabel *_badge;
    QLabel *_title;
    QToolButton *_closeButton;
    QPlainTextEdit *_view;
    bool _selected = false;
    bool _active = false;
    bool _released = false;
};

} // namespace Synk

#endif // PANEWIDGET_H
