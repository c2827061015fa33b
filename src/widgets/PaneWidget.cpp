/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "widgets/PaneWidget.h"

#include <QFontDatabase>
#include <QFontMetrics>
#include <QHBoxLayout>
#include <QLabel>
#include <QMouseEvent>
#include <QPlainTextEdit>
#include <QRegularExpression>
#include <QScrollBar>
#include <QTextCursor>
#include <QToolButton>
#include <QVBoxLayout>

namespace Synk
{

namespace
{
const int MaximumScrollbackLines = 10000;

// The view shows plain text only: complete CSI and OSC sequences are dropped
// and carriage returns are folded into the following newline.
QString toPlainText(const QString &text)
{
    static const QRegularExpression escapeSequences(QStringLiteral("\\x1b\\[[0-?]*[ -/]*[@-~]|\\x1b\\][^\\x07\\x1b]*(?:\\x07|\\x1b\\\\)|\\x1b[()][0-9A-Za-z]|\\x1b[=>78M]"));
    QString result = text;
    result.remove(escapeSequences);
    result.replace(QStringLiteral("\r\n"), QStringLiteral("\n"));
    result.remove(QLatin1Char('\r'));
    result.remove(QLatin1Char('\a'));
    return result;
}
}

PaneWidget::PaneWidget(const SessionInfo &session, QWidget *parent)
    : QFrame(parent)
    , _session(session)
    , _header(new QWidget(this))
    , _badge(new QLabel(_header))
    , _title(new QLabel(_header))
    , _closeButton(new QToolButton(_header))
    , _view(new QPlainTextEdit(this))
{
    setFrameShape(QFrame::Box);
    setLineWidth(2);
    setFocusPolicy(Qt::NoFocus);

    auto *headerLayout = new QHBoxLayout(_header);
    headerLayout->setContentsMargins(4, 2, 2, 2);
    headerLayout->addWidget(_badge);
    headerLayout->addWidget(_title, 1);
    headerLayout->addWidget(_closeButton);

    _badge->setObjectName(QStringLiteral("badge"));
    _title->setTextInteractionFlags(Qt::NoTextInteraction);
    _closeButton->setText(QStringLiteral("×"));
    _closeButton->setToolTip(tr("Close session"));
    _closeButton->setAutoRaise(true);
    _closeButton->setFocusPolicy(Qt::NoFocus);
    connect(_closeButton, &QToolButton::clicked, this, [this]() {
        Q_EMIT closeRequested(_session.sessionId);
    });

    _view->setReadOnly(true);
    _view->setFocusPolicy(Qt::NoFocus);
    _view->setLineWrapMode(QPlainTextEdit::WidgetWidth);
    _view->setMaximumBlockCount(MaximumScrollbackLines);
    _view->setFont(QFontDatabase::systemFont(QFontDatabase::FixedFont));
    _view->setFrameShape(QFrame::NoFrame);

    auto *layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(0);
    layout->addWidget(_header);
    layout->addWidget(_view, 1);

    _header->installEventFilter(this);
    _title->installEventFilter(this);
    _badge->installEventFilter(this);
    _view->viewport()->installEventFilter(this);

    updateHeader();
    updateFrame();
}

void PaneWidget::setSessionInfo(const SessionInfo &session)
{
    _session = session;
    updateHeader();
}

void PaneWidget::setSelected(bool selected)
{
    if (_selected == selected) {
        return;
    }
    _selected = selected;
    updateFrame();
}

void PaneWidget::setActive(bool active)
{
    if (_active == active) {
        return;
    }
    _active = active;
    updateFrame();
}

QString PaneWidget::contents() const
{
    return _view->toPlainText();
}

void PaneWidget::updateHeader()
{
    _badge->setText(agentTypeLabel(_session.agentType));

    QString title;
    if (!_session.branch.isEmpty()) {
        title = _session.branch;
    } else if (!_session.workingDir.isEmpty()) {
        title = _session.workingDir;
    } else {
        title = tr("Session %1").arg(_session.sessionId);
    }
    _title->setText(QStringLiteral("%1  %2").arg(_session.paneIndex + 1).arg(title));
    _title->setToolTip(_session.workingDir);
}

void PaneWidget::updateFrame()
{
    QPalette pal = palette();
    QColor color = pal.color(QPalette::Mid);
    if (_active) {
        color = pal.color(QPalette::Highlight);
    } else if (_selected) {
        color = pal.color(QPalette::Highlight).lighter(150);
    }
    pal.setColor(QPalette::WindowText, color);
    setPalette(pal);
    setLineWidth(_active ? 3 : 2);
}

void PaneWidget::write(const QString &text)
{
    if (_released) {
        return;
    }
    const QString plain = toPlainText(text);
    if (plain.isEmpty()) {
        return;
    }

    QScrollBar *scrollBar = _view->verticalScrollBar();
    const bool atBottom = scrollBar->value() == scrollBar->maximum();

    QTextCursor cursor(_view->document());
    cursor.movePosition(QTextCursor::End);
    cursor.insertText(plain);

    if (atBottom) {
        scrollBar->setValue(scrollBar->maximum());
    }
}

int PaneWidget::columns() const
{
    const QFontMetrics metrics(_view->font());
    const int cellWidth = qMax(1, metrics.horizontalAdvance(QLatin1Char('M')));
    return qMax(1, _view->viewport()->width() / cellWidth);
}

int PaneWidget::rows() const
{
    const QFontMetrics metrics(_view->font());
    const int cellHeight = qMax(1, metrics.lineSpacing());
    return qMax(1, _view->viewport()->height() / cellHeight);
}

void PaneWidget::release()
{
    if (_released) {
        return;
    }
    _released = true;
    _view->document()->clear();
    hide();
    deleteLater();
}

bool PaneWidget::eventFilter(QObject *watched, QEvent *event)
{
    if (event->type() == QEvent::MouseButtonPress || event->type() == QEvent::MouseButtonDblClick) {
        auto *mouseEvent = static_cast<QMouseEvent *>(event);
        if (mouseEvent->button() != Qt::LeftButton) {
            return QFrame::eventFilter(watched, event);
        }

        const bool onHeader = watched == _header || watched == _title || watched == _badge;
        if (onHeader) {
            Q_EMIT headerClicked(_session.sessionId);
            return true;
        }
        if (event->type() == QEvent::MouseButtonDblClick) {
            Q_EMIT doubleClicked(_session.sessionId);
        } else {
            Q_EMIT clicked(_session.sessionId);
        }
        // Let the view start a text selection as usual
        return false;
    }
    return QFrame::eventFilter(watched, event);
}

void PaneWidget::resizeEvent(QResizeEvent *event)
{
    QFrame::resizeEvent(event);
    Q_EMIT geometryChanged(_session.sessionId);
}

} // namespace Synk

#include "moc_PaneWidget.cpp"
