/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TerminalBufferAdapter.h"

#include "TerminalBuffer.h"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(SynkTerminal, "synk.terminal", QtInfoMsg)

namespace Synk
{

TerminalBufferAdapter::TerminalBufferAdapter(SessionId sessionId, TerminalBuffer *buffer, int resizeDebounceMs, QObject *parent)
    : QObject(parent)
    , _sessionId(sessionId)
    , _buffer(buffer)
{
    _resizeTimer.setSingleShot(true);
    _resizeTimer.setInterval(qMax(0, resizeDebounceMs));
    connect(&_resizeTimer, &QTimer::timeout, this, &TerminalBufferAdapter::emitSettledSize);
}

TerminalBufferAdapter::~TerminalBufferAdapter()
{
    dispose();
}

void TerminalBufferAdapter::writeBytes(const QByteArray &data)
{
    if (_disposed) {
        return;
    }
    write(_decoder.decode(data));
}

void TerminalBufferAdapter::write(const QString &text)
{
    if (_disposed || !_buffer || text.isEmpty()) {
        return;
    }
    _buffer->write(text);
}

QSize TerminalBufferAdapter::resizeHint() const
{
    if (_disposed || !_buffer) {
        return QSize();
    }
    return QSize(_buffer->columns(), _buffer->rows());
}

void TerminalBufferAdapter::notifyGeometryChanged()
{
    if (_disposed) {
        return;
    }
    _resizeTimer.start();
}

void TerminalBufferAdapter::emitSettledSize()
{
    const QSize size = resizeHint();
    if (size.width() <= 0 || size.height() <= 0 || size == _lastSettledSize) {
        return;
    }
    _lastSettledSize = size;
    qCDebug(SynkTerminal) << "session" << _sessionId << "settled at" << size.width() << "x" << size.height();
    Q_EMIT resizeSettled(_sessionId, size.width(), size.height());
}

void TerminalBufferAdapter::dispose()
{
    if (_disposed) {
        return;
    }
    _disposed = true;
    _resizeTimer.stop();
    _decoder.reset();
    if (_buffer) {
        TerminalBuffer *buffer = _buffer;
        _buffer = nullptr;
        buffer->release();
    }
    qCDebug(SynkTerminal) << "session" << _sessionId << "adapter disposed";
}

} // namespace Synk

#include "moc_TerminalBufferAdapter.cpp"
