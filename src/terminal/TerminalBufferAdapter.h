/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TERMINALBUFFERADAPTER_H
#define TERMINALBUFFERADAPTER_H

#include <QObject>
#include <QSize>
#include <QTimer>

#include "StreamDecoder.h"
#include "backend/SessionInfo.h"
#include "synkprivate_export.h"

namespace Synk
{

class TerminalBuffer;

/**
 * Per-session glue between raw backend output and a TerminalBuffer.
 *
 * Output bytes go through the session's own StreamDecoder. Geometry changes
 * are debounced: resizeSettled() fires once the buffer has kept the same size
 * for the debounce interval, and only when that size differs from the last
 * one reported.
 */
class SYNKPRIVATE_EXPORT TerminalBufferAdapter : public QObject
{
    Q_OBJECT
public:
    // buffer is not owned and may be null (headless sessions)
    TerminalBufferAdapter(SessionId sessionId, TerminalBuffer *buffer, int resizeDebounceMs, QObject *parent = nullptr);
    ~TerminalBufferAdapter() override;

    SessionId sessionId() const
    {
        return _sessionId;
    }

    void writeBytes(const QByteArray &data);
    void write(const QString &text);

    /** Current geometry of the buffer in columns x rows, invalid if unknown. */
    QSize resizeHint() const;

    void notifyGeometryChanged();

    void dispose();
    bool isDisposed() const
    {
        return _disposed;
    }

Q_SIGNALS:
    void resizeSettled(Synk::SessionId sessionId, int columns, int rows);

private:
    void emitSettledSize();

    SessionId _sessionId;
    TerminalBuffer *_buffer;
    StreamDecoder _decoder;
    QTimer _resizeTimer;
    QSize _lastSettledSize;
    bool _disposed = false;
};

} // namespace Synk

#endif // TERMINALBUFFERADAPTER_H
