/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SCROLLBACKRECONCILER_H
#define SCROLLBACKRECONCILER_H

#include <QByteArray>
#include <QHash>
#include <QList>
#include <QObject>
#include <QPointer>

#include "backend/SessionInfo.h"
#include "synkprivate_export.h"

namespace Synk
{

class OutputRouter;
class SessionBackend;
class TerminalBufferAdapter;

enum class ScrollbackPolicy {
    // Live output is queued while the fetch is in flight and flushed after it
    QueueDuringFetch,
    // The live handler is installed only after the fetch; output emitted in
    // between is lost
    RegisterAfterFetch,
};

/**
 * Brings a freshly constructed pane up to date with its session.
 *
 * attach() fetches the session's buffered output, writes it to the pane's
 * adapter and then hands the session over to a live handler on the router.
 * If the adapter is disposed or the attach is cancelled before the fetch
 * completes, the result is discarded and no handler is installed.
 */
class SYNKPRIVATE_EXPORT ScrollbackReconciler : public QObject
{
    Q_OBJECT
public:
    ScrollbackReconciler(SessionBackend *backend, OutputRouter *router, QObject *parent = nullptr);

    void setPolicy(ScrollbackPolicy policy);
    ScrollbackPolicy policy() const
    {
        return _policy;
    }

    void attach(SessionId sessionId, TerminalBufferAdapter *adapter);
    void cancel(SessionId sessionId);
    bool isPendingAttach(SessionId sessionId) const;

Q_SIGNALS:
    void attachComplete(Synk::SessionId sessionId, bool restored);

private:
    void handleScrollback(SessionId sessionId, quint64 token, bool success, const QByteArray &data, const QString &error);

    struct PendingAttach {
        QPointer<TerminalBufferAdapter> adapter;
        QList<QByteArray> queuedOutput;
        quint64 token = 0;
    };

    SessionBackend *_backend;
    OutputRouter *_router;
    ScrollbackPolicy _policy = ScrollbackPolicy::QueueDuringFetch;
    QHash<SessionId, PendingAttach> _pending;
    quint64 _nextToken = 0;
};

} // namespace Synk

#endif // SCROLLBACKRECONCILER_H
