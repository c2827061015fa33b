/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ScrollbackReconciler.h"

#include "OutputRouter.h"
#include "backend/SessionBackend.h"
#include "terminal/TerminalBufferAdapter.h"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(SynkScrollback, "synk.workspace.scrollback", QtInfoMsg)

namespace Synk
{

ScrollbackReconciler::ScrollbackReconciler(SessionBackend *backend, OutputRouter *router, QObject *parent)
    : QObject(parent)
    , _backend(backend)
    , _router(router)
{
}

void ScrollbackReconciler::setPolicy(ScrollbackPolicy policy)
{
    _policy = policy;
}

void ScrollbackReconciler::attach(SessionId sessionId, TerminalBufferAdapter *adapter)
{
    if (_pending.contains(sessionId)) {
        cancel(sessionId);
    }

    const quint64 token = ++_nextToken;
    PendingAttach pending;
    pending.adapter = adapter;
    pending.token = token;
    _pending.insert(sessionId, pending);

    if (_policy == ScrollbackPolicy::QueueDuringFetch) {
        _router->registerHandler(sessionId, [this, sessionId, token](const QByteArray &data) {
            auto it = _pending.find(sessionId);
            if (it != _pending.end() && it->token == token) {
                it->queuedOutput.append(data);
            }
        });
    }

    QPointer<ScrollbackReconciler> guard(this);
    _backend->fetchScrollback(sessionId, [guard, sessionId, token](bool success, const QByteArray &data, const QString &error) {
        if (guard) {
            guard->handleScrollback(sessionId, token, success, data, error);
        }
    });
}

void ScrollbackReconciler::cancel(SessionId sessionId)
{
    if (!_pending.remove(sessionId)) {
        return;
    }
    qCDebug(SynkScrollback) << "attach cancelled for session" << sessionId;
    if (_policy == ScrollbackPolicy::QueueDuringFetch) {
        _router->unregisterHandler(sessionId);
    }
}

bool ScrollbackReconciler::isPendingAttach(SessionId sessionId) const
{
    return _pending.contains(sessionId);
}

void ScrollbackReconciler::handleScrollback(SessionId sessionId, quint64 token, bool success, const QByteArray &data, const QString &error)
{
    auto it = _pending.find(sessionId);
    if (it == _pending.end() || it->token != token) {
        // Cancelled, or superseded by a newer attach for the same session
        return;
    }
    const PendingAttach pending = it.value();
    _pending.erase(it);

    QPointer<TerminalBufferAdapter> adapter = pending.adapter;
    if (!adapter || adapter->isDisposed()) {
        qCDebug(SynkScrollback) << "pane for session" << sessionId << "went away during the scrollback fetch";
        if (_policy == ScrollbackPolicy::QueueDuringFetch) {
            _router->unregisterHandler(sessionId);
        }
        return;
    }

    if (success) {
        adapter->writeBytes(data);
    } else {
        qCWarning(SynkScrollback) << "scrollback fetch for session" << sessionId << "failed:" << error;
    }

    for (const QByteArray &chunk : pending.queuedOutput) {
        adapter->writeBytes(chunk);
    }

    _router->registerHandler(sessionId, [adapter](const QByteArray &output) {
        if (adapter) {
            adapter->writeBytes(output);
        }
    });

    Q_EMIT attachComplete(sessionId, success);
}

} // namespace Synk

#include "moc_ScrollbackReconciler.cpp"
