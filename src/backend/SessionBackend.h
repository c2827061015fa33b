/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONBACKEND_H
#define SESSIONBACKEND_H

#include <QByteArray>
#include <QList>
#include <QObject>
#include <QString>

#include <functional>

#include "SessionInfo.h"
#include "synkprivate_export.h"

namespace Synk
{

/**
 * Client-side view of the process/session backend.
 *
 * Every request is asynchronous: the callback runs later from the event
 * loop, and any number of output events (for the same or other sessions)
 * may be delivered before it does. Callbacks always run exactly once,
 * with success == false when the backend could not be reached.
 *
 * The push stream is exposed as signals. Output for one session is emitted
 * in the order the backend produced it.
 */
class SYNKPRIVATE_EXPORT SessionBackend : public QObject
{
    Q_OBJECT
public:
    using CreateCallback = std::function<void(bool success, const SessionInfo &session, const QString &error)>;
    using AckCallback = std::function<void(bool success, const QString &error)>;
    using ScrollbackCallback = std::function<void(bool success, const QByteArray &data, const QString &error)>;
    using ListCallback = std::function<void(bool success, const QList<SessionInfo> &sessions, const QString &error)>;

    explicit SessionBackend(QObject *parent = nullptr);
    ~SessionBackend() override;

    virtual void create(AgentType agentType, const QString &workingDir, CreateCallback callback) = 0;
    virtual void destroy(SessionId sessionId, AckCallback callback) = 0;
    // Fire-and-forget
    virtual void write(SessionId sessionId, const QByteArray &data) = 0;
    virtual void resize(SessionId sessionId, int columns, int rows) = 0;
    virtual void fetchScrollback(SessionId sessionId, ScrollbackCallback callback) = 0;
    virtual void list(ListCallback callback) = 0;

Q_SIGNALS:
    void outputReceived(Synk::SessionId sessionId, const QByteArray &data);
    void sessionExited(Synk::SessionId sessionId, int exitCode);
    void sessionsChanged();
    void disconnected(const QString &reason);
};

} // namespace Synk

#endif // SESSIONBACKEND_H
